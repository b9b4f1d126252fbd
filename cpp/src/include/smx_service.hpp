#pragma once
/**
 * @file smx_service.hpp
 * @brief Layer 2: Service modules built on smx_base.
 *
 * Provides lifecycle management, logging and the cross-process lock itself: tokens,
 * configuration, the process registry, the dangling-segment diagnostic and
 * SharedMemoryMutex. Include this from applications that take named locks.
 */
#include "smx_base.hpp"

#include "utils/lifecycle.hpp"
#include "utils/logger.hpp"
#include "utils/lock_errors.hpp"
#include "utils/lock_token.hpp"
#include "utils/cancellation_signal.hpp"
#include "utils/lock_config.hpp"
#include "utils/process_registry.hpp"
#include "utils/dangling_diagnostic.hpp"
#include "utils/shm_mutex.hpp"
