#pragma once
/**
 * @file dangling_diagnostic.hpp
 * @brief Classifies the segment left behind when an acquisition is interrupted between
 *        the exclusive create and the durable record of success.
 *
 * The diagnostic only looks. It never unlinks, whatever it finds.
 *
 * | Observation                                   | Result                              |
 * |-----------------------------------------------|-------------------------------------|
 * | attach fails, name does not exist             | returns SegmentAbsent               |
 * | stamped with another token                    | returns OwnedByOther                |
 * | all zero on every attempt                     | throws DanglingResourceError        |
 * | stamped with our own token                    | throws InternalConsistencyError     |
 * | attach fails otherwise (e.g. zero length)     | throws UnrecoverableSegmentError    |
 */
#include "shmmutex_utils_export.h"
#include "utils/lock_token.hpp"

#include <chrono>
#include <string>

namespace shmmutex::utils
{

enum class DiagnosticVerdict
{
    SegmentAbsent,
    OwnedByOther
};

struct DiagnosticPolicy
{
    int attempts{3};
    std::chrono::milliseconds retry_delay{50};
};

SHMMUTEX_UTILS_EXPORT const char *to_string(DiagnosticVerdict v) noexcept;

/**
 * @param native_name Platform segment name (see platform::shm_native_name).
 * @param own_token   Token of the handle whose acquisition was interrupted.
 */
SHMMUTEX_UTILS_EXPORT DiagnosticVerdict
diagnose_interrupted_acquire(const std::string &native_name, const LockToken &own_token,
                             const DiagnosticPolicy &policy = {});

} // namespace shmmutex::utils
