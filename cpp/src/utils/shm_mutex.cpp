/*******************************************************************************
 * @file shm_mutex.cpp
 * @brief Acquire/poll/release state machine of SharedMemoryMutex.
 *
 * State transitions (per handle):
 *
 *   Idle --acquire()--> Acquiring --create ok--> Held
 *                                 --conflict/timeout/cancel--> Idle
 *                                 --interrupted before stamp, diagnostic raises--> Faulted
 *                                 --interrupted before stamp, diagnostic benign--> Idle
 *                                 --interrupted after stamp, own segment removed--> Idle
 *   Held --release()--> Releasing --ok or already gone--> Idle
 *                                 --close/unlink error--> Faulted
 ******************************************************************************/
#include "smx_service.hpp"

#include <algorithm>
#include <exception>

namespace shmmutex::utils
{

namespace
{
constexpr std::size_t kSegmentSize = LockToken::kSize;

// Throws `diag` with `interruption` nested inside it.
template <typename E>
[[noreturn]] void throw_nested_in(const E &diag, const std::exception_ptr &interruption)
{
    try
    {
        std::rethrow_exception(interruption);
    }
    catch (...)
    {
        std::throw_with_nested(diag);
    }
}
} // namespace

const char *to_string(LockState s) noexcept
{
    switch (s)
    {
    case LockState::Idle:
        return "Idle";
    case LockState::Acquiring:
        return "Acquiring";
    case LockState::Held:
        return "Held";
    case LockState::Releasing:
        return "Releasing";
    case LockState::Faulted:
        return "Faulted";
    }
    return "Unknown";
}

const char *to_string(InterruptPoint p) noexcept
{
    switch (p)
    {
    case InterruptPoint::AfterCreate:
        return "AfterCreate";
    case InterruptPoint::AfterStamp:
        return "AfterStamp";
    }
    return "Unknown";
}

AcquisitionInterrupted::AcquisitionInterrupted(InterruptPoint point)
    : std::runtime_error(fmt::format("acquisition interrupted at {}", utils::to_string(point))),
      point_(point)
{
}

struct SharedMemoryMutex::Impl
{
    LockConfig config;
    std::string native_name;
    LockToken token;
    std::shared_ptr<CancellationSignal> cancel;
    std::optional<shmmutex::platform::ShmHandle> held;
    LockState state{LockState::Idle};
    InterruptHook hook;
    DiagnosticPolicy diagnostic_policy;

    bool try_create_and_stamp();
    [[noreturn]] void on_interrupted(shmmutex::platform::ShmHandle &h);
    [[noreturn]] void roll_back_stamped(shmmutex::platform::ShmHandle &h);
    void run_hook(InterruptPoint p)
    {
        if (hook)
        {
            hook(p);
        }
    }
};

// true: lock won. false: name exists. Throws on any other failure or interruption.
bool SharedMemoryMutex::Impl::try_create_and_stamp()
{
    using namespace shmmutex::platform;

    std::error_code ec;
    ShmHandle h = shm_create(native_name.c_str(), kSegmentSize, SHM_CREATE_EXCLUSIVE, ec);
    if (!h.valid())
    {
        if (ec == std::errc::file_exists)
        {
            return false;
        }
        throw UnrecoverableSegmentError(
            fmt::format("Cannot create lock segment '{}'", native_name), ec);
    }

    // Window: the segment exists but this handle has not durably recorded it.
    bool stamped = false;
    try
    {
        run_hook(InterruptPoint::AfterCreate);
        if (!shm_write(h, 0, token.data(), LockToken::kSize))
        {
            throw InternalConsistencyError(
                fmt::format("Freshly created segment '{}' rejected the token write", native_name));
        }
        stamped = true;
        run_hook(InterruptPoint::AfterStamp);
        ProcessRegistry::instance().add(config.name);
    }
    catch (...)
    {
        // Both always throw.
        if (stamped)
        {
            roll_back_stamped(h);
        }
        on_interrupted(h);
    }

    held = h;
    return true;
}

void SharedMemoryMutex::Impl::on_interrupted(shmmutex::platform::ShmHandle &h)
{
    const std::exception_ptr interruption = std::current_exception();

    std::error_code close_ec;
    if (!shmmutex::platform::shm_close(&h, close_ec))
    {
        LOGGER_WARN("ShmMutex '{}': closing the local mapping after an interruption failed: {}",
                    config.name, close_ec.message());
    }

    DiagnosticVerdict verdict{};
    try
    {
        verdict = diagnose_interrupted_acquire(native_name, token, diagnostic_policy);
    }
    catch (const DanglingResourceError &e)
    {
        state = LockState::Faulted;
        throw_nested_in(e, interruption);
    }
    catch (const InternalConsistencyError &e)
    {
        state = LockState::Faulted;
        throw_nested_in(e, interruption);
    }
    catch (const UnrecoverableSegmentError &e)
    {
        state = LockState::Faulted;
        throw_nested_in(e, interruption);
    }

    LOGGER_DEBUG("ShmMutex '{}': acquisition interrupted; diagnostic verdict {}.", config.name,
                 utils::to_string(verdict));
    state = LockState::Idle;
    std::rethrow_exception(interruption);
}

// Interrupted after our token was written: the segment is provably ours, so it is removed
// here instead of being classified. Only a segment still carrying our token is unlinked;
// anything else at that name belongs to someone else by now.
void SharedMemoryMutex::Impl::roll_back_stamped(shmmutex::platform::ShmHandle &h)
{
    using namespace shmmutex::platform;
    const std::exception_ptr interruption = std::current_exception();

    std::error_code ec;
    if (!shm_close(&h, ec))
    {
        LOGGER_WARN("ShmMutex '{}': closing the local mapping after an interruption failed: {}",
                    config.name, ec.message());
    }

    ShmHandle recheck = shm_attach(native_name.c_str(), ec);
    if (!recheck.valid())
    {
        if (ec != std::errc::no_such_file_or_directory)
        {
            state = LockState::Faulted;
            throw_nested_in(
                UnrecoverableSegmentError(
                    fmt::format("Cannot inspect interrupted lock segment '{}'", native_name), ec),
                interruption);
        }
        state = LockState::Idle;
        std::rethrow_exception(interruption);
    }

    LockToken::Bytes found{};
    const bool ours =
        shm_read(recheck, 0, found.data(), found.size()) && LockToken(found) == token;
    std::error_code recheck_ec;
    (void)shm_close(&recheck, recheck_ec);

    if (ours)
    {
        std::error_code unlink_ec;
        if (!shm_unlink(native_name.c_str(), unlink_ec) &&
            unlink_ec != std::errc::no_such_file_or_directory)
        {
            state = LockState::Faulted;
            throw_nested_in(ReleaseError(fmt::format("Unlinking interrupted lock segment '{}' "
                                                     "failed",
                                                     native_name),
                                         unlink_ec),
                            interruption);
        }
        LOGGER_DEBUG("ShmMutex '{}': acquisition interrupted after stamping; segment removed.",
                     config.name);
    }

    state = LockState::Idle;
    std::rethrow_exception(interruption);
}

SharedMemoryMutex::SharedMemoryMutex(LockConfig config, std::shared_ptr<CancellationSignal> cancel)
    : pImpl(std::make_unique<Impl>())
{
    config.validate();
    pImpl->native_name = shmmutex::platform::shm_native_name(config.name);
    pImpl->config = std::move(config);
    pImpl->token = LockToken::generate();
    pImpl->cancel = cancel ? std::move(cancel) : std::make_shared<CancellationSignal>();
}

SharedMemoryMutex::~SharedMemoryMutex()
{
    if (!pImpl || !pImpl->held)
    {
        return;
    }
    try
    {
        release();
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("ShmMutex '{}': release in destructor failed: {}", pImpl->config.name,
                     e.what());
    }
}

bool SharedMemoryMutex::acquire()
{
    return acquire(pImpl->config.default_timeout);
}

bool SharedMemoryMutex::acquire(AcquireTimeout timeout)
{
    auto &impl = *pImpl;
    if (impl.state == LockState::Faulted)
    {
        throw FaultedHandleError(
            fmt::format("ShmMutex '{}' is faulted and cannot acquire", impl.config.name));
    }
    if (impl.held)
    {
        throw DeadlockError(fmt::format(
            "ShmMutex '{}' is already held by this handle; handles are not reentrant",
            impl.config.name));
    }

    const uint64_t start_ns = shmmutex::platform::monotonic_time_ns();
    impl.state = LockState::Acquiring;
    auto idle_on_exit = basics::make_scope_guard(
        [&impl]() noexcept
        {
            if (impl.state == LockState::Acquiring)
            {
                impl.state = LockState::Idle;
            }
        });

    const std::chrono::nanoseconds poll = impl.config.poll_interval;
    for (int attempt = 1;; ++attempt)
    {
        if (impl.cancel->is_set())
        {
            LOGGER_DEBUG("ShmMutex '{}': acquire cancelled after {} attempt(s).",
                         impl.config.name, attempt - 1);
            return false;
        }

        if (impl.try_create_and_stamp())
        {
            impl.state = LockState::Held;
            LOGGER_DEBUG("ShmMutex '{}': acquired by {} after {} attempt(s).", impl.config.name,
                         impl.token, attempt);
            return true;
        }

        if (timeout.is_single_attempt())
        {
            return false;
        }

        std::chrono::nanoseconds wait = poll;
        if (timeout.kind() == AcquireTimeout::Kind::Duration)
        {
            const std::chrono::nanoseconds elapsed(
                shmmutex::platform::elapsed_time_ns(start_ns));
            if (elapsed >= timeout.duration())
            {
                LOGGER_DEBUG("ShmMutex '{}': acquire timed out after {} attempt(s).",
                             impl.config.name, attempt);
                return false;
            }
            wait = std::min(poll, timeout.duration() - elapsed);
        }

        if (impl.cancel->wait_for(wait))
        {
            LOGGER_DEBUG("ShmMutex '{}': acquire cancelled while waiting.", impl.config.name);
            return false;
        }
    }
}

bool SharedMemoryMutex::release()
{
    using namespace shmmutex::platform;
    auto &impl = *pImpl;
    if (!impl.held)
    {
        return false;
    }

    impl.state = LockState::Releasing;
    ShmHandle h = *impl.held;
    impl.held.reset();

    std::error_code close_ec;
    const bool closed = shm_close(&h, close_ec);
    std::error_code unlink_ec;
    bool unlinked = shm_unlink(impl.native_name.c_str(), unlink_ec);
    if (!unlinked && unlink_ec == std::errc::no_such_file_or_directory)
    {
        LOGGER_DEBUG("ShmMutex '{}': segment already gone at release.", impl.config.name);
        unlinked = true;
    }

    ProcessRegistry::instance().remove(impl.config.name);

    if (!closed)
    {
        impl.state = LockState::Faulted;
        throw ReleaseError(fmt::format("Closing lock segment '{}' failed", impl.native_name),
                           close_ec);
    }
    if (!unlinked)
    {
        impl.state = LockState::Faulted;
        throw ReleaseError(fmt::format("Unlinking lock segment '{}' failed", impl.native_name),
                           unlink_ec);
    }

    impl.state = LockState::Idle;
    LOGGER_DEBUG("ShmMutex '{}': released by {}.", impl.config.name, impl.token);
    return true;
}

std::optional<LockToken> SharedMemoryMutex::owner_token() const
{
    using namespace shmmutex::platform;
    std::error_code ec;
    ShmHandle h = shm_attach(pImpl->native_name.c_str(), ec);
    if (!h.valid())
    {
        if (ec == std::errc::no_such_file_or_directory)
        {
            return std::nullopt;
        }
        throw UnrecoverableSegmentError(
            fmt::format("Cannot attach lock segment '{}'", pImpl->native_name), ec);
    }

    LockToken::Bytes stored{};
    const bool read_ok = shm_read(h, 0, stored.data(), stored.size());
    std::error_code close_ec;
    if (!shm_close(&h, close_ec))
    {
        LOGGER_WARN("ShmMutex '{}': closing the owner recheck failed: {}", pImpl->config.name,
                    close_ec.message());
    }
    if (!read_ok)
    {
        throw UnrecoverableSegmentError(
            fmt::format("Lock segment '{}' is too small to hold a token", pImpl->native_name),
            std::make_error_code(std::errc::invalid_argument));
    }
    return LockToken(stored);
}

void SharedMemoryMutex::set_interrupt_hook(InterruptHook hook)
{
    pImpl->hook = std::move(hook);
}

void SharedMemoryMutex::set_diagnostic_policy(const DiagnosticPolicy &policy)
{
    pImpl->diagnostic_policy = policy;
}

const std::string &SharedMemoryMutex::name() const noexcept
{
    return pImpl->config.name;
}

const std::string &SharedMemoryMutex::native_name() const noexcept
{
    return pImpl->native_name;
}

std::chrono::milliseconds SharedMemoryMutex::poll_interval() const noexcept
{
    return pImpl->config.poll_interval;
}

bool SharedMemoryMutex::is_held() const noexcept
{
    return pImpl->held.has_value();
}

LockState SharedMemoryMutex::state() const noexcept
{
    return pImpl->state;
}

const LockToken &SharedMemoryMutex::token() const noexcept
{
    return pImpl->token;
}

const std::shared_ptr<CancellationSignal> &SharedMemoryMutex::cancellation_signal() const noexcept
{
    return pImpl->cancel;
}

const LockConfig &SharedMemoryMutex::config() const noexcept
{
    return pImpl->config;
}

std::string SharedMemoryMutex::to_string() const
{
    return fmt::format("ShmMutex(name={}, uuid={}, poll_interval={}ms, state={})",
                       pImpl->config.name, pImpl->token, pImpl->config.poll_interval.count(),
                       utils::to_string(pImpl->state));
}

// ----------------------------------------------------------------------------
// ScopedLock
// ----------------------------------------------------------------------------

ScopedLock::ScopedLock(SharedMemoryMutex &mutex, bool throw_on_timeout)
    : ScopedLock(mutex, mutex.config().default_timeout, throw_on_timeout)
{
}

ScopedLock::ScopedLock(SharedMemoryMutex &mutex, AcquireTimeout timeout, bool throw_on_timeout)
    : mutex_(mutex)
{
    owns_ = mutex_.acquire(timeout);
    if (!owns_ && throw_on_timeout)
    {
        throw TimeoutError(fmt::format("Could not acquire '{}' within {}", mutex_.name(),
                                       timeout.to_string()));
    }
}

ScopedLock::~ScopedLock()
{
    if (!owns_)
    {
        return;
    }
    try
    {
        mutex_.release();
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("ScopedLock '{}': release failed: {}", mutex_.name(), e.what());
    }
}

void ScopedLock::unlock()
{
    if (owns_)
    {
        owns_ = false;
        mutex_.release();
    }
}

} // namespace shmmutex::utils
