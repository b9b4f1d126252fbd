#include "smx_service.hpp"

#include <thread>

namespace shmmutex::utils
{

const char *to_string(DiagnosticVerdict v) noexcept
{
    switch (v)
    {
    case DiagnosticVerdict::SegmentAbsent:
        return "SegmentAbsent";
    case DiagnosticVerdict::OwnedByOther:
        return "OwnedByOther";
    }
    return "Unknown";
}

DiagnosticVerdict diagnose_interrupted_acquire(const std::string &native_name,
                                               const LockToken &own_token,
                                               const DiagnosticPolicy &policy)
{
    using namespace shmmutex::platform;
    const int attempts = policy.attempts > 0 ? policy.attempts : 1;

    for (int attempt = 1; attempt <= attempts; ++attempt)
    {
        std::error_code ec;
        ShmHandle h = shm_attach(native_name.c_str(), ec);
        if (!h.valid())
        {
            if (ec == std::errc::no_such_file_or_directory)
            {
                LOGGER_DEBUG("Diagnostic '{}': segment absent, nothing left behind.",
                             native_name);
                return DiagnosticVerdict::SegmentAbsent;
            }
            LOGGER_ERROR("Diagnostic '{}': segment can be neither attached nor created ({}).",
                         native_name, ec.message());
            throw UnrecoverableSegmentError(
                fmt::format("Segment '{}' is unusable and needs operator cleanup", native_name),
                ec);
        }

        LockToken::Bytes stored{};
        const bool read_ok = shm_read(h, 0, stored.data(), stored.size());
        std::error_code close_ec;
        if (!shm_close(&h, close_ec))
        {
            LOGGER_WARN("Diagnostic '{}': closing the inspection mapping failed: {}", native_name,
                        close_ec.message());
        }
        if (!read_ok)
        {
            // Smaller than a token; no creator of ours would leave it that way.
            throw UnrecoverableSegmentError(
                fmt::format("Segment '{}' is too small to hold a token", native_name),
                std::make_error_code(std::errc::invalid_argument));
        }

        const LockToken found(stored);
        if (found.is_nil())
        {
            LOGGER_DEBUG("Diagnostic '{}': unstamped (attempt {}/{}).", native_name, attempt,
                         attempts);
            if (attempt < attempts)
            {
                std::this_thread::sleep_for(policy.retry_delay);
            }
            continue;
        }
        if (found == own_token)
        {
            LOGGER_ERROR("Diagnostic '{}': found our own token {} on an unrecorded segment.",
                         native_name, own_token);
            throw InternalConsistencyError(fmt::format(
                "Segment '{}' carries this handle's token {} but the handle never recorded "
                "ownership",
                native_name, own_token));
        }
        LOGGER_DEBUG("Diagnostic '{}': held by another owner ({}).", native_name, found);
        return DiagnosticVerdict::OwnedByOther;
    }

    LOGGER_ERROR("Diagnostic '{}': segment still unstamped after {} attempts; treating it as "
                 "dangling.",
                 native_name, attempts);
    throw DanglingResourceError(fmt::format(
        "Segment '{}' exists but was never stamped; it is probably orphaned and must be "
        "removed manually or by registry cleanup",
        native_name));
}

} // namespace shmmutex::utils
