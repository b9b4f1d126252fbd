#include "smx_base.hpp"
#include "utils/lock_config.hpp"
#include "utils/lock_errors.hpp"

#include <fstream>

#include <nlohmann/json.hpp>

namespace shmmutex::utils
{

AcquireTimeout AcquireTimeout::after(std::chrono::nanoseconds d)
{
    if (d < std::chrono::nanoseconds::zero())
    {
        throw ConfigurationError(
            fmt::format("Acquire timeout must be non-negative, got {} ns", d.count()));
    }
    return AcquireTimeout(Kind::Duration, d);
}

std::string AcquireTimeout::to_string() const
{
    switch (kind_)
    {
    case Kind::Unbounded:
        return "unbounded";
    case Kind::SingleAttempt:
        return "single-attempt";
    case Kind::Duration:
        break;
    }
    return fmt::format("{}ms",
                       std::chrono::duration_cast<std::chrono::milliseconds>(duration_).count());
}

void LockConfig::validate() const
{
    if (name.empty())
    {
        throw ConfigurationError("Lock name must not be empty");
    }
    if (name.find('/') != std::string::npos || name.find('\0') != std::string::npos)
    {
        throw ConfigurationError(
            fmt::format("Lock name '{}' must not contain '/' or NUL characters", name));
    }
    if (name.size() > kMaxNameLength)
    {
        throw ConfigurationError(fmt::format("Lock name exceeds {} characters (got {})",
                                             kMaxNameLength, name.size()));
    }
    if (poll_interval <= std::chrono::milliseconds::zero())
    {
        throw ConfigurationError(fmt::format("Poll interval must be positive, got {} ms",
                                             poll_interval.count()));
    }
}

LockConfig LockConfig::from_json(const nlohmann::json &j)
{
    if (!j.is_object())
    {
        throw ConfigurationError("Lock configuration must be a JSON object");
    }

    LockConfig cfg;
    try
    {
        if (!j.contains("name"))
        {
            throw ConfigurationError("Lock configuration is missing 'name'");
        }
        cfg.name = j.at("name").get<std::string>();

        if (j.contains("poll_interval_ms"))
        {
            cfg.poll_interval = std::chrono::milliseconds(j.at("poll_interval_ms").get<int64_t>());
        }

        if (j.contains("timeout_ms"))
        {
            const auto &t = j.at("timeout_ms");
            if (t.is_null())
            {
                cfg.default_timeout = AcquireTimeout::unbounded();
            }
            else if (t.is_boolean())
            {
                if (t.get<bool>())
                {
                    throw ConfigurationError(
                        "'timeout_ms' accepts false (single attempt), null or a number");
                }
                cfg.default_timeout = AcquireTimeout::single_attempt();
            }
            else
            {
                cfg.default_timeout =
                    AcquireTimeout::after(std::chrono::milliseconds(t.get<int64_t>()));
            }
        }
    }
    catch (const nlohmann::json::exception &e)
    {
        throw ConfigurationError(fmt::format("Invalid lock configuration: {}", e.what()));
    }

    cfg.validate();
    return cfg;
}

LockConfig LockConfig::from_json_file(const std::filesystem::path &path)
{
    std::ifstream in(path);
    if (!in.is_open())
    {
        throw ConfigurationError(
            fmt::format("Cannot open lock configuration file '{}'", path.string()));
    }
    nlohmann::json j;
    try
    {
        in >> j;
    }
    catch (const nlohmann::json::parse_error &e)
    {
        throw ConfigurationError(
            fmt::format("Cannot parse lock configuration file '{}': {}", path.string(), e.what()));
    }
    return from_json(j);
}

} // namespace shmmutex::utils
