// format_tools.cpp
#include "smx_base.hpp"

namespace shmmutex::format_tools
{

// Formatted local time with microsecond resolution.
//  - If the build system detected fmt chrono subseconds support (HAVE_FMT_CHRONO_SUBSECONDS),
//    use single-step fmt formatting on a microsecond-truncated time_point.
//  - Otherwise compute the fractional microsecond part and append it with a two-step format.
std::string formatted_time(std::chrono::system_clock::time_point timestamp)
{
    auto tp_us = std::chrono::time_point_cast<std::chrono::microseconds>(timestamp);
#if defined(HAVE_FMT_CHRONO_SUBSECONDS) && HAVE_FMT_CHRONO_SUBSECONDS
    return fmt::format("{:%Y-%m-%d %H:%M:%S}", tp_us);
#else
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp_us);
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(tp_us - secs).count();
    // normalize to 0..999999 even for negative timestamps
    int fractional_us = static_cast<int>(us % 1000000);
    if (fractional_us < 0)
        fractional_us += 1000000;
    auto sec_part = fmt::format("{:%Y-%m-%d %H:%M:%S}", secs);
    return fmt::format("{}.{:06d}", sec_part, fractional_us);
#endif
}

std::string bytes_to_hex(const std::uint8_t *data, std::size_t len)
{
    std::string out;
    if (data == nullptr)
    {
        return out;
    }
    out.reserve(len * 2);
    for (std::size_t i = 0; i < len; ++i)
    {
        fmt::format_to(std::back_inserter(out), "{:02x}", data[i]);
    }
    return out;
}

std::string_view trim_whitespace(std::string_view str) noexcept
{
    constexpr std::string_view whitespace = " \t\n\r\f\v";

    auto first = str.find_first_not_of(whitespace);
    if (first == std::string_view::npos)
    {
        return str.substr(0, 0);
    }
    auto last = str.find_last_not_of(whitespace);
    return str.substr(first, last - first + 1);
}

} // namespace shmmutex::format_tools
