#include "smx_base.hpp"
#include "utils/lock_errors.hpp"
#include "utils/lock_token.hpp"

#include <algorithm>
#include <chrono>
#include <iterator>
#include <random>

namespace shmmutex::utils
{

namespace
{

// Prefers std::random_device; falls back to a high-res-clock + splitmix64 sequence.
void fill_random(LockToken::Bytes &out)
{
    try
    {
        std::random_device rd;
        for (std::size_t i = 0; i < out.size(); i += 4)
        {
            const auto v = rd();
            for (std::size_t j = 0; j < 4; ++j)
            {
                out[i + j] = static_cast<std::uint8_t>(v >> (8 * j));
            }
        }
        return;
    }
    catch (const std::exception &e)
    {
        SMX_DEBUG("random_device unavailable ({}); using clock-seeded fallback.", e.what());
    }

    auto x = static_cast<std::uint64_t>(
                 std::chrono::high_resolution_clock::now().time_since_epoch().count()) ^
             (shmmutex::platform::get_pid() << 32U) ^ shmmutex::platform::get_native_thread_id();
    for (std::size_t i = 0; i < out.size(); i += 8)
    {
        x += 0x9E3779B97F4A7C15ULL;
        std::uint64_t z = x;
        z = (z ^ (z >> 30U)) * 0xBF58476D1CE4E5B9ULL;
        z = (z ^ (z >> 27U)) * 0x94D049BB133111EBULL;
        z ^= z >> 31U;
        for (std::size_t j = 0; j < 8; ++j)
        {
            out[i + j] = static_cast<std::uint8_t>(z >> (8 * j));
        }
    }
}

int hex_value(char c) noexcept
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

} // namespace

LockToken LockToken::generate()
{
    Bytes b{};
    fill_random(b);
    b[6] = static_cast<std::uint8_t>((b[6] & 0x0FU) | 0x40U); // version 4
    b[8] = static_cast<std::uint8_t>((b[8] & 0x3FU) | 0x80U); // variant 10xx
    return LockToken(b);
}

LockToken LockToken::from_string(std::string_view text)
{
    std::string_view hex = text;
    std::string compact;
    if (text.size() == 36)
    {
        for (std::size_t pos : {8U, 13U, 18U, 23U})
        {
            if (text[pos] != '-')
            {
                throw TokenFormatError(
                    fmt::format("Malformed token '{}': expected '-' at position {}", text, pos));
            }
        }
        compact.reserve(32);
        std::copy_if(text.begin(), text.end(), std::back_inserter(compact),
                     [](char c) { return c != '-'; });
        hex = compact;
    }
    if (hex.size() != kSize * 2)
    {
        throw TokenFormatError(fmt::format(
            "Malformed token '{}': expected 36 or 32 characters, got {}", text, text.size()));
    }

    Bytes b{};
    for (std::size_t i = 0; i < kSize; ++i)
    {
        const int hi = hex_value(hex[2 * i]);
        const int lo = hex_value(hex[2 * i + 1]);
        if (hi < 0 || lo < 0)
        {
            throw TokenFormatError(fmt::format("Malformed token '{}': non-hex digit", text));
        }
        b[i] = static_cast<std::uint8_t>((hi << 4) | lo);
    }
    return LockToken(b);
}

LockToken LockToken::from_bytes(const std::uint8_t *data, std::size_t len)
{
    if (data == nullptr || len != kSize)
    {
        throw TokenFormatError(
            fmt::format("Token must be exactly {} bytes, got {}", kSize, data ? len : 0));
    }
    Bytes b{};
    std::copy_n(data, kSize, b.begin());
    return LockToken(b);
}

std::string LockToken::to_string() const
{
    const std::string hex = format_tools::bytes_to_hex(bytes_.data(), bytes_.size());
    return fmt::format("{}-{}-{}-{}-{}", hex.substr(0, 8), hex.substr(8, 4), hex.substr(12, 4),
                       hex.substr(16, 4), hex.substr(20, 12));
}

bool LockToken::is_nil() const noexcept
{
    return std::all_of(bytes_.begin(), bytes_.end(), [](std::uint8_t b) { return b == 0; });
}

} // namespace shmmutex::utils
