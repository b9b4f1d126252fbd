#pragma once
/**
 * @file lock_token.hpp
 * @brief 16-byte per-handle identity stamped into a held segment.
 *
 * ## Text form
 *
 *   xxxxxxxx-xxxx-4xxx-Yxxx-xxxxxxxxxxxx   (lowercase, 36 chars)
 *
 * from_string() also accepts the 32-digit form without hyphens, in either case.
 * Generated tokens carry the version-4 nibble and the 10xx variant bits so they read as
 * ordinary random UUIDs in logs and tooling.
 */
#include "shmmutex_utils_export.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

#include <fmt/format.h>

namespace shmmutex::utils
{

class SHMMUTEX_UTILS_EXPORT LockToken
{
  public:
    static constexpr std::size_t kSize = 16;
    using Bytes = std::array<std::uint8_t, kSize>;

    /// The all-zero token, which is also what an unstamped segment holds.
    LockToken() noexcept : bytes_{} {}
    explicit LockToken(const Bytes &bytes) noexcept : bytes_(bytes) {}

    /// 16 random bytes. Uses std::random_device; falls back to a clock-seeded mix.
    static LockToken generate();

    /** @throws TokenFormatError on anything but 36-char hyphenated or 32-char hex text. */
    static LockToken from_string(std::string_view text);

    /** @throws TokenFormatError unless @p len is exactly kSize. */
    static LockToken from_bytes(const std::uint8_t *data, std::size_t len);

    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] bool is_nil() const noexcept;
    [[nodiscard]] const Bytes &bytes() const noexcept { return bytes_; }
    [[nodiscard]] const std::uint8_t *data() const noexcept { return bytes_.data(); }

    friend bool operator==(const LockToken &a, const LockToken &b) noexcept
    {
        return a.bytes_ == b.bytes_;
    }
    friend bool operator!=(const LockToken &a, const LockToken &b) noexcept { return !(a == b); }

  private:
    Bytes bytes_;
};

} // namespace shmmutex::utils

template <> struct std::hash<shmmutex::utils::LockToken>
{
    std::size_t operator()(const shmmutex::utils::LockToken &t) const noexcept
    {
        // FNV-1a over the raw bytes.
        std::uint64_t h = 14695981039346656037ULL;
        for (auto b : t.bytes())
        {
            h ^= b;
            h *= 1099511628211ULL;
        }
        return static_cast<std::size_t>(h);
    }
};

template <> struct fmt::formatter<shmmutex::utils::LockToken> : fmt::formatter<std::string_view>
{
    template <typename FormatContext>
    auto format(const shmmutex::utils::LockToken &t, FormatContext &ctx) const
    {
        const std::string s = t.to_string();
        return fmt::formatter<std::string_view>::format(std::string_view(s), ctx);
    }
};
