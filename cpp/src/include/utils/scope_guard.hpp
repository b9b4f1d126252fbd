#pragma once

#include <concepts>
#include <functional>
#include <type_traits>
#include <utility>

namespace shmmutex::basics
{

/**
 * @class ScopeGuard
 * @brief Runs a callable when the enclosing scope exits, by normal flow or by exception.
 *
 * Movable but not copyable. A moved-from or dismissed guard does nothing.
 *
 * The callable runs from a `noexcept` destructor, so it must not throw; a throwing
 * cleanup terminates the program. Report failures from inside the callable (log them)
 * instead of throwing.
 *
 * @code
 *  platform::ShmHandle h = platform::shm_attach(name.c_str(), ec);
 *  auto close_guard = shmmutex::basics::make_scope_guard([&h]() noexcept {
 *      std::error_code ignored;
 *      platform::shm_close(&h, ignored);
 *  });
 *  // ... read from h; the mapping is closed on every exit path.
 * @endcode
 *
 * Not thread-safe.
 */
// `std::invocable<Callable&>` because the guard invokes its stored member as an lvalue.
template <typename Callable>
requires std::invocable<Callable &>
class ScopeGuard
{
  public:
    static_assert(!std::is_reference_v<Callable>, "ScopeGuard cannot hold a reference to a callable.");
    static_assert(std::is_move_constructible_v<Callable> || std::is_copy_constructible_v<Callable>,
                  "ScopeGuard's callable must be move- or copy-constructible.");

    [[nodiscard]] explicit operator bool() const noexcept { return m_active; }

    explicit ScopeGuard(Callable fn) noexcept(std::is_nothrow_move_constructible_v<Callable>)
        : m_func(std::move(fn))
    {
    }

    ScopeGuard(ScopeGuard &&other) noexcept(std::is_nothrow_move_constructible_v<Callable>)
        : m_func(std::move(other.m_func)), m_active(other.m_active)
    {
        other.dismiss();
    }

    ~ScopeGuard() noexcept
    {
        if (m_active)
        {
            std::invoke(m_func);
        }
    }

    ScopeGuard(const ScopeGuard &) = delete;
    ScopeGuard &operator=(const ScopeGuard &) = delete;
    ScopeGuard &operator=(ScopeGuard &&) = delete;

    /// Cancels the cleanup action.
    constexpr void dismiss() noexcept { m_active = false; }

    /**
     * @brief Runs the callable now (if still active) and dismisses the guard.
     * @details Exceptions from the callable propagate to the caller.
     */
    void invoke()
    {
        if (m_active)
        {
            m_active = false; // dismiss first so a throw cannot cause a second run
            std::invoke(m_func);
        }
    }

  private:
    Callable m_func;
    bool m_active{true};
};

/**
 * @brief Factory for ScopeGuard; stores a decayed copy of @p f.
 * @note Anything @p f captures by reference must outlive the guard.
 */
template <typename F> auto make_scope_guard(F &&f) -> ScopeGuard<std::decay_t<F>>
{
    return ScopeGuard<std::decay_t<F>>(std::forward<F>(f));
}

} // namespace shmmutex::basics
