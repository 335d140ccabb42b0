#pragma once

#include <concepts>
#include <functional>
#include <type_traits>
#include <utility>

namespace federator::basics
{

/**
 * @class ScopeGuard
 * @brief An RAII-style guard that executes a callable on scope exit.
 *
 * The cleanup action runs when the current scope is exited, whether by normal
 * execution or by an exception, unless the guard was dismissed first. It is
 * movable but not copyable.
 *
 * The callable must be `noexcept`: a guard runs during stack unwinding, where a
 * second exception terminates the process. Cleanup that can fail must report the
 * failure itself (for example through a `std::error_code` overload and a log line).
 *
 * @code
 *  auto part = open_part_file(path);
 *  auto guard = federator::basics::make_scope_guard([&]() noexcept {
 *      std::error_code ec;
 *      std::filesystem::remove(path, ec);
 *  });
 *  write_chunks(part);
 *  guard.dismiss(); // committed, keep the file
 * @endcode
 */
template <typename Callable>
requires std::is_nothrow_invocable_v<Callable &>
class ScopeGuard
{
  public:
    static_assert(!std::is_reference_v<Callable>, "ScopeGuard cannot hold a reference to a callable.");

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

    /**
     * @brief Deactivates the guard, preventing the callable from being executed.
     */
    constexpr void dismiss() noexcept { m_active = false; }

    /**
     * @brief Executes the callable now if active, then dismisses the guard.
     */
    void invoke() noexcept
    {
        if (m_active)
        {
            m_active = false; // dismiss first to prevent double execution
            std::invoke(m_func);
        }
    }

  private:
    Callable m_func;
    bool m_active{true};
};

/**
 * @brief Factory for ScopeGuard; the callable is always stored by value.
 */
template <typename F> auto make_scope_guard(F &&f) -> ScopeGuard<std::decay_t<F>>
{
    return ScopeGuard<std::decay_t<F>>(std::forward<F>(f));
}

} // namespace federator::basics
