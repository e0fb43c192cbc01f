#pragma once

/**
@file
@brief Defines `util::ScopeGuard`, which runs a function when the enclosing scope exits.
*/

#include <utility>

namespace util {

/// @brief Runs a function on scope exit unless cancelled.
///
/// Typical use is rolling back partially completed work, such as removing a temporary file when a write fails:
///
/// ```cpp
/// std::ofstream out{tmpPath};
/// util::ScopeGuard sgRemoveTemp{[&] { std::filesystem::remove(tmpPath, ec); }};
/// ... write ...
/// std::filesystem::rename(tmpPath, path, ec);
/// if (!ec) {
///     sgRemoveTemp.Cancel();
/// }
/// ```
///
/// @tparam Fn the type of the scope guard function
template <typename Fn>
class ScopeGuard {
public:
    ScopeGuard(Fn &&fn) noexcept
        : m_fn(std::move(fn)) {}

    ScopeGuard(const ScopeGuard &) = delete;
    ScopeGuard &operator=(const ScopeGuard &) = delete;

    ~ScopeGuard() noexcept(noexcept(m_fn())) {
        if (!m_cancelled) {
            m_fn();
        }
    }

    /// @brief Prevents the function from running on scope exit.
    void Cancel() noexcept {
        m_cancelled = true;
    }

private:
    Fn m_fn;
    bool m_cancelled = false;
};

} // namespace util
