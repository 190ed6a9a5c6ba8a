#pragma once

namespace postcoro {

/// Completion token: start a coroutine without waiting for it.
struct detached_t {};
inline constexpr detached_t detached{};

/// Completion token: expose an asynchronous operation as an awaitable.
struct use_awaitable_t {};
inline constexpr use_awaitable_t use_awaitable{};

}  // namespace postcoro
