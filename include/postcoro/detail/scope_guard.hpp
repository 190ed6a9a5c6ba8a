#pragma once

#include <type_traits>
#include <utility>

namespace postcoro::detail {

/// Runs `f` when the scope is left (normally, by exception, or by coroutine frame destruction).
template <class F>
  requires std::is_nothrow_invocable_v<F&>
class [[nodiscard]] scope_exit {
 public:
  explicit scope_exit(F f) noexcept(std::is_nothrow_move_constructible_v<F>)
      : f_(std::move(f)) {}

  scope_exit(scope_exit const&) = delete;
  auto operator=(scope_exit const&) -> scope_exit& = delete;
  scope_exit(scope_exit&&) = delete;
  auto operator=(scope_exit&&) -> scope_exit& = delete;

  ~scope_exit() noexcept { f_(); }

 private:
  [[no_unique_address]] F f_;
};

}  // namespace postcoro::detail
