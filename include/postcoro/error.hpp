#pragma once

#include <string>
#include <system_error>
#include <type_traits>

namespace postcoro {

/// Runtime error codes (category name "postcoro").
///
/// The postponable delay itself has no error path; these codes describe the event loop and the
/// timer it is built on. OS failures are reported as std::system_error with the generic category.
enum class error {
  /// Wait cancelled, or the owning io_context was stopped.
  operation_aborted = 1,
};

namespace detail {

class error_category final : public std::error_category {
 public:
  auto name() const noexcept -> char const* override { return "postcoro"; }

  auto message(int ev) const -> std::string override {
    if (static_cast<error>(ev) == error::operation_aborted) {
      return "operation aborted";
    }
    return "unknown postcoro error";
  }
};

}  // namespace detail

inline auto make_error_code(error e) -> std::error_code {
  static detail::error_category const category{};
  return {static_cast<int>(e), category};
}

}  // namespace postcoro

namespace std {

template <>
struct is_error_code_enum<postcoro::error> : std::true_type {};

}  // namespace std
