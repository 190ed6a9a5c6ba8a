#pragma once

#include <postcoro/assert.hpp>

#include <cstdint>
#include <ostream>
#include <source_location>

namespace postcoro {

/// Outcome of a delay_handle::postpone() request.
enum class [[nodiscard]] postpone_response : std::uint8_t {
  /// The target was moved (or confirmed) to the requested instant.
  ok,
  /// The delay has already resolved; it can no longer be postponed.
  already_resolved,
  /// The requested instant is earlier than the current target; nothing changed.
  cant_resolve_earlier,
};

constexpr auto to_string(postpone_response r) noexcept -> char const* {
  switch (r) {
    case postpone_response::ok:
      return "ok";
    case postpone_response::already_resolved:
      return "already_resolved";
    case postpone_response::cant_resolve_earlier:
      return "cant_resolve_earlier";
  }
  return "unknown";
}

inline auto operator<<(std::ostream& os, postpone_response r) -> std::ostream& {
  return os << to_string(r);
}

/// Abort the process unless `r` is `postpone_response::ok`. The report names the caller's
/// location.
///
/// Meant for tests. Callers that can see a refusal should inspect the response instead.
inline void unwrap(postpone_response r,
                   std::source_location where = std::source_location::current()) noexcept {
  if (r == postpone_response::already_resolved) {
    detail::contract_failure("UNWRAP", "r == postpone_response::ok",
                             "unwrap() called on already_resolved", where);
  }
  if (r == postpone_response::cant_resolve_earlier) {
    detail::contract_failure("UNWRAP", "r == postpone_response::ok",
                             "unwrap() called on cant_resolve_earlier", where);
  }
}

}  // namespace postcoro
