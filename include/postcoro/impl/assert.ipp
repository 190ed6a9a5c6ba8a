#include <postcoro/assert.hpp>

#include <cstdio>
#include <cstdlib>

namespace postcoro::detail {

inline void contract_failure(char const* kind, char const* expr, char const* msg,
                             std::source_location where) noexcept {
  std::fprintf(stderr,
               "[postcoro] %s failure\n"
               "  expression: %s\n"
               "  message   : %s\n"
               "  location  : %s:%u\n"
               "  function  : %s\n",
               kind, expr, msg != nullptr ? msg : "(none)", where.file_name(),
               static_cast<unsigned>(where.line()), where.function_name());
  std::fflush(stderr);
  std::abort();
}

}  // namespace postcoro::detail
