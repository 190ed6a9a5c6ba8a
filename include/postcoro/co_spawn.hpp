#pragma once

#include <postcoro/assert.hpp>
#include <postcoro/awaitable.hpp>
#include <postcoro/completion_token.hpp>
#include <postcoro/io_context.hpp>

#include <utility>

namespace postcoro {

/// Start `a` on `ex` without waiting for it.
///
/// The coroutine starts when the io_context runs the posted start task and frees its own frame
/// when it finishes. Finishing with an exception is fatal. Anything the coroutine refers to
/// (lambda captures included) must outlive it.
template <typename T>
void co_spawn(io_context::executor_type ex, awaitable<T> a, detached_t) {
  POSTCORO_ENSURE(ex, "co_spawn: requires a non-empty executor");

  auto h = a.release();
  h.promise().detached = true;
  ex.post([h]() { h.resume(); });
}

}  // namespace postcoro
