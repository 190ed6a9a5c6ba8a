#pragma once

// Primary public header for postcoro.
// Include <postcoro/src.hpp> in exactly one translation unit of the program.

// Error model
#include <postcoro/assert.hpp>
#include <postcoro/error.hpp>

// Coroutines
#include <postcoro/awaitable.hpp>
#include <postcoro/co_spawn.hpp>
#include <postcoro/completion_token.hpp>

// Event loop and timers
#include <postcoro/co_sleep.hpp>
#include <postcoro/io_context.hpp>
#include <postcoro/steady_timer.hpp>

// Postponable delay
#include <postcoro/delay_handle.hpp>
#include <postcoro/postponable_delay.hpp>
#include <postcoro/postpone_response.hpp>
