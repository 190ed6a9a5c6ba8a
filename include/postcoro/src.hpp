#pragma once

// Out-of-line definitions. Include in exactly one translation unit per program.

#include <postcoro/impl/assert.ipp>

#include <postcoro/impl/io_context_impl.ipp>

#include <postcoro/impl/postponable_delay.ipp>
#include <postcoro/impl/steady_timer.ipp>
