/**
 * @file logging.hpp
 * @brief Single include point for loguru.
 *
 * @details
 * loguru is built with its fmt backend (`LOGURU_USE_FMTLIB=1`, set by the
 * build), so every `LOG_F` format string uses `{}` placeholders.
 *
 * Verbosity conventions used across the library:
 * - `INFO`, `WARNING`, `ERROR`: run summaries, module failures, bad input.
 * - `1`: per-wave tracing.
 * - `2`: per-module and per-cache-key tracing.
 */
#pragma once
#include <loguru.hpp>
