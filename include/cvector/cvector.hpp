#pragma once

// Correlation vector library - main header
// Include this file to get access to the whole library

#include "version.hpp"
#include "exceptions.hpp"
#include "encoding.hpp"
#include "codec.hpp"
#include "spin.hpp"
#include "correlation_vector.hpp"
#include "logger.hpp"
#include "console_logger.hpp"
#include "metrics.hpp"
#include "configuration.hpp"
#include "correlation_context.hpp"

namespace cvector {

// Version information
inline constexpr int version_major = 0;
inline constexpr int version_minor = 1;
inline constexpr int version_patch = 0;

// Convenience alias for a context logging to the console
using default_correlation_context = correlation_context<console_logger, noop_metrics>;

} // namespace cvector
