#pragma once

/// @file result.h
/// @brief Result<T, E> type alias for ht::expected (Rust-style naming)
///
/// @code
/// Result<int> parsed = parseInt("12");
/// if (parsed.ok()) {
///     int value = parsed.value();
/// }
/// @endcode

#include "ht/expected.h"

namespace ht {

template <typename T, typename E = ResultError> using Result = expected<T, E>;

} // namespace ht
