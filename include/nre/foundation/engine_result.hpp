#pragma once

/// @file engine_result.hpp
/// @brief GameResult<T> alias binding Result to EngineError.

#include "nre/core/result.hpp"
#include "nre/foundation/engine_error.hpp"

namespace nre::foundation {

/// Result type for every engine operation that can fail.
///
/// Example:
/// @code
///   GameResult<double> safeRatio(double num, double den) {
///       if (den == 0.0) {
///           return GameResult<double>::err(
///               EngineError(ErrorCode::InvalidArgument, "zero denominator"));
///       }
///       return GameResult<double>::ok(num / den);
///   }
/// @endcode
template <typename T>
using GameResult = nre::Result<T, EngineError>;

}  // namespace nre::foundation
