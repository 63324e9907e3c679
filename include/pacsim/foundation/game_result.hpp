#pragma once

/// @file game_result.hpp
/// @brief GameResult<T> type alias for framework error handling.

#include "pacsim/core/result.hpp"
#include "pacsim/foundation/game_error.hpp"

namespace pacsim::foundation {

/// Result type specialized with GameError.
///
/// Example:
/// @code
///   GameResult<int> parseLives(int raw) {
///       if (raw <= 0) {
///           return GameResult<int>::err(
///               GameError(ErrorCode::ConfigInvalidValue, "lives must be positive"));
///       }
///       return GameResult<int>::ok(raw);
///   }
/// @endcode
template <typename T>
using GameResult = pacsim::Result<T, GameError>;

}  // namespace pacsim::foundation
