#pragma once

/// @file game_result.hpp
/// @brief GameResult<T> alias used by every fallible engine operation.

#include "tbc/core/result.hpp"
#include "tbc/foundation/game_error.hpp"

namespace tbc::foundation {

/// Result type specialized with GameError.
///
/// Example:
/// @code
///   GameResult<SkillDef> lookupSkill(std::string_view id) {
///       if (id.empty()) {
///           return GameResult<SkillDef>::err(
///               GameError(ErrorCode::InvalidArgument, "empty skill id"));
///       }
///       return skills.get(id);
///   }
/// @endcode
template <typename T>
using GameResult = tbc::Result<T, GameError>;

}  // namespace tbc::foundation
