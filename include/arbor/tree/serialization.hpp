#pragma once

/// @file serialization.hpp
/// @brief JSON conversion for values and patches

#include "fwd.hpp"
#include "value.hpp"
#include "patch.hpp"
#include <arbor/core/error.hpp>
#include <nlohmann/json.hpp>
#include <string_view>
#include <vector>

namespace arbor_tree {

/// JSON flavor used throughout; keeps mapping order
using Json = nlohmann::ordered_json;

// =============================================================================
// Values
// =============================================================================

/// Convert a plain value
///
/// Throws InvalidArgument for opaque values, drafts, NaN and infinities.
[[nodiscard]] Json value_to_json(const Value& value);

/// Convert JSON into a fresh, unfrozen value tree
///
/// Throws ParseError for unsigned integers above INT64_MAX.
[[nodiscard]] Value value_from_json(const Json& json);

/// Parse JSON text into a value
[[nodiscard]] arbor_core::Result<Value> parse_value(std::string_view text);

// =============================================================================
// Patches
// =============================================================================

/// {"op": "...", "path": [...], "value": ...}
[[nodiscard]] Json patch_to_json(const Patch& patch);

/// Throws PatchError::UnknownOp for an unknown op, ParseError for bad shape
[[nodiscard]] Patch patch_from_json(const Json& json);

[[nodiscard]] Json patches_to_json(const std::vector<Patch>& patches);
[[nodiscard]] std::vector<Patch> patches_from_json(const Json& json);

} // namespace arbor_tree
