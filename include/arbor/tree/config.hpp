#pragma once

/// @file config.hpp
/// @brief Producer configuration

#include "fwd.hpp"
#include <arbor/core/error.hpp>
#include <nlohmann/json_fwd.hpp>
#include <spdlog/common.h>
#include <functional>
#include <optional>
#include <string>

namespace arbor_tree {

/// Called during finalization for every property whose value changed
using AssignHook = std::function<void(const DraftState& state, const PathSegment& key, const Value& value)>;

/// Called during finalization for every deleted property
using DeleteHook = std::function<void(const DraftState& state, const PathSegment& key)>;

/// Called once for every node that was copied
using CopyHook = std::function<void(const DraftState& state)>;

// =============================================================================
// ProducerConfig
// =============================================================================

/// Settings consumed by Producer and Finalizer
struct ProducerConfig {
    /// Freeze finalized copies so later mutation throws
    bool auto_freeze = true;

    /// Level applied to the tree logger when the producer is created
    std::optional<spdlog::level::level_enum> log_level;

    AssignHook on_assign;
    DeleteHook on_delete;
    CopyHook on_copy;

    /// Read settings from JSON ("auto_freeze", "log_level"; other keys ignored)
    [[nodiscard]] static arbor_core::Result<ProducerConfig> from_json(const nlohmann::json& j);
};

/// Load a ProducerConfig from a JSON file
[[nodiscard]] arbor_core::Result<ProducerConfig> load_config_file(const std::string& path);

} // namespace arbor_tree
