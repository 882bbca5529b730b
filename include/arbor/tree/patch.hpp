#pragma once

/// @file patch.hpp
/// @brief Patch records, their generation from drafts and their application

#include "fwd.hpp"
#include "value.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace arbor_tree {

// =============================================================================
// PatchOp
// =============================================================================

/// Patch operation
enum class PatchOp : std::uint8_t {
    Add = 0,    // Insert into a sequence or add a mapping key
    Replace,    // Overwrite an existing location
    Remove      // Delete a location
};

/// Get string name for patch operation ("add", "replace", "remove")
[[nodiscard]] const char* patch_op_name(PatchOp op) noexcept;

/// Parse a patch operation name
[[nodiscard]] std::optional<PatchOp> parse_patch_op(std::string_view name) noexcept;

// =============================================================================
// Patch
// =============================================================================

/// One atomic change at a path
///
/// An empty path addresses the root value. add and replace carry a value,
/// remove does not.
struct Patch {
    PatchOp op = PatchOp::Replace;
    Path path;
    std::optional<Value> value;

    [[nodiscard]] static Patch add(Path path, Value value) {
        return Patch{PatchOp::Add, std::move(path), std::move(value)};
    }

    [[nodiscard]] static Patch replace(Path path, Value value) {
        return Patch{PatchOp::Replace, std::move(path), std::move(value)};
    }

    [[nodiscard]] static Patch remove(Path path) {
        return Patch{PatchOp::Remove, std::move(path), std::nullopt};
    }

    /// Structural comparison (values compared deeply)
    bool operator==(const Patch& other) const;
    bool operator!=(const Patch& other) const { return !(*this == other); }
};

/// Render a patch for diagnostics, e.g. "replace /a/0 = 3"
[[nodiscard]] std::string to_string(const Patch& patch);

// =============================================================================
// PatchEngine
// =============================================================================

/// Generates forward/inverse patches and applies patch lists to drafts
class PatchEngine {
public:
    /// Sentinel final segment meaning "past the end" of a sequence
    static constexpr std::string_view append_segment = "-";

    /// Record the changes of a finalized, modified state
    ///
    /// @param state Draft state; its copy must already hold final values
    /// @param base_path Path of the state from the root value
    static void generate(const DraftState& state, const Path& base_path,
                         std::vector<Patch>& patches, std::vector<Patch>& inverse_patches);

    /// Record a whole-value replacement at the root
    static void generate_replacement(const Value& base, const Value& replacement,
                                     std::vector<Patch>& patches, std::vector<Patch>& inverse_patches);

    /// Apply patches, starting at first, to a draft in order
    ///
    /// Root (empty path) patches are not accepted here; Producer handles them.
    static void apply(const Draft& draft, const std::vector<Patch>& patches, std::size_t first = 0);

private:
    /// Replace for assigned indices in the overlap, add per grown element.
    /// A shrink emits one remove per dropped element from the end down
    /// rather than a single remove at the new length, since remove splices
    /// out exactly one index when replayed.
    static void generate_sequence(const DraftState& state, const Path& base_path,
                                  std::vector<Patch>& patches, std::vector<Patch>& inverse_patches);
    static void generate_mapping(const DraftState& state, const Path& base_path,
                                 std::vector<Patch>& patches, std::vector<Patch>& inverse_patches);
    static void apply_one(const Draft& draft, const Patch& patch);
};

} // namespace arbor_tree
