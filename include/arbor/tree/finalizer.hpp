#pragma once

/// @file finalizer.hpp
/// @brief Turns a draft tree back into an immutable value

#include "fwd.hpp"
#include "value.hpp"
#include <cstddef>

namespace arbor_tree {

// =============================================================================
// Finalizer
// =============================================================================

/// Resolves drafts of a scope into plain values
///
/// Unmodified drafts resolve to their base, so untouched subtrees stay
/// reference-identical to the input. Modified drafts resolve to their copy,
/// with nested drafts replaced in place. Results are frozen when the config
/// asks for it and no foreign draft was encountered. Patches are recorded
/// along the way when the scope is recording.
class Finalizer {
public:
    explicit Finalizer(const ProducerConfig& config) : m_config(config) {}

    /// Finalize a draft or a plain value that may contain drafts
    ///
    /// @param path Location of value from the root, or nullptr when no
    ///        patches should be generated for it
    [[nodiscard]] Value finalize(const Value& value, const Path* path, Scope& scope);

    /// Number of modified drafts turned into new nodes so far
    [[nodiscard]] std::size_t copies_made() const noexcept { return m_copies; }

private:
    void finalize_tree(const Value& root, DraftState* state, const Path* root_path, Scope& scope);
    void finalize_property(const PathSegment& key, const Value& value, const Value& parent,
                           DraftState* state, const Path* root_path, Scope& scope);
    static void freeze(const Value& node) noexcept;

    const ProducerConfig& m_config;
    std::size_t m_copies = 0;
};

} // namespace arbor_tree
