/// @file finalizer.cpp
/// @brief Finalizer implementation

#include <arbor/tree/finalizer.hpp>
#include <arbor/tree/config.hpp>
#include <arbor/tree/draft_state.hpp>
#include <arbor/tree/patch.hpp>
#include <arbor/tree/scope.hpp>
#include <arbor/core/error.hpp>
#include <optional>

namespace arbor_tree {

using arbor_core::DraftError;

namespace {

// Store a resolved value back into an unfrozen container
void write_back(const Value& parent, const PathSegment& key, const Value& value) {
    if (parent.is_sequence()) {
        parent.sequence_ptr()->set(std::get<std::size_t>(key), value);
    } else {
        parent.mapping_ptr()->set(std::get<std::string>(key), value);
    }
}

} // anonymous namespace

// =============================================================================
// Finalizer
// =============================================================================

Value Finalizer::finalize(const Value& value, const Path* path, Scope& scope) {
    if (!value.is_draft()) {
        if (value.is_frozen()) {
            return value;
        }
        finalize_tree(value, nullptr, nullptr, scope);
        return value;
    }

    DraftState& state = *value.draft_ref();

    // Drafts of another (or a revoked) scope are left alone
    if (state.m_scope != &scope) {
        scope.disable_auto_freeze();
        return value;
    }

    if (!state.m_modified) {
        return state.m_base;
    }

    if (!state.m_finalized) {
        state.m_finalized = true;
        state.m_finalizing = true;
        finalize_tree(state.m_copy, &state, path, scope);
        state.m_finalizing = false;

        if (m_config.on_delete) {
            for (const auto& key : state.m_assigned_order) {
                if (!state.m_assigned.at(key)) {
                    m_config.on_delete(state, key);
                }
            }
        }
        if (m_config.on_copy) {
            m_config.on_copy(state);
        }

        // Every descendant is resolved, so can_auto_freeze is accurate here
        if (m_config.auto_freeze && scope.can_auto_freeze()) {
            freeze(state.m_copy);
        }

        if (path && scope.recording_patches()) {
            PatchEngine::generate(state, *path, *scope.patches(), *scope.inverse_patches());
        }
        ++m_copies;
    }

    return state.m_copy;
}

void Finalizer::finalize_tree(const Value& root, DraftState* state, const Path* root_path, Scope& scope) {
    if (root.is_sequence()) {
        const auto& items = root.as_sequence();
        for (std::size_t i = 0; i < items.size(); ++i) {
            Value item = items[i];
            finalize_property(i, item, root, state, root_path, scope);
        }
    } else if (root.is_mapping()) {
        const auto& entries = root.as_mapping().entries();
        for (std::size_t i = 0; i < entries.size(); ++i) {
            std::string key = entries[i].first;
            Value item = entries[i].second;
            finalize_property(key, item, root, state, root_path, scope);
        }
    }
}

void Finalizer::finalize_property(const PathSegment& key, const Value& value, const Value& parent,
                                  DraftState* state, const Path* root_path, Scope& scope) {
    if (value.identity() != nullptr && value.identity() == parent.identity()) {
        arbor_core::raise(DraftError::cyclic_reference(to_string(key)));
    }

    // Only direct properties of the draft's copy are draft properties
    bool is_draft_prop = state && parent.identity() == state->m_copy.identity();
    const Value* base_value = is_draft_prop ? state->m_base.find(key) : nullptr;

    Value resolved = value;
    if (value.is_draft()) {
        // Reaching a draft whose subtree is still being resolved means it
        // was assigned below itself
        if (value.draft_ref()->m_finalizing) {
            arbor_core::raise(DraftError::cyclic_reference(to_string(key)));
        }

        std::optional<Path> path;
        bool need_patches = root_path && scope.recording_patches();
        if (is_draft_prop && need_patches && state->assigned(key) != true) {
            path = *root_path;
            path->push_back(key);
        }

        resolved = finalize(value, path ? &*path : nullptr, scope);
        if (resolved.is_draft()) {
            scope.disable_auto_freeze();
        }
        if (resolved.identity() != value.identity()) {
            write_back(parent, key, resolved);
        }

        if (base_value && same_value(resolved, *base_value)) {
            return;
        }
    } else if (base_value && same_value(value, *base_value)) {
        return;
    } else if (value.is_draftable() && !value.is_frozen()) {
        // Fresh containers built by the recipe may hold drafts
        finalize_tree(value, state, root_path, scope);
    }

    if (is_draft_prop && m_config.on_assign) {
        m_config.on_assign(*state, key, resolved);
    }
}

void Finalizer::freeze(const Value& node) noexcept {
    if (node.is_sequence()) {
        node.sequence_ptr()->freeze();
    } else if (node.is_mapping()) {
        node.mapping_ptr()->freeze();
    }
}

} // namespace arbor_tree
