/// @file producer.cpp
/// @brief Producer implementation

#include <arbor/tree/producer.hpp>
#include <arbor/tree/draft_state.hpp>
#include <arbor/tree/finalizer.hpp>
#include <arbor/tree/patch.hpp>
#include <arbor/core/log.hpp>

namespace arbor_tree {

using arbor_core::DraftError;
using arbor_core::PatchError;

// =============================================================================
// Construction
// =============================================================================

Producer::Producer()
    : Producer(ProducerConfig{})
{
}

Producer::Producer(ProducerConfig config)
    : m_config(std::move(config))
{
    if (m_config.log_level) {
        arbor_core::tree_logger()->set_level(*m_config.log_level);
    }
}

// =============================================================================
// Scope lifecycle
// =============================================================================

void Producer::reject_base(const Value& base) {
    arbor_core::raise(DraftError::invalid_argument(
        std::string("recipe does not accept a value of type ") + base.type_name()));
}

Value Producer::resolve_base(const Value& base) {
    if (!base.is_draft()) {
        return base;
    }
    const DraftState& state = *base.draft_ref();
    if (state.revoked()) {
        arbor_core::raise(DraftError::revoked("produce"));
    }
    return state.source();
}

Draft Producer::begin(Scope& scope, const Value& base) {
    try {
        return Draft(DraftFactory::create(scope, base, nullptr));
    } catch (const arbor_core::Exception& e) {
        abort_scope(scope, &e.error());
        throw;
    }
}

void Producer::abort_scope(Scope& scope, const arbor_core::Error* error) noexcept {
    m_scopes.revoke(scope);
    if (error) {
        arbor_core::debug::record_error(*error);
        ARBOR_TREE_WARN("Scope {} rolled back: {}", scope.id(), error->message());
    } else {
        ARBOR_TREE_WARN("Scope {} rolled back by a recipe exception", scope.id());
    }
}

Value Producer::process_result(std::optional<Value> result, Scope& scope) {
    DraftRef root = scope.root();
    bool replaced = result && !(result->is_draft() && result->draft_ref() == root);

    Finalizer finalizer(m_config);
    Value output = guarded(scope, [&] {
        if (replaced) {
            if (root->modified()) {
                arbor_core::raise(DraftError::double_return());
            }
            Value replacement = finalizer.finalize(*result, nullptr, scope);
            if (scope.recording_patches()) {
                PatchEngine::generate_replacement(root->base(), replacement,
                                                  *scope.patches(), *scope.inverse_patches());
            }
            return replacement;
        }

        Path root_path;
        return finalizer.finalize(Value(root), &root_path, scope);
    });

    ARBOR_TREE_DEBUG("Scope {} finished: {} drafts, {} copies{}",
        scope.id(), scope.drafts().size(), finalizer.copies_made(), replaced ? ", replaced" : "");

    m_scopes.revoke(scope);

    if (scope.recording_patches()) {
        scope.listener()(*scope.patches(), *scope.inverse_patches());
    }
    return output;
}

// =============================================================================
// Drafts with manual lifetime
// =============================================================================

Draft Producer::create_draft(const Value& base) {
    Value resolved = resolve_base(base);
    if (!resolved.is_draftable()) {
        arbor_core::raise(DraftError::invalid_argument(
            std::string("create_draft needs a sequence or mapping, got ") + resolved.type_name()));
    }

    release_abandoned_drafts();

    auto scope = m_scopes.enter();
    Draft draft = begin(*scope, resolved);
    m_scopes.leave(*scope);

    draft.ref()->m_detached_root = true;
    m_detached.emplace(draft.ref().get(), std::move(scope));
    return draft;
}

void Producer::release_abandoned_drafts() {
    for (auto it = m_detached.begin(); it != m_detached.end();) {
        // Nothing but the scope itself still holds the root draft
        if (it->second->drafts().front().use_count() == 1) {
            ARBOR_TREE_DEBUG("Releasing abandoned draft scope {}", it->second->id());
            m_scopes.revoke(*it->second);
            it = m_detached.erase(it);
        } else {
            ++it;
        }
    }
}

Value Producer::finish_draft(const Draft& draft, PatchListener listener) {
    if (!draft.valid()) {
        arbor_core::raise(DraftError::invalid_argument("finish_draft needs a draft"));
    }

    const DraftState& state = *draft.ref();
    if (!state.is_detached_root()) {
        arbor_core::raise(DraftError::invalid_argument(
            "finish_draft only accepts drafts returned by create_draft"));
    }

    auto it = m_detached.find(&state);
    if (state.revoked() || it == m_detached.end()) {
        arbor_core::raise(DraftError::already_finalized());
    }

    std::shared_ptr<Scope> scope = std::move(it->second);
    m_detached.erase(it);

    ScopeManager::attach_patch_recording(*scope, std::move(listener));
    return process_result(std::nullopt, *scope);
}

// =============================================================================
// Patches
// =============================================================================

Value Producer::apply_patches(const Value& base, const std::vector<Patch>& patches) {
    ARBOR_LOG_SCOPE("apply_patches");

    if (base.is_draft()) {
        PatchEngine::apply(as_draft(base), patches);
        return base;
    }

    // A root replacement discards everything before it
    Value start = base;
    std::size_t first = 0;
    for (std::size_t i = 0; i < patches.size(); ++i) {
        const Patch& patch = patches[i];
        if (!patch.path.empty()) {
            continue;
        }
        if (patch.op != PatchOp::Replace) {
            arbor_core::raise(PatchError::invalid_path("/",
                std::string("'") + patch_op_name(patch.op) + "' cannot target the root"));
        }
        if (!patch.value) {
            arbor_core::raise(PatchError::missing_value("/"));
        }
        start = *patch.value;
        first = i + 1;
    }

    if (first == patches.size()) {
        return start;
    }

    return produce(start, [&](Draft& draft) {
        PatchEngine::apply(draft, patches, first);
    });
}

arbor_core::Result<Value> Producer::try_apply_patches(const Value& base, const std::vector<Patch>& patches) {
    try {
        return arbor_core::Ok(apply_patches(base, patches));
    } catch (const arbor_core::Exception& e) {
        return arbor_core::Err<Value>(e.error());
    }
}

} // namespace arbor_tree
