/// @file scope.cpp
/// @brief Scope and ScopeManager implementation

#include <arbor/tree/scope.hpp>
#include <arbor/tree/draft_state.hpp>
#include <arbor/core/log.hpp>

namespace arbor_tree {

// =============================================================================
// Scope
// =============================================================================

Scope::Scope(Scope* parent, std::uint64_t id)
    : m_parent(parent)
    , m_id(id)
{
}

Scope::~Scope() {
    // Child drafts stored in copies point back at their states; revoking
    // clears those references so the tree is released.
    revoke_drafts();
}

DraftRef Scope::root() const {
    return m_drafts.empty() ? nullptr : m_drafts.front();
}

void Scope::add_draft(DraftRef draft) {
    m_drafts.push_back(std::move(draft));
}

void Scope::revoke_drafts() noexcept {
    if (m_revoked) {
        return;
    }
    m_revoked = true;
    for (auto& draft : m_drafts) {
        draft->m_revoked = true;
        draft->m_scope = nullptr;
        draft->m_children.clear();
        draft->m_copy = Value{};
    }
}

// =============================================================================
// ScopeManager
// =============================================================================

std::shared_ptr<Scope> ScopeManager::enter() {
    auto scope = std::make_shared<Scope>(current(), m_next_id++);
    m_stack.push_back(scope);
    ARBOR_TREE_TRACE("Entered scope {} (depth {})", scope->id(), m_stack.size());
    return scope;
}

void ScopeManager::leave(Scope& scope) noexcept {
    if (!m_stack.empty() && m_stack.back().get() == &scope) {
        m_stack.pop_back();
    }
}

void ScopeManager::revoke(Scope& scope) noexcept {
    leave(scope);
    if (!scope.revoked()) {
        ARBOR_TREE_TRACE("Revoked scope {} ({} drafts)", scope.id(), scope.drafts().size());
    }
    scope.revoke_drafts();
}

void ScopeManager::attach_patch_recording(Scope& scope, PatchListener listener) {
    if (!listener) {
        return;
    }
    scope.m_patches.emplace();
    scope.m_inverse_patches.emplace();
    scope.m_listener = std::move(listener);
}

Scope* ScopeManager::current() const noexcept {
    return m_stack.empty() ? nullptr : m_stack.back().get();
}

} // namespace arbor_tree
