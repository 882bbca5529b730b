#pragma once

/// @file scope.hpp
/// @brief Lifetime boundary for the drafts of one producing call

#include "fwd.hpp"
#include "patch.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace arbor_tree {

/// Receives forward and inverse patches once a producing call completes
using PatchListener = std::function<void(const std::vector<Patch>& patches,
                                         const std::vector<Patch>& inverse_patches)>;

// =============================================================================
// Scope
// =============================================================================

/// Owns every draft created during one producing call
///
/// Drafts hold a non-owning pointer back to their scope; the scope holds
/// the only owning references, so revoking it releases the whole draft tree.
class Scope {
public:
    Scope(Scope* parent, std::uint64_t id);
    ~Scope();

    Scope(const Scope&) = delete;
    Scope& operator=(const Scope&) = delete;

    /// Scope that was current when this one was entered
    [[nodiscard]] Scope* parent() const noexcept { return m_parent; }

    /// Monotonic identifier, for logs
    [[nodiscard]] std::uint64_t id() const noexcept { return m_id; }

    /// Drafts in creation order; the first is the root
    [[nodiscard]] const std::vector<DraftRef>& drafts() const noexcept { return m_drafts; }

    /// Root draft (nullptr before one is created)
    [[nodiscard]] DraftRef root() const;

    void add_draft(DraftRef draft);

    /// False once a draft of another scope was found in the result
    [[nodiscard]] bool can_auto_freeze() const noexcept { return m_can_auto_freeze; }
    void disable_auto_freeze() noexcept { m_can_auto_freeze = false; }

    [[nodiscard]] bool recording_patches() const noexcept { return m_patches.has_value(); }
    [[nodiscard]] std::vector<Patch>* patches() noexcept { return m_patches ? &*m_patches : nullptr; }
    [[nodiscard]] std::vector<Patch>* inverse_patches() noexcept {
        return m_inverse_patches ? &*m_inverse_patches : nullptr;
    }
    [[nodiscard]] const PatchListener& listener() const noexcept { return m_listener; }

    [[nodiscard]] bool revoked() const noexcept { return m_revoked; }

private:
    friend class ScopeManager;

    void revoke_drafts() noexcept;

    Scope* m_parent;
    std::uint64_t m_id;
    std::vector<DraftRef> m_drafts;
    bool m_can_auto_freeze = true;
    bool m_revoked = false;
    std::optional<std::vector<Patch>> m_patches;
    std::optional<std::vector<Patch>> m_inverse_patches;
    PatchListener m_listener;
};

// =============================================================================
// ScopeManager
// =============================================================================

/// Stack of active scopes; the top is the current scope
///
/// One manager per Producer. Not thread-safe.
class ScopeManager {
public:
    ScopeManager() = default;

    /// Push a fresh scope whose parent is the current one
    std::shared_ptr<Scope> enter();

    /// Pop scope if it is current (no-op otherwise)
    void leave(Scope& scope) noexcept;

    /// Leave, then revoke every draft of the scope
    void revoke(Scope& scope) noexcept;

    /// Enable patch recording when a listener is given
    static void attach_patch_recording(Scope& scope, PatchListener listener);

    /// Current scope (nullptr when idle)
    [[nodiscard]] Scope* current() const noexcept;

    [[nodiscard]] std::size_t depth() const noexcept { return m_stack.size(); }

private:
    std::vector<std::shared_ptr<Scope>> m_stack;
    std::uint64_t m_next_id = 1;
};

} // namespace arbor_tree
