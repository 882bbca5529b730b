#pragma once

/// @file draft_state.hpp
/// @brief Per-node bookkeeping behind a draft

#include "fwd.hpp"
#include "value.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <vector>

namespace arbor_tree {

// =============================================================================
// DraftState
// =============================================================================

/// Bookkeeping for one drafted node
///
/// Invariants:
/// - copy() is present if and only if modified() is true
/// - the owning scope never changes; it is cleared only by revocation
/// - assigned(k) == true: k added or changed, false: k deleted, absent: untouched
///
/// Child drafts are cached per key while the node is unmodified; the first
/// mutation moves them into the copy, after which the copy is authoritative.
class DraftState {
public:
    DraftState(Scope& scope, NodeKind kind, Value base, DraftState* parent);

    DraftState(const DraftState&) = delete;
    DraftState& operator=(const DraftState&) = delete;

    /// Node shape, resolved once at creation
    [[nodiscard]] NodeKind kind() const noexcept { return m_kind; }

    /// Original value (a sequence or mapping node)
    [[nodiscard]] const Value& base() const noexcept { return m_base; }

    /// Shallow copy, present only once modified
    [[nodiscard]] const Value& copy() const noexcept { return m_copy; }

    /// The node reads go to: copy when modified, else base
    [[nodiscard]] const Value& source() const noexcept {
        return m_modified ? m_copy : m_base;
    }

    /// Enclosing draft, nullptr for a root (not an ownership edge)
    [[nodiscard]] DraftState* parent() const noexcept { return m_parent; }

    /// Owning scope, nullptr once revoked
    [[nodiscard]] Scope* scope() const noexcept { return m_scope; }

    [[nodiscard]] bool modified() const noexcept { return m_modified; }
    [[nodiscard]] bool finalized() const noexcept { return m_finalized; }
    [[nodiscard]] bool revoked() const noexcept { return m_revoked; }

    /// Created by Producer::create_draft
    [[nodiscard]] bool is_detached_root() const noexcept { return m_detached_root; }

    /// Assignment record for a key (nullopt when untouched)
    [[nodiscard]] std::optional<bool> assigned(const PathSegment& key) const;

    /// Keys with an assignment record, in first-touch order
    [[nodiscard]] const std::vector<PathSegment>& assigned_keys() const noexcept {
        return m_assigned_order;
    }

    /// Cached child draft for key (nullptr when none)
    [[nodiscard]] DraftRef cached_child(const PathSegment& key) const;

private:
    friend class DraftFactory;
    friend class Finalizer;
    friend class Scope;
    friend class Producer;

    void set_assigned(const PathSegment& key, bool value);
    void clear_assigned(const PathSegment& key);

    NodeKind m_kind;
    Value m_base;
    Value m_copy;
    DraftState* m_parent;
    Scope* m_scope;
    bool m_modified = false;
    bool m_finalized = false;
    bool m_finalizing = false;
    bool m_revoked = false;
    bool m_detached_root = false;
    std::map<PathSegment, bool> m_assigned;
    std::vector<PathSegment> m_assigned_order;
    std::map<PathSegment, DraftRef> m_children;
};

} // namespace arbor_tree
