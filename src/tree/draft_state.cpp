/// @file draft_state.cpp
/// @brief DraftState bookkeeping

#include <arbor/tree/draft_state.hpp>
#include <algorithm>

namespace arbor_tree {

DraftState::DraftState(Scope& scope, NodeKind kind, Value base, DraftState* parent)
    : m_kind(kind)
    , m_base(std::move(base))
    , m_parent(parent)
    , m_scope(&scope)
{
}

std::optional<bool> DraftState::assigned(const PathSegment& key) const {
    auto it = m_assigned.find(key);
    if (it == m_assigned.end()) {
        return std::nullopt;
    }
    return it->second;
}

DraftRef DraftState::cached_child(const PathSegment& key) const {
    auto it = m_children.find(key);
    return it == m_children.end() ? nullptr : it->second;
}

void DraftState::set_assigned(const PathSegment& key, bool value) {
    auto [it, inserted] = m_assigned.insert_or_assign(key, value);
    if (inserted) {
        m_assigned_order.push_back(key);
    }
}

void DraftState::clear_assigned(const PathSegment& key) {
    if (m_assigned.erase(key) > 0) {
        m_assigned_order.erase(
            std::remove(m_assigned_order.begin(), m_assigned_order.end(), key),
            m_assigned_order.end());
    }
}

} // namespace arbor_tree
