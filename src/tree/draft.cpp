/// @file draft.cpp
/// @brief DraftFactory and Draft implementation

#include <arbor/tree/draft.hpp>
#include <arbor/tree/scope.hpp>
#include <arbor/core/error.hpp>

namespace arbor_tree {

using arbor_core::DraftError;

// =============================================================================
// DraftFactory - Creation
// =============================================================================

DraftRef DraftFactory::create(Scope& scope, const Value& base, DraftState* parent) {
    if (!base.is_draftable()) {
        arbor_core::raise(DraftError::invalid_argument(
            std::string("cannot draft a value of type ") + base.type_name()));
    }

    auto state = std::make_shared<DraftState>(scope, base.classify(), base, parent);
    scope.add_draft(state);
    return state;
}

// =============================================================================
// DraftFactory - Checks
// =============================================================================

void DraftFactory::check_live(const DraftState& state, const char* operation) {
    if (state.m_revoked) {
        arbor_core::raise(DraftError::revoked(operation));
    }
}

void DraftFactory::check_key(const DraftState& state, const PathSegment& key) {
    bool is_index = std::holds_alternative<std::size_t>(key);
    if (state.m_kind == NodeKind::Sequence && !is_index) {
        arbor_core::raise(DraftError::invalid_argument(
            "sequence drafts are indexed by position, got key '" + to_string(key) + "'"));
    }
    if (state.m_kind == NodeKind::Mapping && is_index) {
        arbor_core::raise(DraftError::invalid_argument(
            "mapping drafts are indexed by key, got index " + to_string(key)));
    }
}

void DraftFactory::check_not_self(const DraftState& state, const PathSegment& key, const Value& value) {
    if (value.is_draft() && value.draft_ref().get() == &state) {
        arbor_core::raise(DraftError::cyclic_reference(to_string(key)));
    }
}

// Raw store into the copy; no assignment bookkeeping
void DraftFactory::store(DraftState& state, const PathSegment& key, Value value) {
    if (state.m_kind == NodeKind::Sequence) {
        state.m_copy.sequence_ptr()->set(std::get<std::size_t>(key), std::move(value));
    } else {
        state.m_copy.mapping_ptr()->set(std::get<std::string>(key), std::move(value));
    }
}

// =============================================================================
// DraftFactory - Copy on write
// =============================================================================

void DraftFactory::mark_changed(DraftState& state) {
    DraftState* current = &state;
    while (current && !current->m_modified) {
        current->m_modified = true;
        if (current->m_kind == NodeKind::Sequence) {
            current->m_copy = Value(current->m_base.as_sequence().clone());
        } else {
            current->m_copy = Value(current->m_base.as_mapping().clone());
        }

        // From here on the copy is authoritative for child drafts
        for (auto& [key, child] : current->m_children) {
            store(*current, key, Value(child));
        }
        current->m_children.clear();

        current = current->m_parent;
    }
}

// =============================================================================
// DraftFactory - Property access
// =============================================================================

Value DraftFactory::read(DraftState& state, const PathSegment& key) {
    check_live(state, "read");
    check_key(state, key);

    if (!state.m_modified) {
        if (auto child = state.cached_child(key)) {
            return Value(child);
        }
    }

    const Value* current = state.source().find(key);
    if (!current) {
        return Value::null();
    }

    Value value = *current;
    if (state.m_finalized || !value.is_draftable()) {
        return value;
    }

    // A node containing itself is handed back undrafted
    if (value.identity() == state.m_base.identity() ||
        (state.m_modified && value.identity() == state.m_copy.identity())) {
        return value;
    }

    DraftRef child = create(*state.m_scope, value, &state);
    if (state.m_modified) {
        store(state, key, Value(child));
    } else {
        state.m_children[key] = child;
    }
    return Value(child);
}

void DraftFactory::write(DraftState& state, const PathSegment& key, Value value) {
    check_live(state, "write");
    check_key(state, key);
    check_not_self(state, key, value);

    if (const auto* index = std::get_if<std::size_t>(&key)) {
        std::size_t length = state.source().size();
        if (*index > length) {
            arbor_core::raise(DraftError::invalid_argument(
                "index " + std::to_string(*index) + " is past the end of a sequence of length " +
                std::to_string(length)));
        }
    }

    if (!state.m_modified) {
        const Value* current = state.m_base.find(key);
        bool unchanged = current && same_value(*current, value);
        if (!unchanged && value.is_draft()) {
            unchanged = state.cached_child(key) == value.draft_ref();
        }
        if (unchanged) {
            return;
        }
        mark_changed(state);
    }

    state.set_assigned(key, true);
    store(state, key, std::move(value));
}

void DraftFactory::remove(DraftState& state, const PathSegment& key) {
    check_live(state, "remove");
    check_key(state, key);

    if (state.m_kind == NodeKind::Mapping) {
        const auto& name = std::get<std::string>(key);
        if (state.m_base.as_mapping().contains(name)) {
            mark_changed(state);
            state.set_assigned(key, false);
            state.m_copy.mapping_ptr()->erase(name);
        } else if (state.m_modified && state.m_copy.mapping_ptr()->erase(name)) {
            // Added during this call only: forget the addition entirely
            state.clear_assigned(key);
        }
        return;
    }

    std::size_t index = std::get<std::size_t>(key);
    std::size_t length = state.source().size();
    if (index >= length) {
        arbor_core::raise(DraftError::invalid_argument(
            "cannot remove index " + std::to_string(index) + " from a sequence of length " +
            std::to_string(length)));
    }

    mark_changed(state);
    state.m_copy.sequence_ptr()->erase(index);
    for (std::size_t i = index; i + 1 < length; ++i) {
        state.set_assigned(i, true);
    }
    state.set_assigned(length - 1, false);
}

bool DraftFactory::has(const DraftState& state, const PathSegment& key) {
    check_live(state, "has");
    return state.source().find(key) != nullptr;
}

std::vector<PathSegment> DraftFactory::keys(const DraftState& state) {
    check_live(state, "keys");
    std::vector<PathSegment> result;
    const Value& source = state.source();
    if (state.m_kind == NodeKind::Sequence) {
        result.reserve(source.size());
        for (std::size_t i = 0; i < source.size(); ++i) {
            result.emplace_back(i);
        }
    } else {
        for (const auto& [name, _] : source.as_mapping()) {
            result.emplace_back(name);
        }
    }
    return result;
}

std::size_t DraftFactory::size(const DraftState& state) {
    check_live(state, "size");
    return state.source().size();
}

// =============================================================================
// DraftFactory - Sequence edits
// =============================================================================

void DraftFactory::insert(DraftState& state, std::size_t index, Value value) {
    check_live(state, "insert");
    if (state.m_kind != NodeKind::Sequence) {
        arbor_core::raise(DraftError::invalid_argument("insert requires a sequence draft"));
    }
    check_not_self(state, index, value);

    std::size_t length = state.source().size();
    if (index > length) {
        arbor_core::raise(DraftError::invalid_argument(
            "insert index " + std::to_string(index) + " is past the end of a sequence of length " +
            std::to_string(length)));
    }

    mark_changed(state);
    state.m_copy.sequence_ptr()->insert(index, std::move(value));
    for (std::size_t i = index; i <= length; ++i) {
        state.set_assigned(i, true);
    }
}

void DraftFactory::resize(DraftState& state, std::size_t size) {
    check_live(state, "resize");
    if (state.m_kind != NodeKind::Sequence) {
        arbor_core::raise(DraftError::invalid_argument("resize requires a sequence draft"));
    }

    std::size_t length = state.source().size();
    if (size == length) {
        return;
    }

    mark_changed(state);
    state.m_copy.sequence_ptr()->resize(size);
    if (size < length) {
        for (std::size_t i = size; i < length; ++i) {
            state.set_assigned(i, false);
        }
    } else {
        for (std::size_t i = length; i < size; ++i) {
            state.set_assigned(i, true);
        }
    }
}

// =============================================================================
// Draft
// =============================================================================

DraftState& Draft::state() const {
    if (!m_state) {
        arbor_core::raise(DraftError::invalid_argument("draft handle is not bound"));
    }
    return *m_state;
}

Value Draft::get(std::string_view key) const {
    return DraftFactory::read(state(), std::string(key));
}

Value Draft::get(std::size_t index) const {
    return DraftFactory::read(state(), index);
}

Draft Draft::child_at(const PathSegment& key) const {
    Value value = DraftFactory::read(state(), key);
    if (!value.is_draft()) {
        arbor_core::raise(DraftError::invalid_argument(
            "property '" + to_string(key) + "' holds a " + value.type_name() + ", not a draftable node"));
    }
    return Draft(value.draft_ref());
}

Draft Draft::child(std::string_view key) const {
    return child_at(std::string(key));
}

Draft Draft::child(std::size_t index) const {
    return child_at(index);
}

bool Draft::has(std::string_view key) const {
    return DraftFactory::has(state(), std::string(key));
}

bool Draft::has(std::size_t index) const {
    return DraftFactory::has(state(), index);
}

std::vector<PathSegment> Draft::keys() const {
    return DraftFactory::keys(state());
}

std::size_t Draft::size() const {
    return DraftFactory::size(state());
}

bool Draft::is_sequence() const {
    return state().kind() == NodeKind::Sequence;
}

bool Draft::is_mapping() const {
    return state().kind() == NodeKind::Mapping;
}

void Draft::set(std::string_view key, Value value) {
    DraftFactory::write(state(), std::string(key), std::move(value));
}

void Draft::set(std::size_t index, Value value) {
    DraftFactory::write(state(), index, std::move(value));
}

void Draft::remove(std::string_view key) {
    DraftFactory::remove(state(), std::string(key));
}

void Draft::remove(std::size_t index) {
    DraftFactory::remove(state(), index);
}

void Draft::push_back(Value value) {
    DraftState& s = state();
    DraftFactory::insert(s, DraftFactory::size(s), std::move(value));
}

void Draft::pop_back() {
    DraftState& s = state();
    std::size_t length = DraftFactory::size(s);
    if (length == 0) {
        arbor_core::raise(DraftError::invalid_argument("pop_back on an empty sequence"));
    }
    DraftFactory::remove(s, length - 1);
}

void Draft::insert(std::size_t index, Value value) {
    DraftFactory::insert(state(), index, std::move(value));
}

void Draft::resize(std::size_t size) {
    DraftFactory::resize(state(), size);
}

Draft as_draft(const Value& value) {
    if (!value.is_draft()) {
        arbor_core::raise(DraftError::invalid_argument(
            std::string("expected a draft, got ") + value.type_name()));
    }
    return Draft(value.draft_ref());
}

} // namespace arbor_tree
