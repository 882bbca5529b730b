#pragma once

/// @file draft.hpp
/// @brief Mutable proxy over an immutable value

#include "fwd.hpp"
#include "value.hpp"
#include "draft_state.hpp"
#include <string_view>
#include <vector>

namespace arbor_tree {

// =============================================================================
// DraftFactory
// =============================================================================

/// Creates drafts and implements their read/write behavior
///
/// All mutation goes through here so copy-on-write and the assignment
/// record stay consistent. A state must belong to a live scope.
class DraftFactory {
public:
    /// Wrap a sequence or mapping in a new draft registered with scope
    [[nodiscard]] static DraftRef create(Scope& scope, const Value& base, DraftState* parent);

    /// Read a property; draftable children come back as (cached) child drafts
    [[nodiscard]] static Value read(DraftState& state, const PathSegment& key);

    /// Write a property; a write identical to the base is a no-op
    static void write(DraftState& state, const PathSegment& key, Value value);

    /// Delete a property (sequence removal shifts later elements down)
    static void remove(DraftState& state, const PathSegment& key);

    [[nodiscard]] static bool has(const DraftState& state, const PathSegment& key);
    [[nodiscard]] static std::vector<PathSegment> keys(const DraftState& state);
    [[nodiscard]] static std::size_t size(const DraftState& state);

    // -------------------------------------------------------------------------
    // Sequence edits
    // -------------------------------------------------------------------------

    static void insert(DraftState& state, std::size_t index, Value value);
    static void resize(DraftState& state, std::size_t size);

    /// Copy-on-write: materialize the copy here and in every ancestor
    static void mark_changed(DraftState& state);

private:
    static void check_live(const DraftState& state, const char* operation);
    static void check_key(const DraftState& state, const PathSegment& key);
    static void check_not_self(const DraftState& state, const PathSegment& key, const Value& value);
    static void store(DraftState& state, const PathSegment& key, Value value);
};

// =============================================================================
// Draft
// =============================================================================

/// Handle to a draft, passed to recipes
///
/// Copies of a Draft refer to the same draft. Once the producing call
/// returns the draft is revoked and every operation throws.
class Draft {
public:
    Draft() = default;
    explicit Draft(DraftRef state) : m_state(std::move(state)) {}

    /// Check if bound to a draft
    [[nodiscard]] bool valid() const noexcept { return m_state != nullptr; }

    [[nodiscard]] const DraftRef& ref() const noexcept { return m_state; }

    /// Bound state (throws InvalidArgument when unbound)
    [[nodiscard]] DraftState& state() const;

    // -------------------------------------------------------------------------
    // Reads
    // -------------------------------------------------------------------------

    /// Read a mapping property (null when absent)
    [[nodiscard]] Value get(std::string_view key) const;

    /// Read a sequence element (null when out of range)
    [[nodiscard]] Value get(std::size_t index) const;

    /// Read a property that must be a sequence or mapping, as a draft
    [[nodiscard]] Draft child(std::string_view key) const;
    [[nodiscard]] Draft child(std::size_t index) const;

    [[nodiscard]] bool has(std::string_view key) const;
    [[nodiscard]] bool has(std::size_t index) const;

    [[nodiscard]] std::vector<PathSegment> keys() const;
    [[nodiscard]] std::size_t size() const;

    [[nodiscard]] bool is_sequence() const;
    [[nodiscard]] bool is_mapping() const;

    // -------------------------------------------------------------------------
    // Writes
    // -------------------------------------------------------------------------

    void set(std::string_view key, Value value);

    /// Overwrite an element; index == size() appends
    void set(std::size_t index, Value value);

    void remove(std::string_view key);
    void remove(std::size_t index);

    void push_back(Value value);
    void pop_back();
    void insert(std::size_t index, Value value);

    /// Truncate or pad with null
    void resize(std::size_t size);

    // -------------------------------------------------------------------------
    // Conversion
    // -------------------------------------------------------------------------

    /// The draft as a value, for storing it elsewhere or returning it
    [[nodiscard]] Value value() const { return Value(m_state); }
    operator Value() const { return Value(m_state); }

    bool operator==(const Draft& other) const noexcept { return m_state == other.m_state; }
    bool operator!=(const Draft& other) const noexcept { return m_state != other.m_state; }

private:
    Draft child_at(const PathSegment& key) const;

    DraftRef m_state;
};

/// View a draft value as a Draft (throws InvalidArgument if not a draft)
[[nodiscard]] Draft as_draft(const Value& value);

/// Check if a value is a draft
[[nodiscard]] inline bool is_draft(const Value& value) noexcept { return value.is_draft(); }

/// Check if a value could be drafted
[[nodiscard]] inline bool is_draftable(const Value& value) noexcept { return value.is_draftable(); }

} // namespace arbor_tree
