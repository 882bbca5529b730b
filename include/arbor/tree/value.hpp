#pragma once

/// @file value.hpp
/// @brief Dynamic tree value with shared container nodes

#include "fwd.hpp"
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>
#include <unordered_map>
#include <variant>
#include <optional>
#include <utility>

namespace arbor_tree {

// =============================================================================
// ValueType
// =============================================================================

/// Value type discriminator
enum class ValueType : std::uint8_t {
    Null = 0,
    Bool,
    Int,
    Float,
    String,
    Sequence,
    Mapping,
    Opaque,
    Draft
};

/// Get string name for value type
[[nodiscard]] inline const char* value_type_name(ValueType type) noexcept {
    switch (type) {
        case ValueType::Null: return "Null";
        case ValueType::Bool: return "Bool";
        case ValueType::Int: return "Int";
        case ValueType::Float: return "Float";
        case ValueType::String: return "String";
        case ValueType::Sequence: return "Sequence";
        case ValueType::Mapping: return "Mapping";
        case ValueType::Opaque: return "Opaque";
        case ValueType::Draft: return "Draft";
        default: return "Unknown";
    }
}

/// Shape of a value as seen by the draft machinery
enum class NodeKind : std::uint8_t {
    Sequence = 0,   // Ordered, index-addressed
    Mapping,        // Key-addressed
    Opaque          // Passed through untouched, never drafted
};

/// Get string name for node kind
[[nodiscard]] inline const char* node_kind_name(NodeKind kind) noexcept {
    switch (kind) {
        case NodeKind::Sequence: return "Sequence";
        case NodeKind::Mapping: return "Mapping";
        case NodeKind::Opaque: return "Opaque";
        default: return "Unknown";
    }
}

// =============================================================================
// Opaque
// =============================================================================

/// Foreign object carried through the tree by reference
struct Opaque {
    std::shared_ptr<const void> handle;
    std::string type_name;

    bool operator==(const Opaque& other) const noexcept {
        return handle == other.handle;
    }
};

// =============================================================================
// Value
// =============================================================================

/// Dynamic value type using std::variant
///
/// Scalars are stored inline. Sequences and mappings are heap nodes shared
/// between copies of a Value, so two Values referring to the same node are
/// reference-identical.
class Value {
public:
    using Variant = std::variant<
        std::monostate,      // Null
        bool,                // Bool
        std::int64_t,        // Int
        double,              // Float
        std::string,         // String
        SequencePtr,         // Sequence
        MappingPtr,          // Mapping
        Opaque,              // Opaque
        DraftRef             // Draft
    >;

    /// Default constructor creates null
    Value() : m_data(std::monostate{}) {}

    /// Construct from bool
    Value(bool v) : m_data(v) {}

    /// Construct from integer types
    Value(int v) : m_data(static_cast<std::int64_t>(v)) {}
    Value(std::int64_t v) : m_data(v) {}
    Value(std::uint64_t v) : m_data(static_cast<std::int64_t>(v)) {}

    /// Construct from floating point
    Value(float v) : m_data(static_cast<double>(v)) {}
    Value(double v) : m_data(v) {}

    /// Construct from string
    Value(const char* v) : m_data(std::string(v)) {}
    Value(std::string v) : m_data(std::move(v)) {}
    Value(std::string_view v) : m_data(std::string(v)) {}

    /// Construct from container nodes
    Value(SequencePtr v) : m_data(std::move(v)) {}
    Value(MappingPtr v) : m_data(std::move(v)) {}

    /// Construct from opaque object
    Value(Opaque v) : m_data(std::move(v)) {}

    /// Construct from draft
    Value(DraftRef v) : m_data(std::move(v)) {}

    // -------------------------------------------------------------------------
    // Factory methods
    // -------------------------------------------------------------------------

    /// Create null value
    [[nodiscard]] static Value null() { return Value{}; }

    /// Create a sequence from an initializer list
    [[nodiscard]] static Value sequence(std::initializer_list<Value> values);

    /// Create a sequence from a vector
    [[nodiscard]] static Value sequence(std::vector<Value> values);

    /// Create empty sequence
    [[nodiscard]] static Value empty_sequence();

    /// Create a mapping from key/value pairs (insertion order kept)
    [[nodiscard]] static Value mapping(std::initializer_list<std::pair<std::string, Value>> entries);

    /// Create empty mapping
    [[nodiscard]] static Value empty_mapping();

    /// Wrap a foreign object
    template<typename T>
    [[nodiscard]] static Value opaque(std::shared_ptr<const T> object, std::string type_name = {}) {
        return Value(Opaque{std::static_pointer_cast<const void>(std::move(object)), std::move(type_name)});
    }

    // -------------------------------------------------------------------------
    // Type checking
    // -------------------------------------------------------------------------

    /// Get value type
    [[nodiscard]] ValueType type() const noexcept {
        return static_cast<ValueType>(m_data.index());
    }

    /// Get type name
    [[nodiscard]] const char* type_name() const noexcept {
        return value_type_name(type());
    }

    [[nodiscard]] bool is_null() const noexcept { return std::holds_alternative<std::monostate>(m_data); }
    [[nodiscard]] bool is_bool() const noexcept { return std::holds_alternative<bool>(m_data); }
    [[nodiscard]] bool is_int() const noexcept { return std::holds_alternative<std::int64_t>(m_data); }
    [[nodiscard]] bool is_float() const noexcept { return std::holds_alternative<double>(m_data); }
    [[nodiscard]] bool is_numeric() const noexcept { return is_int() || is_float(); }
    [[nodiscard]] bool is_string() const noexcept { return std::holds_alternative<std::string>(m_data); }
    [[nodiscard]] bool is_sequence() const noexcept { return std::holds_alternative<SequencePtr>(m_data); }
    [[nodiscard]] bool is_mapping() const noexcept { return std::holds_alternative<MappingPtr>(m_data); }
    [[nodiscard]] bool is_opaque() const noexcept { return std::holds_alternative<Opaque>(m_data); }
    [[nodiscard]] bool is_draft() const noexcept { return std::holds_alternative<DraftRef>(m_data); }

    /// Sequences and mappings can be drafted; everything else passes through
    [[nodiscard]] bool is_draftable() const noexcept { return is_sequence() || is_mapping(); }

    /// Classify for drafting (drafts report the kind of their node)
    [[nodiscard]] NodeKind classify() const noexcept;

    /// Check if frozen (scalars and opaque values are always frozen)
    [[nodiscard]] bool is_frozen() const noexcept;

    /// Address used for reference identity (nullptr for inline scalars)
    [[nodiscard]] const void* identity() const noexcept;

    // -------------------------------------------------------------------------
    // Accessors
    // -------------------------------------------------------------------------

    /// Get as bool (throws if wrong type)
    [[nodiscard]] bool as_bool() const { return std::get<bool>(m_data); }

    /// Get as int (throws if wrong type)
    [[nodiscard]] std::int64_t as_int() const { return std::get<std::int64_t>(m_data); }

    /// Get as float (throws if wrong type)
    [[nodiscard]] double as_float() const { return std::get<double>(m_data); }

    /// Get as numeric (converts int to float if needed)
    [[nodiscard]] double as_numeric() const {
        if (is_int()) {
            return static_cast<double>(as_int());
        }
        return as_float();
    }

    /// Get as string (throws if wrong type)
    [[nodiscard]] const std::string& as_string() const { return std::get<std::string>(m_data); }

    /// Get as sequence node (throws if wrong type)
    [[nodiscard]] const Sequence& as_sequence() const { return *std::get<SequencePtr>(m_data); }

    /// Get as mapping node (throws if wrong type)
    [[nodiscard]] const Mapping& as_mapping() const { return *std::get<MappingPtr>(m_data); }

    /// Shared sequence node (throws if wrong type)
    [[nodiscard]] const SequencePtr& sequence_ptr() const { return std::get<SequencePtr>(m_data); }

    /// Shared mapping node (throws if wrong type)
    [[nodiscard]] const MappingPtr& mapping_ptr() const { return std::get<MappingPtr>(m_data); }

    /// Get as opaque (throws if wrong type)
    [[nodiscard]] const Opaque& as_opaque() const { return std::get<Opaque>(m_data); }

    /// Draft state behind a draft value (throws if wrong type)
    [[nodiscard]] const DraftRef& draft_ref() const { return std::get<DraftRef>(m_data); }

    [[nodiscard]] std::optional<bool> try_bool() const noexcept {
        if (auto* p = std::get_if<bool>(&m_data)) return *p;
        return std::nullopt;
    }

    [[nodiscard]] std::optional<std::int64_t> try_int() const noexcept {
        if (auto* p = std::get_if<std::int64_t>(&m_data)) return *p;
        return std::nullopt;
    }

    [[nodiscard]] std::optional<double> try_float() const noexcept {
        if (auto* p = std::get_if<double>(&m_data)) return *p;
        return std::nullopt;
    }

    [[nodiscard]] const std::string* try_string() const noexcept {
        return std::get_if<std::string>(&m_data);
    }

    // -------------------------------------------------------------------------
    // Container shortcuts (read-only)
    // -------------------------------------------------------------------------

    /// Element count of a sequence or mapping (0 otherwise)
    [[nodiscard]] std::size_t size() const noexcept;

    /// Look up a child by path segment (nullptr when absent or not a container)
    [[nodiscard]] const Value* find(const PathSegment& key) const;

    /// Sequence index access (throws if not a sequence or out of bounds)
    [[nodiscard]] const Value& operator[](std::size_t index) const;

    /// Mapping key access (throws if not a mapping or key missing)
    [[nodiscard]] const Value& operator[](const std::string& key) const;

    /// Check if mapping contains key
    [[nodiscard]] bool contains(const std::string& key) const;

    // -------------------------------------------------------------------------
    // Comparison
    // -------------------------------------------------------------------------

    /// Structural equality (NaN equals NaN, drafts compare by identity)
    bool operator==(const Value& other) const;
    bool operator!=(const Value& other) const { return !(*this == other); }

    /// Get underlying variant
    [[nodiscard]] const Variant& variant() const noexcept { return m_data; }

private:
    Variant m_data;
};

// =============================================================================
// Sequence
// =============================================================================

/// Ordered, index-addressed container node
class Sequence {
public:
    using Items = std::vector<Value>;
    using const_iterator = Items::const_iterator;

    Sequence() = default;
    explicit Sequence(Items items) : m_items(std::move(items)) {}
    Sequence(std::initializer_list<Value> items) : m_items(items) {}

    [[nodiscard]] std::size_t size() const noexcept { return m_items.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_items.empty(); }

    /// Bounds-checked access
    [[nodiscard]] const Value& at(std::size_t index) const { return m_items.at(index); }
    [[nodiscard]] const Value& operator[](std::size_t index) const { return m_items[index]; }

    [[nodiscard]] const_iterator begin() const noexcept { return m_items.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return m_items.end(); }
    [[nodiscard]] const Items& items() const noexcept { return m_items; }

    /// Overwrite an element; index == size() appends
    void set(std::size_t index, Value value);

    void push_back(Value value);
    void pop_back();
    void insert(std::size_t index, Value value);
    void erase(std::size_t index);
    void resize(std::size_t size);
    void clear();

    [[nodiscard]] bool frozen() const noexcept { return m_frozen; }
    void freeze() noexcept { m_frozen = true; }

    /// Shallow, unfrozen copy
    [[nodiscard]] SequencePtr clone() const;

private:
    void check_mutable(const char* operation) const;

    Items m_items;
    bool m_frozen = false;
};

// =============================================================================
// Mapping
// =============================================================================

/// Key-addressed container node that enumerates in insertion order
class Mapping {
public:
    using Entry = std::pair<std::string, Value>;
    using Entries = std::vector<Entry>;
    using const_iterator = Entries::const_iterator;

    Mapping() = default;
    Mapping(std::initializer_list<Entry> entries);

    [[nodiscard]] std::size_t size() const noexcept { return m_entries.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_entries.empty(); }

    [[nodiscard]] bool contains(const std::string& key) const {
        return m_index.find(key) != m_index.end();
    }

    /// Get value for key (nullptr if absent)
    [[nodiscard]] const Value* find(const std::string& key) const;

    /// Get value for key (throws std::out_of_range if absent)
    [[nodiscard]] const Value& at(const std::string& key) const;

    /// Keys in enumeration order
    [[nodiscard]] std::vector<std::string> keys() const;

    [[nodiscard]] const_iterator begin() const noexcept { return m_entries.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return m_entries.end(); }
    [[nodiscard]] const Entries& entries() const noexcept { return m_entries; }

    /// Insert or overwrite; an existing key keeps its position
    void set(const std::string& key, Value value);

    /// Remove key, returns false if it was absent
    bool erase(const std::string& key);

    void clear();

    [[nodiscard]] bool frozen() const noexcept { return m_frozen; }
    void freeze() noexcept { m_frozen = true; }

    /// Shallow, unfrozen copy
    [[nodiscard]] MappingPtr clone() const;

private:
    void check_mutable(const char* operation) const;
    void reindex(std::size_t from);

    Entries m_entries;
    std::unordered_map<std::string, std::size_t> m_index;
    bool m_frozen = false;
};

// =============================================================================
// Utilities (Implemented in value.cpp)
// =============================================================================

/// Identity equality: same node for containers, NaN equals NaN, +0 != -0
[[nodiscard]] bool same_value(const Value& a, const Value& b) noexcept;

/// Render a value compactly (JSON-like) for logs and diagnostics
[[nodiscard]] std::string to_string(const Value& value);

/// Render a path segment
[[nodiscard]] std::string to_string(const PathSegment& segment);

/// Render a path as /a/0/b
[[nodiscard]] std::string path_to_string(const Path& path);

} // namespace arbor_tree
