/// @file value.cpp
/// @brief Value, Sequence and Mapping implementation for arbor_tree

#include <arbor/tree/value.hpp>
#include <arbor/tree/draft_state.hpp>
#include <arbor/core/error.hpp>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace arbor_tree {

using arbor_core::Error;
using arbor_core::ErrorCode;

// =============================================================================
// Value
// =============================================================================

Value Value::sequence(std::initializer_list<Value> values) {
    return Value(std::make_shared<Sequence>(values));
}

Value Value::sequence(std::vector<Value> values) {
    return Value(std::make_shared<Sequence>(std::move(values)));
}

Value Value::empty_sequence() {
    return Value(std::make_shared<Sequence>());
}

Value Value::mapping(std::initializer_list<std::pair<std::string, Value>> entries) {
    return Value(std::make_shared<Mapping>(entries));
}

Value Value::empty_mapping() {
    return Value(std::make_shared<Mapping>());
}

NodeKind Value::classify() const noexcept {
    if (is_sequence()) return NodeKind::Sequence;
    if (is_mapping()) return NodeKind::Mapping;
    if (is_draft()) return draft_ref()->kind();
    return NodeKind::Opaque;
}

bool Value::is_frozen() const noexcept {
    if (auto* seq = std::get_if<SequencePtr>(&m_data)) {
        return (*seq)->frozen();
    }
    if (auto* map = std::get_if<MappingPtr>(&m_data)) {
        return (*map)->frozen();
    }
    return !is_draft();
}

const void* Value::identity() const noexcept {
    if (auto* seq = std::get_if<SequencePtr>(&m_data)) return seq->get();
    if (auto* map = std::get_if<MappingPtr>(&m_data)) return map->get();
    if (auto* opaque = std::get_if<Opaque>(&m_data)) return opaque->handle.get();
    if (auto* draft = std::get_if<DraftRef>(&m_data)) return draft->get();
    return nullptr;
}

std::size_t Value::size() const noexcept {
    if (auto* seq = std::get_if<SequencePtr>(&m_data)) return (*seq)->size();
    if (auto* map = std::get_if<MappingPtr>(&m_data)) return (*map)->size();
    return 0;
}

const Value* Value::find(const PathSegment& key) const {
    if (auto* seq = std::get_if<SequencePtr>(&m_data)) {
        const auto* index = std::get_if<std::size_t>(&key);
        if (!index || *index >= (*seq)->size()) {
            return nullptr;
        }
        return &(**seq)[*index];
    }
    if (auto* map = std::get_if<MappingPtr>(&m_data)) {
        const auto* name = std::get_if<std::string>(&key);
        return name ? (*map)->find(*name) : nullptr;
    }
    return nullptr;
}

const Value& Value::operator[](std::size_t index) const {
    return std::get<SequencePtr>(m_data)->at(index);
}

const Value& Value::operator[](const std::string& key) const {
    return std::get<MappingPtr>(m_data)->at(key);
}

bool Value::contains(const std::string& key) const {
    if (auto* map = std::get_if<MappingPtr>(&m_data)) {
        return (*map)->contains(key);
    }
    return false;
}

bool Value::operator==(const Value& other) const {
    if (type() != other.type()) {
        return false;
    }

    switch (type()) {
        case ValueType::Null:
            return true;
        case ValueType::Bool:
            return as_bool() == other.as_bool();
        case ValueType::Int:
            return as_int() == other.as_int();
        case ValueType::Float:
            {
                double a = as_float();
                double b = other.as_float();
                if (std::isnan(a) && std::isnan(b)) {
                    return true;
                }
                return a == b;
            }
        case ValueType::String:
            return as_string() == other.as_string();
        case ValueType::Sequence:
            {
                const auto& sa = as_sequence();
                const auto& sb = other.as_sequence();
                if (&sa == &sb) {
                    return true;
                }
                if (sa.size() != sb.size()) {
                    return false;
                }
                for (std::size_t i = 0; i < sa.size(); ++i) {
                    if (sa[i] != sb[i]) {
                        return false;
                    }
                }
                return true;
            }
        case ValueType::Mapping:
            {
                const auto& ma = as_mapping();
                const auto& mb = other.as_mapping();
                if (&ma == &mb) {
                    return true;
                }
                if (ma.size() != mb.size()) {
                    return false;
                }
                for (const auto& [key, val] : ma) {
                    const Value* theirs = mb.find(key);
                    if (!theirs || val != *theirs) {
                        return false;
                    }
                }
                return true;
            }
        case ValueType::Opaque:
            return as_opaque() == other.as_opaque();
        case ValueType::Draft:
            return draft_ref() == other.draft_ref();
    }

    return false;
}

// =============================================================================
// Sequence
// =============================================================================

void Sequence::check_mutable(const char* operation) const {
    if (m_frozen) {
        arbor_core::raise(Error(ErrorCode::InvalidState,
            std::string("Cannot ") + operation + " a frozen sequence"));
    }
}

void Sequence::set(std::size_t index, Value value) {
    check_mutable("set on");
    if (index == m_items.size()) {
        m_items.push_back(std::move(value));
        return;
    }
    m_items.at(index) = std::move(value);
}

void Sequence::push_back(Value value) {
    check_mutable("append to");
    m_items.push_back(std::move(value));
}

void Sequence::pop_back() {
    check_mutable("pop from");
    if (m_items.empty()) {
        throw std::out_of_range("pop_back on empty sequence");
    }
    m_items.pop_back();
}

void Sequence::insert(std::size_t index, Value value) {
    check_mutable("insert into");
    if (index > m_items.size()) {
        throw std::out_of_range("sequence insert index out of range");
    }
    m_items.insert(m_items.begin() + static_cast<std::ptrdiff_t>(index), std::move(value));
}

void Sequence::erase(std::size_t index) {
    check_mutable("erase from");
    if (index >= m_items.size()) {
        throw std::out_of_range("sequence erase index out of range");
    }
    m_items.erase(m_items.begin() + static_cast<std::ptrdiff_t>(index));
}

void Sequence::resize(std::size_t size) {
    check_mutable("resize");
    m_items.resize(size);
}

void Sequence::clear() {
    check_mutable("clear");
    m_items.clear();
}

SequencePtr Sequence::clone() const {
    return std::make_shared<Sequence>(m_items);
}

// =============================================================================
// Mapping
// =============================================================================

Mapping::Mapping(std::initializer_list<Entry> entries) {
    for (const auto& [key, value] : entries) {
        set(key, value);
    }
}

void Mapping::check_mutable(const char* operation) const {
    if (m_frozen) {
        arbor_core::raise(Error(ErrorCode::InvalidState,
            std::string("Cannot ") + operation + " a frozen mapping"));
    }
}

void Mapping::reindex(std::size_t from) {
    for (std::size_t i = from; i < m_entries.size(); ++i) {
        m_index[m_entries[i].first] = i;
    }
}

const Value* Mapping::find(const std::string& key) const {
    auto it = m_index.find(key);
    if (it == m_index.end()) {
        return nullptr;
    }
    return &m_entries[it->second].second;
}

const Value& Mapping::at(const std::string& key) const {
    const Value* value = find(key);
    if (!value) {
        throw std::out_of_range("mapping has no key '" + key + "'");
    }
    return *value;
}

std::vector<std::string> Mapping::keys() const {
    std::vector<std::string> result;
    result.reserve(m_entries.size());
    for (const auto& [key, _] : m_entries) {
        result.push_back(key);
    }
    return result;
}

void Mapping::set(const std::string& key, Value value) {
    check_mutable("set on");
    auto it = m_index.find(key);
    if (it != m_index.end()) {
        m_entries[it->second].second = std::move(value);
        return;
    }
    m_index.emplace(key, m_entries.size());
    m_entries.emplace_back(key, std::move(value));
}

bool Mapping::erase(const std::string& key) {
    check_mutable("erase from");
    auto it = m_index.find(key);
    if (it == m_index.end()) {
        return false;
    }
    std::size_t position = it->second;
    m_index.erase(it);
    m_entries.erase(m_entries.begin() + static_cast<std::ptrdiff_t>(position));
    reindex(position);
    return true;
}

void Mapping::clear() {
    check_mutable("clear");
    m_entries.clear();
    m_index.clear();
}

MappingPtr Mapping::clone() const {
    auto copy = std::make_shared<Mapping>();
    copy->m_entries = m_entries;
    copy->m_index = m_index;
    return copy;
}

// =============================================================================
// Utilities
// =============================================================================

bool same_value(const Value& a, const Value& b) noexcept {
    if (a.type() != b.type()) {
        return false;
    }

    switch (a.type()) {
        case ValueType::Null:
            return true;
        case ValueType::Bool:
            return a.as_bool() == b.as_bool();
        case ValueType::Int:
            return a.as_int() == b.as_int();
        case ValueType::Float:
            {
                double x = a.as_float();
                double y = b.as_float();
                if (std::isnan(x) || std::isnan(y)) {
                    return std::isnan(x) && std::isnan(y);
                }
                // +0 and -0 compare equal but are not the same value
                return x == y && std::signbit(x) == std::signbit(y);
            }
        case ValueType::String:
            return a.as_string() == b.as_string();
        default:
            return a.identity() == b.identity();
    }
}

namespace {

void write_value(std::ostringstream& oss, const Value& value) {
    switch (value.type()) {
        case ValueType::Null:
            oss << "null";
            break;
        case ValueType::Bool:
            oss << (value.as_bool() ? "true" : "false");
            break;
        case ValueType::Int:
            oss << value.as_int();
            break;
        case ValueType::Float:
            {
                double f = value.as_float();
                if (std::isnan(f)) {
                    oss << "NaN";
                } else if (f == 0.0 && std::signbit(f)) {
                    oss << "-0";
                } else {
                    oss << f;
                }
            }
            break;
        case ValueType::String:
            oss << '"' << value.as_string() << '"';
            break;
        case ValueType::Sequence:
            {
                oss << '[';
                bool first = true;
                for (const auto& item : value.as_sequence()) {
                    if (!first) oss << ',';
                    write_value(oss, item);
                    first = false;
                }
                oss << ']';
            }
            break;
        case ValueType::Mapping:
            {
                oss << '{';
                bool first = true;
                for (const auto& [key, item] : value.as_mapping()) {
                    if (!first) oss << ',';
                    oss << '"' << key << "\":";
                    write_value(oss, item);
                    first = false;
                }
                oss << '}';
            }
            break;
        case ValueType::Opaque:
            oss << "<opaque " << value.as_opaque().type_name << '>';
            break;
        case ValueType::Draft:
            oss << "<draft " << node_kind_name(value.classify()) << '>';
            break;
    }
}

} // anonymous namespace

std::string to_string(const Value& value) {
    std::ostringstream oss;
    write_value(oss, value);
    return oss.str();
}

std::string to_string(const PathSegment& segment) {
    if (const auto* index = std::get_if<std::size_t>(&segment)) {
        return std::to_string(*index);
    }
    return std::get<std::string>(segment);
}

std::string path_to_string(const Path& path) {
    if (path.empty()) {
        return "/";
    }
    std::string result;
    for (const auto& segment : path) {
        result += '/';
        result += to_string(segment);
    }
    return result;
}

} // namespace arbor_tree
