/// @file serialization.cpp
/// @brief JSON conversion for values and patches

#include <arbor/tree/serialization.hpp>
#include <arbor/core/error.hpp>
#include <cmath>
#include <cstdint>
#include <limits>

namespace arbor_tree {

using arbor_core::Error;
using arbor_core::ErrorCode;

// =============================================================================
// Values
// =============================================================================

Json value_to_json(const Value& value) {
    switch (value.type()) {
        case ValueType::Null:
            return nullptr;
        case ValueType::Bool:
            return value.as_bool();
        case ValueType::Int:
            return value.as_int();
        case ValueType::Float:
            // nlohmann writes NaN and infinities as null, which reads back as Null
            if (!std::isfinite(value.as_float())) {
                arbor_core::raise(Error(ErrorCode::InvalidArgument,
                    "Cannot serialize non-finite float " + to_string(value)));
            }
            return value.as_float();
        case ValueType::String:
            return value.as_string();
        case ValueType::Sequence:
            {
                Json arr = Json::array();
                for (const auto& item : value.as_sequence()) {
                    arr.push_back(value_to_json(item));
                }
                return arr;
            }
        case ValueType::Mapping:
            {
                Json obj = Json::object();
                for (const auto& [key, item] : value.as_mapping()) {
                    obj[key] = value_to_json(item);
                }
                return obj;
            }
        default:
            break;
    }

    arbor_core::raise(Error(ErrorCode::InvalidArgument,
        std::string("Cannot serialize a value of type ") + value.type_name()));
}

Value value_from_json(const Json& json) {
    switch (json.type()) {
        case Json::value_t::null:
            return Value::null();
        case Json::value_t::boolean:
            return Value(json.get<bool>());
        case Json::value_t::number_integer:
            return Value(json.get<std::int64_t>());
        case Json::value_t::number_unsigned:
            {
                auto n = json.get<std::uint64_t>();
                if (n > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                    arbor_core::raise(Error(ErrorCode::ParseError,
                        "Integer " + std::to_string(n) + " does not fit in a signed 64-bit value"));
                }
                return Value(static_cast<std::int64_t>(n));
            }
        case Json::value_t::number_float:
            return Value(json.get<double>());
        case Json::value_t::string:
            return Value(json.get<std::string>());
        case Json::value_t::array:
            {
                std::vector<Value> items;
                items.reserve(json.size());
                for (const auto& item : json) {
                    items.push_back(value_from_json(item));
                }
                return Value::sequence(std::move(items));
            }
        case Json::value_t::object:
            {
                auto node = std::make_shared<Mapping>();
                for (const auto& [key, item] : json.items()) {
                    node->set(key, value_from_json(item));
                }
                return Value(node);
            }
        default:
            break;
    }

    arbor_core::raise(Error(ErrorCode::ParseError,
        std::string("Unsupported JSON type: ") + json.type_name()));
}

arbor_core::Result<Value> parse_value(std::string_view text) {
    try {
        return arbor_core::Ok(value_from_json(Json::parse(text.begin(), text.end())));
    } catch (const Json::parse_error& e) {
        return arbor_core::Err<Value>(Error(ErrorCode::ParseError, e.what()));
    } catch (const arbor_core::Exception& e) {
        return arbor_core::Err<Value>(e.error());
    }
}

// =============================================================================
// Patches
// =============================================================================

Json patch_to_json(const Patch& patch) {
    Json path = Json::array();
    for (const auto& segment : patch.path) {
        if (const auto* index = std::get_if<std::size_t>(&segment)) {
            path.push_back(*index);
        } else {
            path.push_back(std::get<std::string>(segment));
        }
    }

    Json j = Json::object();
    j["op"] = patch_op_name(patch.op);
    j["path"] = std::move(path);
    if (patch.value) {
        j["value"] = value_to_json(*patch.value);
    }
    return j;
}

Patch patch_from_json(const Json& json) {
    if (!json.is_object() || !json.contains("op") || !json["op"].is_string()) {
        arbor_core::raise(Error(ErrorCode::ParseError, "Patch must be an object with a string 'op'"));
    }

    const auto& op_name = json["op"].get_ref<const std::string&>();
    auto op = parse_patch_op(op_name);
    if (!op) {
        arbor_core::raise(arbor_core::PatchError::unknown_op(op_name));
    }

    Patch patch;
    patch.op = *op;

    if (!json.contains("path") || !json["path"].is_array()) {
        arbor_core::raise(Error(ErrorCode::ParseError, "Patch 'path' must be an array"));
    }
    for (const auto& segment : json["path"]) {
        if (segment.is_number_unsigned()) {
            patch.path.emplace_back(segment.get<std::size_t>());
        } else if (segment.is_number_integer() && segment.get<std::int64_t>() >= 0) {
            patch.path.emplace_back(static_cast<std::size_t>(segment.get<std::int64_t>()));
        } else if (segment.is_string()) {
            patch.path.emplace_back(segment.get<std::string>());
        } else {
            arbor_core::raise(Error(ErrorCode::ParseError,
                "Patch path segments must be strings or non-negative integers, got " + segment.dump()));
        }
    }

    if (json.contains("value")) {
        patch.value = value_from_json(json["value"]);
    }
    return patch;
}

Json patches_to_json(const std::vector<Patch>& patches) {
    Json arr = Json::array();
    for (const auto& patch : patches) {
        arr.push_back(patch_to_json(patch));
    }
    return arr;
}

std::vector<Patch> patches_from_json(const Json& json) {
    if (!json.is_array()) {
        arbor_core::raise(Error(ErrorCode::ParseError, "Patch list must be an array"));
    }
    std::vector<Patch> patches;
    patches.reserve(json.size());
    for (const auto& item : json) {
        patches.push_back(patch_from_json(item));
    }
    return patches;
}

} // namespace arbor_tree
