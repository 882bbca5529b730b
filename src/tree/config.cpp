/// @file config.cpp
/// @brief ProducerConfig loading

#include <arbor/tree/config.hpp>
#include <arbor/core/log.hpp>
#include <nlohmann/json.hpp>
#include <fstream>

namespace arbor_tree {

using arbor_core::Error;
using arbor_core::ErrorCode;

arbor_core::Result<ProducerConfig> ProducerConfig::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return arbor_core::Err<ProducerConfig>(Error(ErrorCode::ParseError, "Producer config must be a JSON object"));
    }

    ProducerConfig config;

    if (j.contains("auto_freeze")) {
        if (!j["auto_freeze"].is_boolean()) {
            return arbor_core::Err<ProducerConfig>(
                Error(ErrorCode::ParseError, "'auto_freeze' must be a boolean").with_context("key", "auto_freeze"));
        }
        config.auto_freeze = j["auto_freeze"].get<bool>();
    }

    if (j.contains("log_level")) {
        if (!j["log_level"].is_string()) {
            return arbor_core::Err<ProducerConfig>(
                Error(ErrorCode::ParseError, "'log_level' must be a string").with_context("key", "log_level"));
        }
        const auto& name = j["log_level"].get_ref<const std::string&>();
        auto level = arbor_core::parse_log_level(name);
        if (!level) {
            return arbor_core::Err<ProducerConfig>(
                Error(ErrorCode::ParseError, "Unknown log level '" + name + "'").with_context("key", "log_level"));
        }
        config.log_level = *level;
    }

    return arbor_core::Ok(std::move(config));
}

arbor_core::Result<ProducerConfig> load_config_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return arbor_core::Err<ProducerConfig>(
            Error(ErrorCode::IOError, "Cannot open config file").with_context("path", path));
    }

    try {
        nlohmann::json j;
        file >> j;
        auto result = ProducerConfig::from_json(j);
        if (result) {
            ARBOR_TREE_DEBUG("Loaded producer config from {}", path);
        }
        return result;
    } catch (const nlohmann::json::exception& e) {
        return arbor_core::Err<ProducerConfig>(
            Error(ErrorCode::ParseError, e.what()).with_context("path", path));
    }
}

} // namespace arbor_tree
