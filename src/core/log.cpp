/// @file log.cpp
/// @brief Logger registry for arbor_core
///
/// All arbor loggers write through one set of sinks so that a single
/// configure_logging call redirects every subsystem at once.

#include <arbor/core/log.hpp>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdlib>
#include <filesystem>
#include <mutex>
#include <sstream>
#include <vector>

namespace arbor_core {

namespace {

class LoggerRegistry {
public:
    static LoggerRegistry& instance() {
        static LoggerRegistry registry;
        return registry;
    }

    void configure(const LogConfig& config) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_config = config;
        m_sinks = make_sinks(config);
        for (auto& [name, logger] : m_loggers) {
            logger->sinks() = m_sinks;
            logger->set_level(config.level);
        }
    }

    std::shared_ptr<spdlog::logger> get(const std::string& name) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (auto it = m_loggers.find(name); it != m_loggers.end()) {
            return it->second;
        }

        if (m_sinks.empty() && m_config.console_enabled) {
            m_sinks = make_sinks(m_config);
        }

        auto logger = std::make_shared<spdlog::logger>(name, m_sinks.begin(), m_sinks.end());
        logger->set_level(m_config.level);

        // Another component may have registered the name with spdlog already
        spdlog::drop(name);
        spdlog::register_logger(logger);

        m_loggers.emplace(name, logger);
        return logger;
    }

    void set_level(spdlog::level::level_enum level) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_config.level = level;
        for (auto& [name, logger] : m_loggers) {
            logger->set_level(level);
        }
    }

    void set_level(const std::string& name, spdlog::level::level_enum level) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (auto it = m_loggers.find(name); it != m_loggers.end()) {
            it->second->set_level(level);
        }
    }

    spdlog::level::level_enum level() {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_config.level;
    }

    void flush() {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto& [name, logger] : m_loggers) {
            logger->flush();
        }
    }

    void drop_all() {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto& [name, logger] : m_loggers) {
            logger->flush();
            spdlog::drop(name);
        }
        m_loggers.clear();
        m_sinks.clear();
    }

private:
    static std::vector<spdlog::sink_ptr> make_sinks(const LogConfig& config) {
        std::vector<spdlog::sink_ptr> sinks;

        if (config.console_enabled) {
            auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            console->set_pattern(config.pattern);
            sinks.push_back(std::move(console));
        }

        if (!config.log_directory.empty()) {
            auto file = std::filesystem::path(config.log_directory) / "arbor.log";
            try {
                auto rotating = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    file.string(), config.max_file_size, config.max_files);
                rotating->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
                sinks.push_back(std::move(rotating));
            } catch (const spdlog::spdlog_ex& ex) {
                spdlog::warn("arbor: cannot open {}: {}", file.string(), ex.what());
            }
        }

        return sinks;
    }

    std::mutex m_mutex;
    LogConfig m_config;
    std::vector<spdlog::sink_ptr> m_sinks;
    std::map<std::string, std::shared_ptr<spdlog::logger>> m_loggers;
};

} // namespace

// =============================================================================
// Configuration
// =============================================================================

LogConfig LogConfig::from_env() {
    LogConfig config;
    if (const char* env = std::getenv("ARBOR_LOG_LEVEL")) {
        if (auto level = parse_log_level(env)) {
            config.level = *level;
        }
    }
    return config;
}

void configure_logging(const LogConfig& config) {
    LoggerRegistry::instance().configure(config);
}

// =============================================================================
// Named Loggers
// =============================================================================

std::shared_ptr<spdlog::logger> get_logger(const std::string& name) {
    return LoggerRegistry::instance().get(name);
}

std::shared_ptr<spdlog::logger> core_logger() {
    return get_logger("arbor_core");
}

std::shared_ptr<spdlog::logger> tree_logger() {
    return get_logger("arbor_tree");
}

// =============================================================================
// Levels
// =============================================================================

void set_global_log_level(spdlog::level::level_enum level) {
    LoggerRegistry::instance().set_level(level);
}

void set_logger_level(const std::string& name, spdlog::level::level_enum level) {
    LoggerRegistry::instance().set_level(name, level);
}

spdlog::level::level_enum get_global_log_level() {
    return LoggerRegistry::instance().level();
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str) {
    if (str == "warning") return spdlog::level::warn;
    if (str == "fatal") return spdlog::level::critical;

    // spdlog maps unknown names to "off"; only accept "off" when spelled out
    auto level = spdlog::level::from_str(str);
    if (level == spdlog::level::off && str != "off") {
        return std::nullopt;
    }
    return level;
}

const char* log_level_name(spdlog::level::level_enum level) {
    switch (level) {
        case spdlog::level::trace: return "trace";
        case spdlog::level::debug: return "debug";
        case spdlog::level::info: return "info";
        case spdlog::level::warn: return "warn";
        case spdlog::level::err: return "error";
        case spdlog::level::critical: return "critical";
        case spdlog::level::off: return "off";
        default: return "unknown";
    }
}

// =============================================================================
// Structured Logging
// =============================================================================

void log_structured(
    spdlog::level::level_enum level,
    const std::string& logger_name,
    const std::string& message,
    const std::map<std::string, std::string>& fields)
{
    std::ostringstream oss;
    oss << message;

    if (!fields.empty()) {
        const char* sep = " {";
        for (const auto& [key, value] : fields) {
            oss << sep << key << "=\"" << value << "\"";
            sep = ", ";
        }
        oss << "}";
    }

    get_logger(logger_name)->log(level, oss.str());
}

// =============================================================================
// LogScope
// =============================================================================

LogScope::LogScope(std::string name, std::shared_ptr<spdlog::logger> logger)
    : m_name(std::move(name))
    , m_logger(std::move(logger))
    , m_start(std::chrono::steady_clock::now())
{
    m_logger->trace("begin {}", m_name);
}

LogScope::~LogScope() {
    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - m_start);
    m_logger->trace("end {} ({}us)", m_name, elapsed.count());
}

// =============================================================================
// Lifecycle
// =============================================================================

void flush_all_loggers() {
    LoggerRegistry::instance().flush();
}

void shutdown_logging() {
    LoggerRegistry::instance().drop_all();
}

} // namespace arbor_core
