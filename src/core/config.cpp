/// @file config.cpp
/// @brief Engine configuration loading for hookchain_core

#include <hookchain/core/config.hpp>

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace hookchain_core {

const char* merge_policy_name(MergePolicy policy) {
    switch (policy) {
        case MergePolicy::Reject: return "reject";
        case MergePolicy::Override: return "override";
    }
    return "unknown";
}

namespace {

Result<void> read_log_section(const nlohmann::json& section, LogConfig& log) {
    if (!section.is_object()) {
        return Err(ConfigError::invalid_value("log", section.dump()));
    }

    if (section.contains("level")) {
        const auto& level = section["level"];
        if (!level.is_string()) {
            return Err(ConfigError::invalid_value("log.level", level.dump()));
        }
        auto parsed = parse_log_level(level.get<std::string>());
        if (!parsed) {
            return Err(ConfigError::invalid_value("log.level", level.get<std::string>()));
        }
        log.level = *parsed;
    }

    log.console_enabled = section.value("console", log.console_enabled);
    log.file_enabled = section.value("file", log.file_enabled);
    log.log_directory = section.value("directory", log.log_directory);
    log.max_file_size = section.value("max_file_size", log.max_file_size);
    log.max_files = section.value("max_files", log.max_files);

    return Ok();
}

Result<void> read_catalog_section(const nlohmann::json& section, EngineConfig& config) {
    if (!section.is_object()) {
        return Err(ConfigError::invalid_value("catalog", section.dump()));
    }

    if (section.contains("synthetic_policy")) {
        const auto& policy = section["synthetic_policy"];
        std::string name = policy.is_string() ? policy.get<std::string>() : policy.dump();
        if (name == "reject") {
            config.synthetic_policy = MergePolicy::Reject;
        } else if (name == "override") {
            config.synthetic_policy = MergePolicy::Override;
        } else {
            return Err(ConfigError::invalid_value("catalog.synthetic_policy", name));
        }
    }

    return Ok();
}

} // anonymous namespace

Result<EngineConfig> parse_config(const std::string& json_text) {
    EngineConfig config;

    nlohmann::json root;
    try {
        root = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::parse_error& e) {
        return Err<EngineConfig>(ConfigError::parse_error(e.what()));
    }

    if (root.is_null()) {
        return config;
    }
    if (!root.is_object()) {
        return Err<EngineConfig>(ConfigError::parse_error("top-level value must be an object"));
    }

    try {
        if (root.contains("log")) {
            auto result = read_log_section(root["log"], config.log);
            if (!result) {
                return Err<EngineConfig>(result.error());
            }
        }

        if (root.contains("registrar")) {
            const auto& registrar = root["registrar"];
            if (!registrar.is_object()) {
                return Err<EngineConfig>(ConfigError::invalid_value("registrar", registrar.dump()));
            }
            config.validate_target_kinds =
                registrar.value("validate_target_kinds", config.validate_target_kinds);
        }

        if (root.contains("catalog")) {
            auto result = read_catalog_section(root["catalog"], config);
            if (!result) {
                return Err<EngineConfig>(result.error());
            }
        }
    } catch (const nlohmann::json::type_error& e) {
        return Err<EngineConfig>(ConfigError::parse_error(e.what()));
    }

    return config;
}

Result<EngineConfig> load_config(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Err<EngineConfig>(ConfigError::io_error(path.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto result = parse_config(buffer.str());
    if (!result) {
        Error err = result.error();
        err.with_context("path", path.string());
        return Err<EngineConfig>(std::move(err));
    }

    core_logger()->debug("Loaded config from {}", path.string());
    return result;
}

void apply_config(const EngineConfig& config) {
    configure_logging(config.log);
    core_logger()->debug("Logging configured: level={}, synthetic_policy={}, validate_target_kinds={}",
        log_level_name(config.log.level),
        merge_policy_name(config.synthetic_policy),
        config.validate_target_kinds);
}

} // namespace hookchain_core
