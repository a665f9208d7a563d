#include "common/Config.h"
#include "common/Errors.h"
#include "common/PathUtils.h"

#include <filesystem>
#include <fstream>
#include <iostream>

namespace edgebook {

namespace {
std::vector<std::string> readStringList(const nlohmann::json& section, const char* key,
                                        const std::vector<std::string>& fallback) {
    if (!section.contains(key)) {
        return fallback;
    }
    const auto& raw = section[key];
    if (!raw.is_array()) {
        throw ConfigurationError(std::string("Config key '") + key + "' must be a list of strings");
    }
    std::vector<std::string> out;
    for (const auto& item : raw) {
        if (!item.is_string()) {
            throw ConfigurationError(std::string("Config key '") + key + "' must be a list of strings");
        }
        out.push_back(item.get<std::string>());
    }
    return out;
}
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::reset() {
    engine_config_ = engine::EngineConfig{};
}

void Config::load(const std::string& path) {
    std::filesystem::path config_path;
    if (std::filesystem::path(path).is_absolute()) {
        config_path = path;
    } else if (std::filesystem::exists(path)) {
        config_path = path;
    } else {
        config_path = utils::PathUtils::resolveRelativePath(path);
    }

    // Logging is configured from this file, so warnings go straight to stderr.
    if (!std::filesystem::exists(config_path)) {
        std::cerr << "Warning: config file not found: " << config_path.string()
                  << "; using defaults" << std::endl;
        reset();
        return;
    }

    std::ifstream file(config_path);
    if (!file.is_open()) {
        throw ConfigurationError("Cannot open config file: " + config_path.string());
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigurationError("Invalid config file " + config_path.string() + ": " + e.what());
    }
    loadFromJson(j);
}

void Config::loadFromJson(const nlohmann::json& j) {
    reset();
    if (!j.is_object()) {
        throw ConfigurationError("Config document must be a JSON object");
    }

    try {
        if (j.contains("simulator")) {
            const auto& s = j["simulator"];
            engine_config_.simulator.race_id_col = s.value("race_id_col", std::string("race_id"));
            engine_config_.simulator.win_result_col = s.value("win_result_col", std::string("win_result"));
        }

        if (j.contains("experience")) {
            const auto& e = j["experience"];
            auto& cfg = engine_config_.experience;
            cfg.writer.output_dir = e.value("output_dir", std::string("data/experiences"));
            cfg.writer.filename_prefix = e.value("filename_prefix", std::string("experiences"));
            cfg.writer.partition_by_date = e.value("partition_by_date", true);
            cfg.context_fields = readStringList(e, "context_fields", experience::kDefaultContextFields);
            cfg.worker_threads = e.value("worker_threads", 1);
            if (cfg.worker_threads < 1) {
                throw ConfigurationError("experience.worker_threads must be at least 1");
            }
        }

        if (j.contains("reflector")) {
            const auto& r = j["reflector"];
            auto& cfg = engine_config_.reflector;
            cfg.min_bets = r.value("min_bets", 30);
            cfg.alpha = r.value("alpha", 0.05);
            cfg.null_hit_rate = r.value("null_hit_rate", 0.5);
            cfg.confidence = r.value("confidence", 0.95);
            cfg.bonferroni = r.value("bonferroni", true);
            cfg.max_context_insights = r.value("max_context_insights", static_cast<size_t>(20));
            if (cfg.alpha <= 0.0 || cfg.alpha >= 1.0) {
                throw ConfigurationError("reflector.alpha must lie strictly between 0 and 1");
            }
            if (cfg.null_hit_rate <= 0.0 || cfg.null_hit_rate >= 1.0) {
                throw ConfigurationError("reflector.null_hit_rate must lie strictly between 0 and 1");
            }
            if (cfg.confidence <= 0.0 || cfg.confidence >= 1.0) {
                throw ConfigurationError("reflector.confidence must lie strictly between 0 and 1");
            }
        }

        if (j.contains("playbook")) {
            const auto& p = j["playbook"];
            engine_config_.playbook.path = p.value("path", std::string("artifacts/playbook/playbook.json"));
            engine_config_.playbook.max_history = p.value("max_history", static_cast<size_t>(10));
            if (engine_config_.playbook.max_history == 0) {
                throw ConfigurationError("playbook.max_history must be at least 1");
            }
        }

        if (j.contains("logging")) {
            const auto& l = j["logging"];
            engine_config_.logging.dir = l.value("dir", std::string("logs"));
            engine_config_.logging.level = l.value("level", std::string("info"));
        }
    } catch (const nlohmann::json::type_error& e) {
        throw ConfigurationError(std::string("Config value has the wrong type: ") + e.what());
    }
}

} // namespace edgebook
