#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "engine/EngineConfig.h"

namespace edgebook {

class Config {
public:
    static Config& getInstance();

    // Missing file keeps the defaults; a malformed file throws ConfigurationError.
    void load(const std::string& config_path);
    void loadFromJson(const nlohmann::json& j);
    void reset();

    engine::EngineConfig getEngineConfig() const { return engine_config_; }
    std::string getLogLevel() const { return engine_config_.logging.level; }
    std::string getLogDir() const { return engine_config_.logging.dir; }

    void setMinBets(int v) { engine_config_.reflector.min_bets = v; }
    void setPlaybookPath(const std::string& v) { engine_config_.playbook.path = v; }
    void setExperienceOutputDir(const std::string& v) { engine_config_.experience.writer.output_dir = v; }
    void setMaxRaces(int v) { engine_config_.max_races = v; }
    void setStartDate(const std::string& v) { engine_config_.start_date = v; }
    void setEndDate(const std::string& v) { engine_config_.end_date = v; }

private:
    Config() = default;

    engine::EngineConfig engine_config_;
};

} // namespace edgebook
