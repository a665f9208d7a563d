#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "backtest/Simulator.h"
#include "experience/ExperienceRecord.h"

namespace edgebook {
namespace analytics {

struct ReflectorSettings {
    int min_bets = 30;                  // smallest track/context slice reported
    double alpha = 0.05;
    double null_hit_rate = 0.5;
    double confidence = 0.95;
    bool bonferroni = true;
    size_t max_context_insights = 20;
};

struct PlaybookMetadata {
    std::string generated_at;           // UTC, 2025-01-31T12:00:00Z
    int experience_rows = 0;
    int strategies_evaluated = 0;
    std::string evaluation_version;
};

struct GlobalStats {
    int total_bets = 0;
    double total_profit = 0.0;
    double total_staked = 0.0;
    double pot_pct = 0.0;
    std::optional<double> hit_rate;
};

struct StrategyStat {
    backtest::StrategyMetrics metrics;
    std::optional<double> roi_pct;      // undefined when nothing was staked
    double p_value = 1.0;
    std::optional<double> hit_rate_ci_low;
    std::optional<double> hit_rate_ci_high;
    double alpha_threshold = 0.05;
    bool significant = false;
};

struct SliceStats {
    int bets = 0;
    int wins = 0;
    double profit = 0.0;
    double pot_pct = 0.0;
    double hit_rate = 0.0;
};

struct TrackInsight {
    std::string track;
    SliceStats stats;
};

struct ContextInsight {
    // (column, value) in grouping order: track, distance_band, racing_type, race_type
    std::vector<std::pair<std::string, std::string>> dimensions;
    SliceStats stats;
};

struct Playbook {
    PlaybookMetadata metadata;
    GlobalStats global_stats;
    std::vector<StrategyStat> strategy_stats;
    std::vector<TrackInsight> track_insights;
    std::vector<ContextInsight> context_insights;

    nlohmann::json toJson() const;
};

// <=1200, 1201-1600, 1601-2000, 2001-2400, 2400+; "unknown" when absent or non-positive.
std::string distanceBand(const std::optional<double>& distance);

// Turns a run's experiences and per-strategy metrics into playbook insights.
class ACEReflector {
public:
    explicit ACEReflector(ReflectorSettings settings = {});

    Playbook buildPlaybook(const std::vector<experience::ExperienceRecord>& experiences,
                           const std::vector<backtest::StrategyMetrics>& strategy_metrics) const;

    GlobalStats globalStats(const std::vector<experience::ExperienceRecord>& experiences,
                            const std::vector<backtest::StrategyMetrics>& strategy_metrics) const;
    std::vector<StrategyStat> strategyStats(const std::vector<backtest::StrategyMetrics>& strategy_metrics) const;
    std::vector<TrackInsight> trackInsights(const std::vector<experience::ExperienceRecord>& experiences) const;
    std::vector<ContextInsight> contextInsights(const std::vector<experience::ExperienceRecord>& experiences) const;

    const ReflectorSettings& settings() const { return settings_; }

private:
    ReflectorSettings settings_;
};

} // namespace analytics
} // namespace edgebook
