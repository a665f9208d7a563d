#include "analytics/ACEReflector.h"
#include "analytics/Statistics.h"
#include "strategy/StrategyConfig.h"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <map>
#include <set>
#include <sstream>

namespace edgebook {
namespace analytics {

namespace {
const std::vector<std::string> kContextGroupColumns = {
    columns::TRACK, "distance_band", columns::RACING_TYPE, columns::RACE_TYPE
};

std::string utcIsoNow() {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_utc{};
    gmtime_r(&now, &tm_utc);
    std::ostringstream oss;
    oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

nlohmann::json optionalJson(const std::optional<double>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

void accumulate(SliceStats& s, const experience::ExperienceRecord& record) {
    s.bets++;
    s.wins += record.won_flag;
    s.profit += record.profit;
}

void finalize(SliceStats& s) {
    if (s.bets > 0) {
        s.pot_pct = (s.profit / static_cast<double>(s.bets)) * 100.0;
        s.hit_rate = static_cast<double>(s.wins) / static_cast<double>(s.bets);
    }
}

nlohmann::json sliceJson(const SliceStats& s) {
    nlohmann::json j;
    j["bets"] = s.bets;
    j["profit"] = s.profit;
    j["pot_pct"] = s.pot_pct;
    j["hit_rate"] = s.hit_rate;
    return j;
}

bool hasContextField(const std::vector<experience::ExperienceRecord>& experiences, const std::string& field) {
    return std::any_of(experiences.begin(), experiences.end(),
                       [&](const experience::ExperienceRecord& r) { return r.context.count(field) > 0; });
}
}

std::string distanceBand(const std::optional<double>& distance) {
    if (!distance || !(*distance > 0.0)) {
        return "unknown";
    }
    const double d = *distance;
    if (d <= 1200.0) return "<=1200";
    if (d <= 1600.0) return "1201-1600";
    if (d <= 2000.0) return "1601-2000";
    if (d <= 2400.0) return "2001-2400";
    return "2400+";
}

nlohmann::json Playbook::toJson() const {
    nlohmann::json j;

    j["metadata"] = {
        {"generated_at", metadata.generated_at},
        {"experience_rows", metadata.experience_rows},
        {"strategies_evaluated", metadata.strategies_evaluated},
        {"evaluation_version", metadata.evaluation_version},
    };

    j["global"] = {
        {"total_bets", global_stats.total_bets},
        {"total_profit", global_stats.total_profit},
        {"total_staked", global_stats.total_staked},
        {"pot_pct", global_stats.pot_pct},
        {"hit_rate", optionalJson(global_stats.hit_rate)},
    };

    nlohmann::json strategies = nlohmann::json::array();
    for (const auto& s : strategy_stats) {
        nlohmann::json row = s.metrics.toJson();
        row["roi_pct"] = optionalJson(s.roi_pct);
        row["p_value"] = s.p_value;
        row["hit_rate_ci_low"] = optionalJson(s.hit_rate_ci_low);
        row["hit_rate_ci_high"] = optionalJson(s.hit_rate_ci_high);
        row["alpha_threshold"] = s.alpha_threshold;
        row["significant"] = s.significant;
        strategies.push_back(std::move(row));
    }
    j["strategies"] = std::move(strategies);

    nlohmann::json tracks = nlohmann::json::array();
    for (const auto& t : track_insights) {
        nlohmann::json row = sliceJson(t.stats);
        row["track"] = t.track;
        tracks.push_back(std::move(row));
    }
    j["tracks"] = std::move(tracks);

    nlohmann::json contexts = nlohmann::json::array();
    for (const auto& c : context_insights) {
        nlohmann::json row = sliceJson(c.stats);
        for (const auto& [column, value] : c.dimensions) {
            row[column] = value;
        }
        contexts.push_back(std::move(row));
    }
    j["contexts"] = std::move(contexts);
    return j;
}

ACEReflector::ACEReflector(ReflectorSettings settings)
    : settings_(std::move(settings)) {}

Playbook ACEReflector::buildPlaybook(const std::vector<experience::ExperienceRecord>& experiences,
                                     const std::vector<backtest::StrategyMetrics>& strategy_metrics) const {
    Playbook playbook;
    playbook.metadata.generated_at = utcIsoNow();
    playbook.metadata.experience_rows = static_cast<int>(experiences.size());
    playbook.metadata.strategies_evaluated = static_cast<int>(strategy_metrics.size());
    playbook.metadata.evaluation_version = strategy::kEvaluationLogicVersion;

    playbook.global_stats = globalStats(experiences, strategy_metrics);
    playbook.strategy_stats = strategyStats(strategy_metrics);
    playbook.track_insights = trackInsights(experiences);
    playbook.context_insights = contextInsights(experiences);
    return playbook;
}

GlobalStats ACEReflector::globalStats(const std::vector<experience::ExperienceRecord>& experiences,
                                      const std::vector<backtest::StrategyMetrics>& strategy_metrics) const {
    GlobalStats g;
    if (!experiences.empty()) {
        int wins = 0;
        for (const auto& r : experiences) {
            g.total_profit += r.profit;
            g.total_staked += r.stake;
            wins += r.won_flag;
        }
        g.total_bets = static_cast<int>(experiences.size());
        const double n = static_cast<double>(g.total_bets);
        g.pot_pct = (g.total_profit / n) * 100.0;
        g.hit_rate = static_cast<double>(wins) / n;
        return g;
    }

    // Every strategy came up empty: fall back to the per-strategy summary.
    if (strategy_metrics.empty()) {
        return g;
    }
    double pot_sum = 0.0;
    double hit_sum = 0.0;
    for (const auto& m : strategy_metrics) {
        g.total_bets += m.bets;
        g.total_profit += m.total_profit;
        g.total_staked += m.total_staked;
        pot_sum += m.pot_pct;
        hit_sum += m.hit_rate;
    }
    const double n = static_cast<double>(strategy_metrics.size());
    g.pot_pct = pot_sum / n;
    g.hit_rate = hit_sum / n;
    return g;
}

std::vector<StrategyStat> ACEReflector::strategyStats(const std::vector<backtest::StrategyMetrics>& strategy_metrics) const {
    std::vector<StrategyStat> out;
    const int tests = static_cast<int>(strategy_metrics.size());
    const double threshold = settings_.bonferroni
        ? Statistics::bonferroniAlpha(settings_.alpha, tests)
        : settings_.alpha;

    for (const auto& m : strategy_metrics) {
        StrategyStat s;
        s.metrics = m;
        if (m.total_staked > 0.0) {
            s.roi_pct = (m.total_profit / m.total_staked) * 100.0;
        }
        s.p_value = Statistics::binomialPValueGreater(m.wins, m.bets, settings_.null_hit_rate);
        if (const auto ci = Statistics::wilsonInterval(m.wins, m.bets, settings_.confidence)) {
            s.hit_rate_ci_low = ci->low;
            s.hit_rate_ci_high = ci->high;
        }
        s.alpha_threshold = threshold;
        s.significant = m.bets > 0 && s.p_value < threshold;
        out.push_back(std::move(s));
    }

    std::stable_sort(out.begin(), out.end(), [](const StrategyStat& a, const StrategyStat& b) {
        if (a.roi_pct.has_value() != b.roi_pct.has_value()) {
            return a.roi_pct.has_value();
        }
        if (a.roi_pct && *a.roi_pct != *b.roi_pct) {
            return *a.roi_pct > *b.roi_pct;
        }
        return a.metrics.strategy_id < b.metrics.strategy_id;
    });
    return out;
}

std::vector<TrackInsight> ACEReflector::trackInsights(const std::vector<experience::ExperienceRecord>& experiences) const {
    std::vector<TrackInsight> out;
    if (experiences.empty() || !hasContextField(experiences, columns::TRACK)) {
        return out;
    }

    std::map<std::string, SliceStats> by_track;
    for (const auto& r : experiences) {
        const auto track = r.contextValue(columns::TRACK);
        if (!track) continue;
        accumulate(by_track[*track], r);
    }

    for (auto& [track, stats] : by_track) {
        finalize(stats);
        if (stats.bets >= settings_.min_bets) {
            out.push_back(TrackInsight{track, stats});
        }
    }
    std::stable_sort(out.begin(), out.end(), [](const TrackInsight& a, const TrackInsight& b) {
        return a.stats.pot_pct > b.stats.pot_pct;
    });
    return out;
}

std::vector<ContextInsight> ACEReflector::contextInsights(const std::vector<experience::ExperienceRecord>& experiences) const {
    std::vector<ContextInsight> out;
    if (experiences.empty()) {
        return out;
    }

    // distance_band is always present; the other columns only when captured.
    std::vector<std::string> group_columns;
    for (const auto& column : kContextGroupColumns) {
        if (column == "distance_band" || hasContextField(experiences, column)) {
            group_columns.push_back(column);
        }
    }

    std::map<std::vector<std::string>, SliceStats> groups;
    for (const auto& r : experiences) {
        std::vector<std::string> key;
        bool complete = true;
        for (const auto& column : group_columns) {
            if (column == "distance_band") {
                key.push_back(distanceBand(r.distance()));
                continue;
            }
            const auto value = r.contextValue(column);
            if (!value) {
                complete = false;
                break;
            }
            key.push_back(*value);
        }
        if (!complete) continue;
        accumulate(groups[key], r);
    }

    for (auto& [key, stats] : groups) {
        finalize(stats);
        if (stats.bets < settings_.min_bets) continue;
        ContextInsight insight;
        for (size_t i = 0; i < group_columns.size(); ++i) {
            insight.dimensions.emplace_back(group_columns[i], key[i]);
        }
        insight.stats = stats;
        out.push_back(std::move(insight));
    }

    std::stable_sort(out.begin(), out.end(), [](const ContextInsight& a, const ContextInsight& b) {
        return a.stats.pot_pct > b.stats.pot_pct;
    });
    if (out.size() > settings_.max_context_insights) {
        out.resize(settings_.max_context_insights);
    }
    return out;
}

} // namespace analytics
} // namespace edgebook
