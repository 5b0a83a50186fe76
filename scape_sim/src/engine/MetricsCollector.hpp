#pragma once

#include "core/Types.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <vector>

namespace scape {

    // Receives the fully updated model once per completed tick
    class MetricsSink {
    public:
        virtual ~MetricsSink() = default;
        virtual void onTick(const ModelSnapshot& snapshot) = 0;
    };

    struct ModelMetrics {
        Step step = 0;
        size_t traderCount = 0;
        Quantity totalSugar = 0;
        Quantity totalSpice = 0;
        size_t tradeVolume = 0;             // sum of trade-log lengths
        std::optional<double> price;        // geometric mean of every realized price so far
        Quantity stepSugarHarvest = 0;
        Quantity stepSpiceHarvest = 0;
    };

    struct AgentMetrics {
        AgentId id;
        Quantity sugar;
        Quantity spice;
        std::optional<double> mrs;
        std::vector<AgentId> tradeNetwork;
    };

    // Model- and agent-level reporters collected every tick
    class MetricsCollector : public MetricsSink {
    public:
        void onTick(const ModelSnapshot& snapshot) override;

        static ModelMetrics computeModelMetrics(const ModelSnapshot& snapshot);

        const std::vector<ModelMetrics>& getModelSeries() const { return modelSeries_; }
        const std::map<Step, std::vector<AgentMetrics>>& getAgentSeries() const { return agentSeries_; }
        const ModelMetrics* latest() const { return modelSeries_.empty() ? nullptr : &modelSeries_.back(); }

        nlohmann::json toJson() const;
        void clear();

    private:
        std::vector<ModelMetrics> modelSeries_;
        std::map<Step, std::vector<AgentMetrics>> agentSeries_;
    };

} // namespace scape
