#include "MetricsCollector.hpp"
#include "utils/Statistics.hpp"

namespace scape {

    ModelMetrics MetricsCollector::computeModelMetrics(const ModelSnapshot& snapshot) {
        ModelMetrics m;
        m.step = snapshot.step;
        m.traderCount = snapshot.traders.size();
        m.stepSugarHarvest = snapshot.stepHarvest.sugar;
        m.stepSpiceHarvest = snapshot.stepHarvest.spice;

        std::vector<double> allPrices;
        for (const auto& t : snapshot.traders) {
            m.totalSugar += t.sugar;
            m.totalSpice += t.spice;
            m.tradeVolume += t.trades;
            allPrices.insert(allPrices.end(), t.prices.begin(), t.prices.end());
        }
        m.price = Statistics::geometricMean(allPrices);
        return m;
    }

    void MetricsCollector::onTick(const ModelSnapshot& snapshot) {
        modelSeries_.push_back(computeModelMetrics(snapshot));

        auto& agents = agentSeries_[snapshot.step];
        agents.clear();
        for (const auto& t : snapshot.traders) {
            agents.push_back({ t.id, t.sugar, t.spice, t.mrs, t.tradePartners });
        }
    }

    void MetricsCollector::clear() {
        modelSeries_.clear();
        agentSeries_.clear();
    }

    nlohmann::json MetricsCollector::toJson() const {
        auto opt = [](const std::optional<double>& v) {
            return v ? nlohmann::json(*v) : nlohmann::json(nullptr);
            };

        nlohmann::json model = nlohmann::json::array();
        for (const auto& m : modelSeries_) {
            model.push_back({
                {"step", m.step},
                {"Trader_Count", m.traderCount},
                {"Total_Sugar", m.totalSugar},
                {"Total_Spice", m.totalSpice},
                {"Trade_Volume", m.tradeVolume},
                {"Price", opt(m.price)},
                {"Step_Sugar_Harvest", m.stepSugarHarvest},
                {"Step_Spice_Harvest", m.stepSpiceHarvest}
            });
        }

        nlohmann::json agents = nlohmann::json::array();
        for (const auto& [step, rows] : agentSeries_) {
            for (const auto& a : rows) {
                agents.push_back({
                    {"step", step},
                    {"id", a.id},
                    {"sugar", a.sugar},
                    {"spice", a.spice},
                    {"mrs", opt(a.mrs)},
                    {"Trade_Network", a.tradeNetwork}
                });
            }
        }

        nlohmann::json j;
        j["model"] = model;
        j["agents"] = agents;
        return j;
    }

} // namespace scape
