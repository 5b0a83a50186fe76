#pragma once

#include "core/Types.hpp"
#include "core/Resource.hpp"
#include "core/RuntimeConfig.hpp"
#include "agents/ToolRegistry.hpp"
#include "agents/DecisionMaker.hpp"
#include "memory/MemoryLog.hpp"
#include "utils/Random.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace scape {

    // Economic agent holding sugar (good A) and spice (good B)
    class Trader {
    public:
        // Throws DivisionUndefined for a non-positive metabolism and
        // std::invalid_argument for negative inventories
        Trader(AgentId id,
            Quantity sugar,
            Quantity spice,
            Quantity metabolismSugar,
            Quantity metabolismSpice,
            int vision,
            std::unique_ptr<MemoryLog> memory,
            ToolRegistry tools = ToolRegistry::traderDefaults(),
            std::shared_ptr<DecisionMaker> decisionMaker = nullptr);

        AgentId getId() const { return id_; }
        std::string getType() const { return "Trader"; }

        Quantity getSugar() const { return sugar_; }
        Quantity getSpice() const { return spice_; }
        Quantity getInventory(GoodKind kind) const { return kind == GoodKind::SUGAR ? sugar_ : spice_; }
        Quantity getMetabolismSugar() const { return metabolismSugar_; }
        Quantity getMetabolismSpice() const { return metabolismSpice_; }
        int getVision() const { return vision_; }

        const Coord& getLocation() const { return location_; }
        void setLocation(const Coord& c) { location_ = c; }

        // (sugar / metabolismSugar) / (spice / metabolismSpice).
        // Throws DivisionUndefined when spice is zero.
        double computeMrs() const;
        std::optional<double> tryMrs() const;
        static double mrsOf(Quantity sugar, Quantity spice, Quantity metSugar, Quantity metSpice);

        // A good is short when its stock-to-need ratio is not above the other's
        bool isShortOf(GoodKind kind) const;

        // Takes everything available from resources of goods we are short of
        HarvestTotals harvestAt(const std::vector<Resource*>& resources);

        // Applies our side of an executed trade increment and logs it
        void settleTrade(const TradeRecord& record);

        const std::vector<TradeLogEntry>& getTradeLog() const { return tradeLog_; }
        const std::vector<double>& getPriceHistory() const { return priceHistory_; }
        std::vector<AgentId> getTradePartners() const;

        MemoryLog& getMemory() { return *memory_; }
        const MemoryLog& getMemory() const { return *memory_; }

        const ToolRegistry& getTools() const { return tools_; }
        ToolRegistry& getMutableTools() { return tools_; }

        DecisionMaker* getDecisionMaker() const { return decisionMaker_.get(); }
        void setDecisionMaker(std::shared_ptr<DecisionMaker> dm) { decisionMaker_ = std::move(dm); }

        TraderSnapshot snapshot() const;

    private:
        AgentId id_;
        Quantity sugar_;
        Quantity spice_;
        Quantity metabolismSugar_;
        Quantity metabolismSpice_;
        int vision_;
        Coord location_;

        std::vector<TradeLogEntry> tradeLog_;
        std::vector<double> priceHistory_;

        std::unique_ptr<MemoryLog> memory_;
        ToolRegistry tools_;
        std::shared_ptr<DecisionMaker> decisionMaker_;
    };

    // Creates traders with randomized endowments drawn from the config ranges
    class TraderFactory {
    public:
        static std::unique_ptr<Trader> create(AgentId id,
            const RuntimeConfig& cfg,
            Random& random,
            std::shared_ptr<DecisionMaker> decisionMaker);
    };

} // namespace scape
