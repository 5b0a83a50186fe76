#pragma once

#include "core/Types.hpp"
#include "core/Grid.hpp"
#include "core/Resource.hpp"
#include "core/RuntimeConfig.hpp"
#include "agents/Trader.hpp"
#include "agents/DecisionMaker.hpp"
#include "memory/DialogueExtractor.hpp"
#include "engine/TradeProtocol.hpp"
#include "engine/MetricsCollector.hpp"
#include "utils/Random.hpp"
#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <vector>

namespace scape {

    enum class TickStatus {
        COMPLETED,
        ABORTED     // stopped between two activations; metrics not emitted
    };

    struct EngineStats {
        uint64_t ticks = 0;
        uint64_t activations = 0;
        uint64_t invalidActions = 0;
        uint64_t noDecisions = 0;
        uint64_t failures = 0;
        uint64_t trades = 0;
    };

    // Owns the world (grid, resources, traders) and advances it one tick at
    // a time. Everything that mutates state runs on the calling thread.
    class ScapeEngine : public AgentDirectory {
    public:
        explicit ScapeEngine(const RuntimeConfig& cfg);

        using DecisionMakerFactory = std::function<std::shared_ptr<DecisionMaker>(AgentId)>;

        // Random resources and traders per the config; all draws come from
        // the engine's seeded source. Without a factory every trader shares
        // one RuleBasedDecisionMaker.
        void populate(DecisionMakerFactory factory = nullptr);

        // World construction
        Resource& addResource(GoodKind kind, Quantity capacity, Quantity amount,
            Quantity growback, const Coord& at);
        Trader& addTrader(std::unique_ptr<Trader> trader, const Coord& at);
        AgentId nextId() { return nextId_++; }

        // Access
        const RuntimeConfig& getConfig() const { return cfg_; }
        Grid& getGrid() { return grid_; }
        const Grid& getGrid() const { return grid_; }
        Random& getRandom() { return random_; }
        const TradeProtocol& getTradeProtocol() const { return tradeProtocol_; }
        const std::vector<std::unique_ptr<Trader>>& getTraders() const { return traders_; }
        const std::vector<std::unique_ptr<Resource>>& getResources() const { return resources_; }
        Trader* getTrader(AgentId id) const;
        Resource* getResource(ObjectId id) const;
        std::vector<Resource*> resourcesAt(const Coord& c) const;

        // Traders inside `trader`'s vision
        std::vector<Trader*> visibleTraders(const Trader& trader) const;

        // Traders each within the other's vision
        std::vector<Trader*> tradeCandidates(const Trader& trader) const;

        std::optional<std::string> kindOf(AgentId id) const override;

        // Process one simulation tick
        TickStatus tick();

        // Takes effect before the next activation, never mid-negotiation
        void requestAbort() { abortRequested_ = true; }
        void clearAbort() { abortRequested_ = false; }
        bool isAbortRequested() const { return abortRequested_.load(); }

        // Observation handed to the decision-maker
        Observation observe(const Trader& trader) const;

        // Validates and executes; throws InvalidAction and leaves state untouched
        void applyAction(Trader& trader, const Action& action);

        // Deliver a message whose sender is a bare id (resolved on read)
        void postMessage(AgentId from, AgentId to, const std::string& text);

        ModelSnapshot snapshot() const;

        Step getStep() const { return step_; }
        const HarvestTotals& getStepHarvest() const { return stepHarvest_; }
        const HarvestTotals& getTotalHarvest() const { return totalHarvest_; }
        const EngineStats& getStats() const { return stats_; }

        // Sinks are not owned
        void addMetricsSink(MetricsSink* sink) { sinks_.push_back(sink); }

        using TradeCallback = std::function<void(const TradeRecord&)>;
        void setTradeCallback(TradeCallback cb) { tradeCallback_ = std::move(cb); }

    private:
        RuntimeConfig cfg_;
        Grid grid_;
        Random random_;
        TradeProtocol tradeProtocol_;
        DialogueExtractor dialogueExtractor_;

        std::vector<std::unique_ptr<Resource>> resources_;
        std::vector<std::unique_ptr<Trader>> traders_;
        std::map<ObjectId, size_t> traderIndex_;
        std::map<ObjectId, size_t> resourceIndex_;
        std::map<AgentId, bool> tradeStalled_;
        AgentId nextId_ = 1;

        Step step_ = 0;
        HarvestTotals stepHarvest_;
        HarvestTotals totalHarvest_;
        EngineStats stats_;
        std::atomic<bool> abortRequested_{ false };

        std::vector<MetricsSink*> sinks_;
        TradeCallback tradeCallback_;

        // One observe -> decide -> act cycle, isolated from other agents
        void activate(Trader& trader);
        void runSequential(const std::vector<size_t>& order, TickStatus& status);
        void runParallel(const std::vector<size_t>& order, TickStatus& status);
        void applyDecision(Trader& trader, const std::function<Action()>& decide);

        void doMove(Trader& trader, const Action& action);
        void doHarvest(Trader& trader);
        void doTrade(Trader& trader, const Action& action);
        void doSpeak(Trader& trader, const Action& action);

        void remember(Trader& trader, const std::string& type, std::string text,
            std::optional<DialogueMessage> message = std::nullopt);
    };

} // namespace scape
