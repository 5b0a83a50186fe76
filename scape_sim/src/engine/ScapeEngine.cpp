#include "ScapeEngine.hpp"
#include "core/Errors.hpp"
#include "utils/Logger.hpp"
#include <algorithm>
#include <future>
#include <numeric>
#include <set>
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace scape {

    ScapeEngine::ScapeEngine(const RuntimeConfig& cfg)
        : cfg_(cfg)
        , grid_(cfg.world.width, cfg.world.height)
        , random_(cfg.simulation.seed)
        , tradeProtocol_(cfg.trade)
        , dialogueExtractor_(this)
    {
    }

    void ScapeEngine::populate(DecisionMakerFactory factory) {
        auto problems = cfg_.validate();
        if (!problems.empty()) {
            throw std::invalid_argument("Cannot populate: " + problems.front());
        }

        const auto& w = cfg_.world;

        for (int i = 0; i < w.initialResources; ++i) {
            Quantity capacity = random_.uniformInt(w.capacityMin, w.capacityMax);
            GoodKind kind = random_.bernoulli(0.5) ? GoodKind::SUGAR : GoodKind::SPICE;
            Coord at{ random_.uniformInt(0, w.width - 1), random_.uniformInt(0, w.height - 1) };
            addResource(kind, capacity, capacity, w.growback, at);
        }

        std::shared_ptr<DecisionMaker> shared;
        if (!factory) {
            shared = std::make_shared<RuleBasedDecisionMaker>(cfg_.trade.mrsTolerance);
        }

        for (int i = 0; i < cfg_.traders.initialTraders; ++i) {
            AgentId id = nextId();
            auto dm = factory ? factory(id) : shared;
            auto trader = TraderFactory::create(id, cfg_, random_, std::move(dm));
            Coord at{ random_.uniformInt(0, w.width - 1), random_.uniformInt(0, w.height - 1) };
            addTrader(std::move(trader), at);
        }

        Logger::info("Populated {}x{} grid with {} resources and {} traders",
            w.width, w.height, resources_.size(), traders_.size());
    }

    Resource& ScapeEngine::addResource(GoodKind kind, Quantity capacity, Quantity amount,
        Quantity growback, const Coord& at) {
        ObjectId id = nextId();
        auto resource = std::make_unique<Resource>(id, kind, capacity, amount, growback);
        grid_.place(id, at);
        resourceIndex_[id] = resources_.size();
        resources_.push_back(std::move(resource));
        return *resources_.back();
    }

    Trader& ScapeEngine::addTrader(std::unique_ptr<Trader> trader, const Coord& at) {
        AgentId id = trader->getId();
        if (traderIndex_.count(id) || resourceIndex_.count(id)) {
            throw std::invalid_argument(fmt::format("Object id {} already in use", id));
        }
        grid_.place(id, at);
        trader->setLocation(at);
        nextId_ = std::max(nextId_, id + 1);
        traderIndex_[id] = traders_.size();
        traders_.push_back(std::move(trader));
        return *traders_.back();
    }

    Trader* ScapeEngine::getTrader(AgentId id) const {
        auto it = traderIndex_.find(id);
        return it != traderIndex_.end() ? traders_[it->second].get() : nullptr;
    }

    Resource* ScapeEngine::getResource(ObjectId id) const {
        auto it = resourceIndex_.find(id);
        return it != resourceIndex_.end() ? resources_[it->second].get() : nullptr;
    }

    std::vector<Resource*> ScapeEngine::resourcesAt(const Coord& c) const {
        std::vector<Resource*> result;
        for (ObjectId id : grid_.cellContents(c)) {
            if (auto* r = getResource(id)) {
                result.push_back(r);
            }
        }
        return result;
    }

    std::vector<Trader*> ScapeEngine::visibleTraders(const Trader& trader) const {
        std::vector<Trader*> result;
        for (ObjectId id : grid_.neighbors(trader.getLocation(), trader.getVision(), trader.getId())) {
            if (auto* t = getTrader(id)) {
                result.push_back(t);
            }
        }
        return result;
    }

    std::vector<Trader*> ScapeEngine::tradeCandidates(const Trader& trader) const {
        std::vector<Trader*> result;
        for (Trader* other : visibleTraders(trader)) {
            if (chebyshev(trader.getLocation(), other->getLocation()) <= other->getVision()) {
                result.push_back(other);
            }
        }
        return result;
    }

    std::optional<std::string> ScapeEngine::kindOf(AgentId id) const {
        if (auto* t = getTrader(id)) return t->getType();
        if (getResource(id)) return std::string("Resource");
        return std::nullopt;
    }

    // ---- Tick ---------------------------------------------------------------------

    TickStatus ScapeEngine::tick() {
        step_++;
        stats_.ticks++;
        stepHarvest_ = HarvestTotals{};

        for (auto& resource : resources_) {
            resource->regrow();
        }

        std::vector<size_t> order(traders_.size());
        std::iota(order.begin(), order.end(), 0);
        random_.shuffle(order);

        TickStatus status = TickStatus::COMPLETED;
        if (cfg_.simulation.parallelDecisions) {
            runParallel(order, status);
        }
        else {
            runSequential(order, status);
        }

        if (status == TickStatus::ABORTED) {
            Logger::warn("Tick {} aborted between activations", step_);
            return status;
        }

        if (!sinks_.empty()) {
            ModelSnapshot snap = snapshot();
            for (auto* sink : sinks_) {
                sink->onTick(snap);
            }
        }

        int every = cfg_.simulation.metricsLogEvery;
        if (every > 0 && step_ % static_cast<Step>(every) == 0) {
            Logger::info("Tick {}: {} trades, harvested {} sugar / {} spice, {} invalid actions, {} missing decisions",
                step_, stats_.trades, stepHarvest_.sugar, stepHarvest_.spice,
                stats_.invalidActions, stats_.noDecisions);
        }
        return status;
    }

    void ScapeEngine::runSequential(const std::vector<size_t>& order, TickStatus& status) {
        for (size_t idx : order) {
            if (abortRequested_.load()) {
                status = TickStatus::ABORTED;
                return;
            }
            activate(*traders_[idx]);
        }
    }

    void ScapeEngine::runParallel(const std::vector<size_t>& order, TickStatus& status) {
        // Every observation is taken from the same post-regrowth state
        std::vector<Observation> observations;
        observations.reserve(order.size());
        for (size_t idx : order) {
            observations.push_back(observe(*traders_[idx]));
            remember(*traders_[idx], "observation", observations.back().context);
        }

        std::vector<std::future<Action>> decisions;
        decisions.reserve(order.size());
        for (size_t i = 0; i < order.size(); ++i) {
            DecisionMaker* dm = traders_[order[i]]->getDecisionMaker();
            const Observation* obs = &observations[i];
            decisions.push_back(std::async(std::launch::async, [dm, obs]() -> Action {
                if (!dm) throw NoDecision(fmt::format("Agent {} has no decision maker", obs->self));
                return dm->decide(*obs);
            }));
        }

        // Mutation stays on this thread, in activation order
        for (size_t i = 0; i < order.size(); ++i) {
            if (abortRequested_.load()) {
                status = TickStatus::ABORTED;
                for (size_t j = i; j < decisions.size(); ++j) {
                    decisions[j].wait();
                }
                return;
            }
            Trader& trader = *traders_[order[i]];
            auto& future = decisions[i];
            applyDecision(trader, [&future]() { return future.get(); });
        }
    }

    void ScapeEngine::activate(Trader& trader) {
        applyDecision(trader, [this, &trader]() {
            Observation obs = observe(trader);
            remember(trader, "observation", obs.context);
            DecisionMaker* dm = trader.getDecisionMaker();
            if (!dm) {
                throw NoDecision(fmt::format("Agent {} has no decision maker", trader.getId()));
            }
            return dm->decide(obs);
            });
    }

    void ScapeEngine::applyDecision(Trader& trader, const std::function<Action()>& decide) {
        stats_.activations++;
        try {
            Action action = decide();
            applyAction(trader, action);
        }
        catch (const NoDecision& e) {
            stats_.noDecisions++;
            Logger::warn("Step {}: agent {} skipped, no decision ({})", step_, trader.getId(), e.what());
        }
        catch (const InvalidAction& e) {
            stats_.invalidActions++;
            Logger::warn("Step {}: agent {} invalid action ignored ({})", step_, trader.getId(), e.what());
        }
        catch (const std::exception& e) {
            stats_.failures++;
            Logger::warn("Step {}: agent {} activation failed: {}", step_, trader.getId(), e.what());
        }
    }

    Observation ScapeEngine::observe(const Trader& trader) const {
        Observation obs;
        obs.self = trader.getId();
        obs.step = step_;
        obs.location = trader.getLocation();
        obs.sugar = trader.getSugar();
        obs.spice = trader.getSpice();
        obs.metabolismSugar = trader.getMetabolismSugar();
        obs.metabolismSpice = trader.getMetabolismSpice();
        obs.mrs = trader.tryMrs();
        obs.vision = trader.getVision();
        obs.gridWidth = grid_.getWidth();
        obs.gridHeight = grid_.getHeight();
        obs.allowedActions = trader.getTools().kinds();

        auto stalled = tradeStalled_.find(trader.getId());
        obs.tradeStalled = stalled != tradeStalled_.end() && stalled->second;

        for (ObjectId id : grid_.neighbors(trader.getLocation(), trader.getVision(), trader.getId())) {
            if (const auto* r = getResource(id)) {
                obs.visibleResources.push_back(r->snapshot(*grid_.locate(id)));
            }
            else if (const auto* t = getTrader(id)) {
                obs.visibleTraders.push_back({ t->getId(), t->getLocation(), t->getSugar(), t->getSpice(), t->tryMrs() });
            }
        }

        obs.dialogue = dialogueExtractor_.digest(trader, static_cast<size_t>(std::max(0, cfg_.traders.dialogueMessages)));
        obs.context = "DIALOGUE HISTORY:\n" + obs.dialogue + "\n\nINSTRUCTIONS:\n" + cfg_.traders.stepPrompt;
        return obs;
    }

    // ---- Actions ------------------------------------------------------------------

    void ScapeEngine::applyAction(Trader& trader, const Action& action) {
        if (!trader.getTools().allows(action.kind)) {
            throw InvalidAction(fmt::format("'{}' is not registered for agent {}",
                toString(action.kind), trader.getId()));
        }

        switch (action.kind) {
        case ActionKind::MOVE: doMove(trader, action); break;
        case ActionKind::HARVEST: doHarvest(trader); break;
        case ActionKind::TRADE: doTrade(trader, action); break;
        case ActionKind::SPEAK: doSpeak(trader, action); break;
        case ActionKind::IDLE:
            remember(trader, "action", "idle");
            break;
        }

        if (action.kind != ActionKind::TRADE) {
            tradeStalled_[trader.getId()] = false;
        }
    }

    void ScapeEngine::doMove(Trader& trader, const Action& action) {
        if (!action.target) {
            throw InvalidAction("move without a target");
        }
        const Coord& to = *action.target;
        if (!grid_.inBounds(to)) {
            throw InvalidAction(fmt::format("move target ({}, {}) is out of bounds", to.x, to.y));
        }
        if (chebyshev(trader.getLocation(), to) != 1) {
            throw InvalidAction(fmt::format("move target ({}, {}) is not adjacent to ({}, {})",
                to.x, to.y, trader.getLocation().x, trader.getLocation().y));
        }

        grid_.move(trader.getId(), to);
        trader.setLocation(to);
        remember(trader, "action", fmt::format("moved to ({}, {})", to.x, to.y));
    }

    void ScapeEngine::doHarvest(Trader& trader) {
        HarvestTotals taken = trader.harvestAt(resourcesAt(trader.getLocation()));

        stepHarvest_.sugar += taken.sugar;
        stepHarvest_.spice += taken.spice;
        totalHarvest_.sugar += taken.sugar;
        totalHarvest_.spice += taken.spice;

        remember(trader, "action", fmt::format("harvested {} sugar and {} spice", taken.sugar, taken.spice));
    }

    void ScapeEngine::doTrade(Trader& trader, const Action& action) {
        auto candidates = tradeCandidates(trader);

        std::vector<Trader*> partners;
        if (action.partners.empty()) {
            partners = candidates;
        }
        else {
            // Validate every partner before any goods move
            std::set<AgentId> seen;
            for (AgentId id : action.partners) {
                auto it = std::find_if(candidates.begin(), candidates.end(),
                    [id](const Trader* t) { return t->getId() == id; });
                if (it == candidates.end()) {
                    throw InvalidAction(fmt::format("agent {} is not a trade partner within mutual vision", id));
                }
                if (seen.insert(id).second) {
                    partners.push_back(*it);
                }
            }
        }

        size_t executed = 0;
        for (Trader* partner : partners) {
            auto result = tradeProtocol_.negotiate(trader, *partner, step_);
            executed += result.trades.size();
            stats_.trades += result.trades.size();

            for (const auto& record : result.trades) {
                if (tradeCallback_) tradeCallback_(record);
            }

            if (!result.trades.empty()) {
                std::string summary = fmt::format("traded {} increments with {} (last price {:.3f}, {})",
                    result.trades.size(), partner->getId(), result.trades.back().price, toString(result.stop));
                remember(trader, "trade", summary);
                remember(*partner, "trade", fmt::format("traded {} increments with {} (last price {:.3f})",
                    result.trades.size(), trader.getId(), result.trades.back().price));
            }
        }

        tradeStalled_[trader.getId()] = (executed == 0);
        if (executed == 0) {
            remember(trader, "action", "trade attempted, no mutually improving exchange");
        }
    }

    void ScapeEngine::doSpeak(Trader& trader, const Action& action) {
        if (action.partners.empty()) {
            throw InvalidAction("speak without recipients");
        }
        if (action.message.empty()) {
            throw InvalidAction("speak with an empty message");
        }

        auto visible = visibleTraders(trader);
        std::vector<Trader*> recipients;
        for (AgentId id : action.partners) {
            auto it = std::find_if(visible.begin(), visible.end(),
                [id](const Trader* t) { return t->getId() == id; });
            if (it == visible.end()) {
                throw InvalidAction(fmt::format("agent {} is not within vision of {}", id, trader.getId()));
            }
            recipients.push_back(*it);
        }

        DialogueMessage message{ ResolvedSender{ trader.getType(), trader.getId() }, action.message };
        for (Trader* r : recipients) {
            remember(*r, "message", action.message, message);
        }
        remember(trader, "message", action.message, message);
    }

    void ScapeEngine::postMessage(AgentId from, AgentId to, const std::string& text) {
        Trader* recipient = getTrader(to);
        if (!recipient) {
            throw NotPresent(fmt::format("No trader with id {}", to));
        }
        remember(*recipient, "message", text, DialogueMessage{ RawSenderId{ from }, text });
    }

    void ScapeEngine::remember(Trader& trader, const std::string& type, std::string text,
        std::optional<DialogueMessage> message) {
        MemoryEntry entry;
        entry.step = step_;
        entry.type = type;
        entry.text = std::move(text);
        entry.message = std::move(message);
        trader.getMemory().record(std::move(entry));
    }

    ModelSnapshot ScapeEngine::snapshot() const {
        ModelSnapshot snap;
        snap.step = step_;
        snap.width = grid_.getWidth();
        snap.height = grid_.getHeight();
        snap.stepHarvest = stepHarvest_;
        snap.totalHarvest = totalHarvest_;

        for (const auto& t : traders_) {
            snap.traders.push_back(t->snapshot());
        }
        for (const auto& r : resources_) {
            snap.resources.push_back(r->snapshot(*grid_.locate(r->getId())));
        }
        return snap;
    }

} // namespace scape
