#pragma once

#include "core/Types.hpp"
#include "utils/Random.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace scape {

    struct VisibleTrader {
        AgentId id;
        Coord location;
        Quantity sugar;
        Quantity spice;
        std::optional<double> mrs;
    };

    // What an agent perceives at the start of its activation
    struct Observation {
        AgentId self = 0;
        Step step = 0;
        Coord location;
        Quantity sugar = 0;
        Quantity spice = 0;
        Quantity metabolismSugar = 1;
        Quantity metabolismSpice = 1;
        std::optional<double> mrs;
        int vision = 0;
        int gridWidth = 0;
        int gridHeight = 0;
        bool tradeStalled = false;  // last TRADE action moved no goods
        std::vector<ResourceSnapshot> visibleResources;
        std::vector<VisibleTrader> visibleTraders;
        std::vector<ActionKind> allowedActions;
        std::string dialogue;   // digest from the dialogue extractor
        std::string context;    // dialogue + instructions, as handed to a planner

        bool allows(ActionKind kind) const;
        nlohmann::json toJson() const;
    };

    // External collaborator that turns an observation into one action.
    // Implementations throw NoDecision on failure or timeout. In parallel
    // decision mode decide() is called concurrently and must be reentrant.
    class DecisionMaker {
    public:
        virtual ~DecisionMaker() = default;
        virtual Action decide(const Observation& obs) = 0;
        virtual std::string getName() const = 0;
    };

    // Deterministic stand-in for the planner: trade when a visible partner's
    // MRS differs, otherwise harvest or walk toward a good we are short of.
    class RuleBasedDecisionMaker : public DecisionMaker {
    public:
        explicit RuleBasedDecisionMaker(double mrsTolerance = 1e-3);

        Action decide(const Observation& obs) override;
        std::string getName() const override { return "RuleBased"; }

    private:
        double mrsTolerance_;

        std::optional<GoodKind> shortGood(const Observation& obs) const;
    };

    // Uniform choice over the allowed actions. Each draw is seeded from
    // (seed, agent, step), so one instance may be shared by every trader and
    // the result does not depend on the order concurrent decide() calls run.
    class RandomDecisionMaker : public DecisionMaker {
    public:
        explicit RandomDecisionMaker(uint64_t seed);

        Action decide(const Observation& obs) override;
        std::string getName() const override { return "Random"; }

    private:
        uint64_t seed_;
    };

} // namespace scape
