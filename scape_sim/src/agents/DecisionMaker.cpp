#include "DecisionMaker.hpp"
#include "core/Errors.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <spdlog/fmt/fmt.h>

namespace scape {

    bool Observation::allows(ActionKind kind) const {
        return std::find(allowedActions.begin(), allowedActions.end(), kind) != allowedActions.end();
    }

    nlohmann::json Observation::toJson() const {
        nlohmann::json j;
        j["self"] = self;
        j["step"] = step;
        j["location"] = { location.x, location.y };
        j["sugar"] = sugar;
        j["spice"] = spice;
        j["metabolism"] = { {"sugar", metabolismSugar}, {"spice", metabolismSpice} };
        j["mrs"] = mrs ? nlohmann::json(*mrs) : nlohmann::json(nullptr);
        j["vision"] = vision;
        j["grid"] = { {"width", gridWidth}, {"height", gridHeight} };
        j["tradeStalled"] = tradeStalled;

        nlohmann::json resources = nlohmann::json::array();
        for (const auto& r : visibleResources) {
            resources.push_back({
                {"id", r.id},
                {"location", {r.location.x, r.location.y}},
                {"kind", toString(r.kind)},
                {"amount", r.amount},
                {"capacity", r.capacity}
            });
        }
        j["resources"] = resources;

        nlohmann::json traders = nlohmann::json::array();
        for (const auto& t : visibleTraders) {
            traders.push_back({
                {"id", t.id},
                {"location", {t.location.x, t.location.y}},
                {"sugar", t.sugar},
                {"spice", t.spice},
                {"mrs", t.mrs ? nlohmann::json(*t.mrs) : nlohmann::json(nullptr)}
            });
        }
        j["traders"] = traders;

        nlohmann::json allowed = nlohmann::json::array();
        for (auto kind : allowedActions) {
            allowed.push_back(toString(kind));
        }
        j["allowedActions"] = allowed;
        j["context"] = context;
        return j;
    }

    // ---- RuleBasedDecisionMaker -------------------------------------------------

    RuleBasedDecisionMaker::RuleBasedDecisionMaker(double mrsTolerance)
        : mrsTolerance_(mrsTolerance)
    {
    }

    std::optional<GoodKind> RuleBasedDecisionMaker::shortGood(const Observation& obs) const {
        if (obs.metabolismSugar <= 0 || obs.metabolismSpice <= 0) return std::nullopt;
        double sugarRatio = static_cast<double>(obs.sugar) / obs.metabolismSugar;
        double spiceRatio = static_cast<double>(obs.spice) / obs.metabolismSpice;
        return sugarRatio <= spiceRatio ? GoodKind::SUGAR : GoodKind::SPICE;
    }

    Action RuleBasedDecisionMaker::decide(const Observation& obs) {
        Action action;
        auto wanted = shortGood(obs);

        // 1. Harvest what we need if it is right here
        if (wanted && obs.allows(ActionKind::HARVEST)) {
            for (const auto& r : obs.visibleResources) {
                if (r.location == obs.location && r.kind == *wanted && r.amount > 0) {
                    action.kind = ActionKind::HARVEST;
                    return action;
                }
            }
        }

        // 2. Trade while a visible partner still values the goods differently
        if (obs.mrs && !obs.tradeStalled && obs.allows(ActionKind::TRADE)) {
            for (const auto& t : obs.visibleTraders) {
                if (t.mrs && std::abs(*t.mrs - *obs.mrs) > mrsTolerance_) {
                    action.kind = ActionKind::TRADE;
                    return action;
                }
            }
        }

        // 3. Step toward the nearest visible resource of the short good
        if (wanted && obs.allows(ActionKind::MOVE)) {
            const ResourceSnapshot* best = nullptr;
            int bestDist = std::numeric_limits<int>::max();
            for (const auto& r : obs.visibleResources) {
                if (r.kind != *wanted || r.amount <= 0) continue;
                int d = chebyshev(obs.location, r.location);
                if (d > 0 && d < bestDist) {
                    best = &r;
                    bestDist = d;
                }
            }
            if (best) {
                auto sign = [](int v) { return (v > 0) - (v < 0); };
                action.kind = ActionKind::MOVE;
                action.target = Coord{
                    obs.location.x + sign(best->location.x - obs.location.x),
                    obs.location.y + sign(best->location.y - obs.location.y)
                };
                return action;
            }
        }

        if (!obs.allows(ActionKind::IDLE)) {
            throw NoDecision(fmt::format("Agent {}: no applicable action", obs.self));
        }
        action.kind = ActionKind::IDLE;
        return action;
    }

    // ---- RandomDecisionMaker ----------------------------------------------------

    namespace {
        // splitmix64 finalizer
        uint64_t mix(uint64_t x) {
            x += 0x9E3779B97F4A7C15ULL;
            x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ULL;
            x = (x ^ (x >> 27)) * 0x94D049BB133111EBULL;
            return x ^ (x >> 31);
        }
    }

    RandomDecisionMaker::RandomDecisionMaker(uint64_t seed)
        : seed_(seed)
    {
    }

    Action RandomDecisionMaker::decide(const Observation& obs) {
        if (obs.allowedActions.empty()) {
            throw NoDecision(fmt::format("Agent {}: no allowed actions", obs.self));
        }

        Random random(mix(mix(seed_ ^ obs.self) ^ obs.step));

        Action action;
        int pick = random.uniformInt(0, static_cast<int>(obs.allowedActions.size()) - 1);
        action.kind = obs.allowedActions[pick];

        switch (action.kind) {
        case ActionKind::MOVE: {
            int dx = 0;
            int dy = 0;
            while (dx == 0 && dy == 0) {
                dx = random.uniformInt(-1, 1);
                dy = random.uniformInt(-1, 1);
            }
            // May step off the grid; the engine rejects that as InvalidAction
            action.target = Coord{ obs.location.x + dx, obs.location.y + dy };
            break;
        }
        case ActionKind::SPEAK: {
            if (obs.visibleTraders.empty()) {
                action.kind = ActionKind::IDLE;
                break;
            }
            int idx = random.uniformInt(0, static_cast<int>(obs.visibleTraders.size()) - 1);
            action.partners.push_back(obs.visibleTraders[idx].id);
            action.message = obs.mrs
                ? fmt::format("My MRS is {:.3f}. Shall we trade?", *obs.mrs)
                : std::string("I am out of spice. Can you help?");
            break;
        }
        default:
            break;
        }
        return action;
    }

} // namespace scape
