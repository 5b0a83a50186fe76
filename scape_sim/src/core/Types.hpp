#pragma once

#include <string>
#include <cstdint>
#include <optional>
#include <variant>
#include <vector>
#include <map>

namespace scape {

    using Quantity = int64_t;
    using ObjectId = uint64_t;
    using AgentId = ObjectId;
    using Step = uint64_t;

    // Good A is sugar, good B is spice
    enum class GoodKind {
        SUGAR,
        SPICE
    };

    inline const char* toString(GoodKind kind) {
        return kind == GoodKind::SUGAR ? "sugar" : "spice";
    }

    struct Coord {
        int x = 0;
        int y = 0;

        bool operator==(const Coord& other) const { return x == other.x && y == other.y; }
        bool operator!=(const Coord& other) const { return !(*this == other); }

        // Column-major: x first, then y
        bool operator<(const Coord& other) const {
            return x != other.x ? x < other.x : y < other.y;
        }
    };

    inline int chebyshev(const Coord& a, const Coord& b) {
        int dx = a.x > b.x ? a.x - b.x : b.x - a.x;
        int dy = a.y > b.y ? a.y - b.y : b.y - a.y;
        return dx > dy ? dx : dy;
    }

    enum class ActionKind {
        MOVE,
        HARVEST,
        TRADE,
        SPEAK,
        IDLE
    };

    inline const char* toString(ActionKind kind) {
        switch (kind) {
        case ActionKind::MOVE: return "move";
        case ActionKind::HARVEST: return "harvest";
        case ActionKind::TRADE: return "trade";
        case ActionKind::SPEAK: return "speak";
        case ActionKind::IDLE: return "idle";
        }
        return "unknown";
    }

    inline std::optional<ActionKind> actionKindFromString(const std::string& name) {
        if (name == "move") return ActionKind::MOVE;
        if (name == "harvest") return ActionKind::HARVEST;
        if (name == "trade") return ActionKind::TRADE;
        if (name == "speak") return ActionKind::SPEAK;
        if (name == "idle") return ActionKind::IDLE;
        return std::nullopt;
    }

    // One structured decision returned by the decision-maker
    struct Action {
        ActionKind kind = ActionKind::IDLE;
        std::optional<Coord> target;        // MOVE
        std::vector<AgentId> partners;      // TRADE (empty = every eligible neighbour), SPEAK
        std::string message;                // SPEAK
    };

    // Ephemeral result of one executed trade increment
    struct TradeRecord {
        AgentId sugarBuyer;
        AgentId sugarSeller;
        Quantity sugar;     // moved seller -> buyer
        Quantity spice;     // moved buyer -> seller
        double price;       // realized sugar per unit of spice
        Step step;
    };

    // Per-trader log line
    struct TradeLogEntry {
        AgentId partner;
        double price;
        Quantity sugarDelta;    // signed, from the owner's point of view
        Quantity spiceDelta;
        Step step;
    };

    // Sender already resolved when the message was written
    struct ResolvedSender {
        std::string kind;
        AgentId id;
    };

    // Bare identity; kind is looked up at read time
    struct RawSenderId {
        AgentId id;
    };

    using Sender = std::variant<ResolvedSender, RawSenderId>;

    struct DialogueMessage {
        Sender sender;
        std::string text;
    };

    struct MemoryEntry {
        Step step = 0;
        std::string type;                       // "observation", "action", "message", ...
        std::string text;
        std::optional<DialogueMessage> message; // set only for dialogue
    };

    struct HarvestTotals {
        Quantity sugar = 0;
        Quantity spice = 0;
    };

    struct ResourceSnapshot {
        ObjectId id;
        Coord location;
        GoodKind kind;
        Quantity amount;
        Quantity capacity;
    };

    struct TraderSnapshot {
        AgentId id;
        Coord location;
        Quantity sugar;
        Quantity spice;
        std::optional<double> mrs;
        size_t trades;
        std::vector<AgentId> tradePartners;
        std::vector<double> prices;
    };

    // Read-only state handed to the metrics sink once per tick
    struct ModelSnapshot {
        Step step = 0;
        int width = 0;
        int height = 0;
        std::vector<TraderSnapshot> traders;
        std::vector<ResourceSnapshot> resources;
        HarvestTotals stepHarvest;
        HarvestTotals totalHarvest;
    };

} // namespace scape
