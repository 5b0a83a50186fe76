#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "core/RuntimeConfig.hpp"
#include "agents/ToolRegistry.hpp"

using namespace scape;
using Catch::Approx;

TEST_CASE("RuntimeConfig: Defaults", "[config]") {
    RuntimeConfig cfg;
    REQUIRE(cfg.simulation.seed == 42);
    REQUIRE(cfg.world.width == 10);
    REQUIRE(cfg.traders.memoryKind == "short_term");
    REQUIRE(cfg.trade.mrsTolerance == Approx(1e-3));
    REQUIRE(cfg.trade.maxIterations == 200);
    REQUIRE(cfg.trade.quantum == 1);
}

TEST_CASE("RuntimeConfig: JSON round trip", "[config]") {
    RuntimeConfig cfg;
    cfg.simulation.seed = 7;
    cfg.world.height = 33;
    cfg.traders.stepPrompt = "Trade wisely.";
    cfg.trade.mrsTolerance = 0.05;
    cfg.logging.console = false;

    RuntimeConfig copy;
    copy.fromJson(cfg.toJson());

    REQUIRE(copy.simulation.seed == 7);
    REQUIRE(copy.world.height == 33);
    REQUIRE(copy.traders.stepPrompt == "Trade wisely.");
    REQUIRE(copy.trade.mrsTolerance == Approx(0.05));
    REQUIRE_FALSE(copy.logging.console);
    REQUIRE(copy.toJson() == cfg.toJson());
}

TEST_CASE("RuntimeConfig: fromJson only touches keys that are present", "[config]") {
    RuntimeConfig cfg;
    cfg.fromJson(nlohmann::json::parse(R"({
        "world": { "width": 25 },
        "trade": { "maxIterations": 10 },
        "unknownSection": { "x": 1 }
    })"));

    REQUIRE(cfg.world.width == 25);
    REQUIRE(cfg.world.height == 10);
    REQUIRE(cfg.trade.maxIterations == 10);
    REQUIRE(cfg.trade.quantum == 1);
    REQUIRE(cfg.simulation.seed == 42);
}

TEST_CASE("RuntimeConfig: Wrong value types throw", "[config]") {
    RuntimeConfig cfg;
    auto bad = nlohmann::json::parse(R"({ "world": { "width": "wide" } })");
    REQUIRE_THROWS(cfg.fromJson(bad));
}

TEST_CASE("RuntimeConfig: Inverted ranges are reported", "[config]") {
    RuntimeConfig cfg;
    REQUIRE(cfg.validate().empty());

    cfg.world.capacityMin = 6;
    cfg.world.capacityMax = 2;
    cfg.traders.metabolismMin = 0;
    auto problems = cfg.validate();
    REQUIRE(problems.size() == 2);
    REQUIRE(problems[0].find("world.capacityMin (6)") != std::string::npos);
    REQUIRE(problems[1].find("traders.metabolismMin") != std::string::npos);

    RuntimeConfig empty;
    empty.world.width = 0;
    REQUIRE(empty.validate().size() == 1);
}

TEST_CASE("ToolRegistry: Per-agent registries are independent", "[config]") {
    ToolRegistry a = ToolRegistry::traderDefaults();
    ToolRegistry b = ToolRegistry::traderDefaults();

    a.remove(ActionKind::SPEAK);
    REQUIRE_FALSE(a.allows(ActionKind::SPEAK));
    REQUIRE(b.allows(ActionKind::SPEAK));
    REQUIRE(b.kinds().size() == 5);
    REQUIRE(a.specs().size() == 4);

    ToolRegistry empty;
    REQUIRE(empty.empty());
    empty.add(ActionKind::IDLE, "wait");
    REQUIRE(empty.kinds() == std::vector<ActionKind>{ ActionKind::IDLE });
}

TEST_CASE("ActionKind: Name conversions", "[config]") {
    REQUIRE(std::string(toString(ActionKind::HARVEST)) == "harvest");
    REQUIRE(actionKindFromString("trade") == ActionKind::TRADE);
    REQUIRE_FALSE(actionKindFromString("teleport").has_value());
}
