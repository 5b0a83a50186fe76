#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "agents/Trader.hpp"
#include "core/Errors.hpp"
#include "utils/Random.hpp"

using namespace scape;
using Catch::Approx;

namespace {
    std::unique_ptr<Trader> makeTrader(AgentId id, Quantity sugar, Quantity spice,
        Quantity metSugar = 1, Quantity metSpice = 1) {
        return std::make_unique<Trader>(id, sugar, spice, metSugar, metSpice, 2,
            std::make_unique<ShortTermMemory>());
    }
}

TEST_CASE("Trader: MRS is (sugar/metSugar) / (spice/metSpice)", "[trader]") {
    auto t = makeTrader(1, 10, 90);
    REQUIRE(t->computeMrs() == Approx(10.0 / 90.0));

    auto u = makeTrader(2, 30, 20, 3, 4);
    REQUIRE(u->computeMrs() == Approx((30.0 / 3.0) / (20.0 / 4.0)));
}

TEST_CASE("Trader: Zero spice makes MRS undefined", "[trader]") {
    auto t = makeTrader(1, 10, 0);
    REQUIRE_THROWS_AS(t->computeMrs(), DivisionUndefined);
    REQUIRE_FALSE(t->tryMrs().has_value());

    auto s = t->snapshot();
    REQUIRE_FALSE(s.mrs.has_value());
}

TEST_CASE("Trader: Zero sugar gives MRS 0", "[trader]") {
    auto t = makeTrader(1, 0, 10);
    REQUIRE(t->computeMrs() == 0.0);
}

TEST_CASE("Trader: Construction validates inputs", "[trader]") {
    REQUIRE_THROWS_AS(makeTrader(1, 10, 10, 0, 1), DivisionUndefined);
    REQUIRE_THROWS_AS(makeTrader(1, 10, 10, 1, -1), DivisionUndefined);
    REQUIRE_THROWS_AS(makeTrader(1, -1, 10), std::invalid_argument);

    Trader noMemory(3, 5, 5, 1, 1, 1, nullptr);
    REQUIRE(noMemory.getMemory().getKind() == "short_term");
    REQUIRE(noMemory.getType() == "Trader");
    REQUIRE(noMemory.getTools().allows(ActionKind::TRADE));
}

TEST_CASE("Trader: Shortage is judged against metabolism", "[trader]") {
    auto t = makeTrader(1, 10, 40, 1, 2);     // sugar covers 10 ticks, spice 20
    REQUIRE(t->isShortOf(GoodKind::SUGAR));
    REQUIRE_FALSE(t->isShortOf(GoodKind::SPICE));

    auto even = makeTrader(2, 20, 20);
    REQUIRE(even->isShortOf(GoodKind::SUGAR));
    REQUIRE(even->isShortOf(GoodKind::SPICE));
}

TEST_CASE("Trader: Harvest takes only goods in short supply", "[trader]") {
    auto t = makeTrader(1, 5, 50);
    Resource sugar(10, GoodKind::SUGAR, 4, 4);
    Resource spice(11, GoodKind::SPICE, 3, 3);

    auto taken = t->harvestAt({ &sugar, &spice });
    REQUIRE(taken.sugar == 4);
    REQUIRE(taken.spice == 0);
    REQUIRE(t->getSugar() == 9);
    REQUIRE(t->getSpice() == 50);
    REQUIRE(sugar.getAmount() == 0);
    REQUIRE(spice.getAmount() == 3);
}

TEST_CASE("Trader: Harvest on an empty cell changes nothing", "[trader]") {
    auto t = makeTrader(1, 5, 50);
    auto taken = t->harvestAt({});
    REQUIRE(taken.sugar == 0);
    REQUIRE(taken.spice == 0);
    REQUIRE(t->getSugar() == 5);
}

TEST_CASE("Trader: settleTrade applies each side and logs it", "[trader]") {
    auto seller = makeTrader(1, 90, 10);
    auto buyer = makeTrader(2, 10, 90);

    TradeRecord rec{ 2, 1, 3, 2, 1.5, 7 };
    seller->settleTrade(rec);
    buyer->settleTrade(rec);

    REQUIRE(seller->getSugar() == 87);
    REQUIRE(seller->getSpice() == 12);
    REQUIRE(buyer->getSugar() == 13);
    REQUIRE(buyer->getSpice() == 88);

    REQUIRE(seller->getTradeLog().size() == 1);
    REQUIRE(seller->getTradeLog()[0].partner == 2);
    REQUIRE(seller->getTradeLog()[0].sugarDelta == -3);
    REQUIRE(buyer->getTradeLog()[0].spiceDelta == -2);
    REQUIRE(buyer->getPriceHistory() == std::vector<double>{ 1.5 });
    REQUIRE(buyer->getTradePartners() == std::vector<AgentId>{ 1 });

    auto outsider = makeTrader(3, 5, 5);
    REQUIRE_THROWS_AS(outsider->settleTrade(rec), std::logic_error);
}

TEST_CASE("Trader: settleTrade refuses to overdraw", "[trader]") {
    auto seller = makeTrader(1, 2, 10);
    TradeRecord rec{ 2, 1, 3, 1, 3.0, 1 };
    REQUIRE_THROWS_AS(seller->settleTrade(rec), std::logic_error);
    REQUIRE(seller->getSugar() == 2);
    REQUIRE(seller->getTradeLog().empty());
}

TEST_CASE("TraderFactory: Endowments come from the configured ranges", "[trader]") {
    RuntimeConfig cfg;
    cfg.traders.sugarMin = 5;
    cfg.traders.sugarMax = 8;
    cfg.traders.spiceMin = 20;
    cfg.traders.spiceMax = 20;
    cfg.traders.metabolismMin = 1;
    cfg.traders.metabolismMax = 3;
    cfg.traders.memoryKind = "episodic";

    Random random(7);
    for (AgentId id = 1; id <= 20; ++id) {
        auto t = TraderFactory::create(id, cfg, random, nullptr);
        REQUIRE(t->getId() == id);
        REQUIRE(t->getSugar() >= 5);
        REQUIRE(t->getSugar() <= 8);
        REQUIRE(t->getSpice() == 20);
        REQUIRE(t->getMetabolismSugar() >= 1);
        REQUIRE(t->getMetabolismSpice() <= 3);
        REQUIRE(t->getVision() == cfg.traders.vision);
        REQUIRE(t->getMemory().getKind() == "episodic");
    }
}
