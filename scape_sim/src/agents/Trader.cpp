#include "Trader.hpp"
#include "core/Errors.hpp"
#include <algorithm>
#include <set>
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace scape {

    Trader::Trader(AgentId id,
        Quantity sugar,
        Quantity spice,
        Quantity metabolismSugar,
        Quantity metabolismSpice,
        int vision,
        std::unique_ptr<MemoryLog> memory,
        ToolRegistry tools,
        std::shared_ptr<DecisionMaker> decisionMaker)
        : id_(id)
        , sugar_(sugar)
        , spice_(spice)
        , metabolismSugar_(metabolismSugar)
        , metabolismSpice_(metabolismSpice)
        , vision_(vision)
        , memory_(std::move(memory))
        , tools_(std::move(tools))
        , decisionMaker_(std::move(decisionMaker))
    {
        if (metabolismSugar <= 0 || metabolismSpice <= 0) {
            throw DivisionUndefined(fmt::format(
                "Trader {}: metabolism must be positive (sugar={}, spice={})",
                id, metabolismSugar, metabolismSpice));
        }
        if (sugar < 0 || spice < 0) {
            throw std::invalid_argument(fmt::format(
                "Trader {}: negative initial inventory (sugar={}, spice={})", id, sugar, spice));
        }
        if (!memory_) {
            memory_ = std::make_unique<ShortTermMemory>();
        }
    }

    double Trader::mrsOf(Quantity sugar, Quantity spice, Quantity metSugar, Quantity metSpice) {
        if (metSugar <= 0 || metSpice <= 0 || spice <= 0) {
            throw DivisionUndefined(fmt::format(
                "MRS undefined for sugar={}, spice={}, metabolism=({}, {})",
                sugar, spice, metSugar, metSpice));
        }
        double sugarRatio = static_cast<double>(sugar) / metSugar;
        double spiceRatio = static_cast<double>(spice) / metSpice;
        return sugarRatio / spiceRatio;
    }

    double Trader::computeMrs() const {
        return mrsOf(sugar_, spice_, metabolismSugar_, metabolismSpice_);
    }

    std::optional<double> Trader::tryMrs() const {
        if (spice_ <= 0) return std::nullopt;
        return computeMrs();
    }

    bool Trader::isShortOf(GoodKind kind) const {
        // Cross-multiplied to stay in integers
        Quantity sugarNeed = sugar_ * metabolismSpice_;
        Quantity spiceNeed = spice_ * metabolismSugar_;
        return kind == GoodKind::SUGAR ? sugarNeed <= spiceNeed : spiceNeed <= sugarNeed;
    }

    HarvestTotals Trader::harvestAt(const std::vector<Resource*>& resources) {
        // Decide once, before inventories change
        bool wantSugar = isShortOf(GoodKind::SUGAR);
        bool wantSpice = isShortOf(GoodKind::SPICE);

        HarvestTotals taken;
        for (Resource* r : resources) {
            if (!r) continue;
            if (r->getKind() == GoodKind::SUGAR && wantSugar) {
                taken.sugar += r->harvest(r->getAmount());
            }
            else if (r->getKind() == GoodKind::SPICE && wantSpice) {
                taken.spice += r->harvest(r->getAmount());
            }
        }

        sugar_ += taken.sugar;
        spice_ += taken.spice;
        return taken;
    }

    void Trader::settleTrade(const TradeRecord& record) {
        TradeLogEntry entry;
        entry.price = record.price;
        entry.step = record.step;

        if (record.sugarBuyer == id_) {
            if (spice_ < record.spice) {
                throw std::logic_error(fmt::format("Trader {}: settlement would overdraw spice", id_));
            }
            sugar_ += record.sugar;
            spice_ -= record.spice;
            entry.partner = record.sugarSeller;
            entry.sugarDelta = record.sugar;
            entry.spiceDelta = -record.spice;
        }
        else if (record.sugarSeller == id_) {
            if (sugar_ < record.sugar) {
                throw std::logic_error(fmt::format("Trader {}: settlement would overdraw sugar", id_));
            }
            sugar_ -= record.sugar;
            spice_ += record.spice;
            entry.partner = record.sugarBuyer;
            entry.sugarDelta = -record.sugar;
            entry.spiceDelta = record.spice;
        }
        else {
            throw std::logic_error(fmt::format("Trader {} is not a party to this trade", id_));
        }

        tradeLog_.push_back(entry);
        priceHistory_.push_back(record.price);
    }

    std::vector<AgentId> Trader::getTradePartners() const {
        std::set<AgentId> partners;
        for (const auto& e : tradeLog_) {
            partners.insert(e.partner);
        }
        return std::vector<AgentId>(partners.begin(), partners.end());
    }

    TraderSnapshot Trader::snapshot() const {
        TraderSnapshot s;
        s.id = id_;
        s.location = location_;
        s.sugar = sugar_;
        s.spice = spice_;
        s.mrs = tryMrs();
        s.trades = tradeLog_.size();
        s.tradePartners = getTradePartners();
        s.prices = priceHistory_;
        return s;
    }

    // TraderFactory implementation

    std::unique_ptr<Trader> TraderFactory::create(AgentId id,
        const RuntimeConfig& cfg,
        Random& random,
        std::shared_ptr<DecisionMaker> decisionMaker) {
        const auto& t = cfg.traders;

        Quantity sugar = random.uniformInt(t.sugarMin, t.sugarMax);
        Quantity spice = random.uniformInt(t.spiceMin, t.spiceMax);
        Quantity metSugar = random.uniformInt(t.metabolismMin, t.metabolismMax);
        Quantity metSpice = random.uniformInt(t.metabolismMin, t.metabolismMax);

        return std::make_unique<Trader>(id, sugar, spice, metSugar, metSpice, t.vision,
            createMemory(t.memoryKind, static_cast<size_t>(std::max(0, t.shortTermCapacity))),
            ToolRegistry::traderDefaults(),
            std::move(decisionMaker));
    }

} // namespace scape
