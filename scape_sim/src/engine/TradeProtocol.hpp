#pragma once

#include "core/Types.hpp"
#include "core/RuntimeConfig.hpp"
#include "agents/Trader.hpp"
#include <optional>
#include <vector>

namespace scape {

    enum class TradeStop {
        CONVERGED,      // MRS values within tolerance
        INFEASIBLE,     // next increment would overshoot, overdraw or misprice
        ITERATION_CAP,
        MRS_UNDEFINED   // a party holds no spice
    };

    const char* toString(TradeStop stop);

    // One candidate increment; nothing has moved yet
    struct TradeProposal {
        AgentId sugarSeller;    // higher MRS: relatively rich in sugar
        AgentId sugarBuyer;
        Quantity sugar;
        Quantity spice;
        double price;           // geometric mean of both MRS, sugar per spice
        double sellerMrsBefore;
        double buyerMrsBefore;
        double sellerMrsAfter;
        double buyerMrsAfter;
    };

    struct NegotiationResult {
        std::vector<TradeRecord> trades;
        TradeStop stop = TradeStop::CONVERGED;
    };

    // MRS-bracketing bilateral trade between two traders.
    //
    // The sugar-rich party (higher MRS) sells sugar for spice at the
    // geometric mean of both MRS values. Each increment moves `quantum`
    // units of the dearer good and is executed only if the rounded price
    // still lies between both MRS values, neither inventory overdraws, and
    // the post-trade MRS values do not cross, so the MRS gap
    // shrinks strictly with every increment. Goods are only moved, never
    // created: the pair's combined holdings are invariant.
    class TradeProtocol {
    public:
        explicit TradeProtocol(const RuntimeConfig::TradeParams& params);

        // Evaluate the next increment without mutating either trader
        std::optional<TradeProposal> propose(const Trader& a, const Trader& b, TradeStop* why = nullptr) const;

        // Repeat increments until convergence, infeasibility or the cap
        NegotiationResult negotiate(Trader& a, Trader& b, Step step) const;

        const RuntimeConfig::TradeParams& getParams() const { return params_; }

    private:
        RuntimeConfig::TradeParams params_;

        TradeRecord execute(const TradeProposal& proposal, Trader& seller, Trader& buyer, Step step) const;
    };

} // namespace scape
