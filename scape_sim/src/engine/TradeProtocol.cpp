#include "TradeProtocol.hpp"
#include "utils/Logger.hpp"
#include <algorithm>
#include <cmath>

namespace scape {

    const char* toString(TradeStop stop) {
        switch (stop) {
        case TradeStop::CONVERGED: return "converged";
        case TradeStop::INFEASIBLE: return "infeasible";
        case TradeStop::ITERATION_CAP: return "iteration cap";
        case TradeStop::MRS_UNDEFINED: return "mrs undefined";
        }
        return "unknown";
    }

    TradeProtocol::TradeProtocol(const RuntimeConfig::TradeParams& params)
        : params_(params)
    {
        params_.quantum = std::max(1, params_.quantum);
        params_.maxIterations = std::max(0, params_.maxIterations);
    }

    std::optional<TradeProposal> TradeProtocol::propose(const Trader& a, const Trader& b, TradeStop* why) const {
        auto setWhy = [why](TradeStop s) { if (why) *why = s; };

        auto mrsA = a.tryMrs();
        auto mrsB = b.tryMrs();
        if (!mrsA || !mrsB) {
            setWhy(TradeStop::MRS_UNDEFINED);
            return std::nullopt;
        }

        if (std::abs(*mrsA - *mrsB) <= params_.mrsTolerance) {
            setWhy(TradeStop::CONVERGED);
            return std::nullopt;
        }

        const Trader& seller = (*mrsA > *mrsB) ? a : b;
        const Trader& buyer = (*mrsA > *mrsB) ? b : a;
        double sellerMrs = std::max(*mrsA, *mrsB);
        double buyerMrs = std::min(*mrsA, *mrsB);

        double price = std::sqrt(sellerMrs * buyerMrs);
        if (!std::isfinite(price) || price <= 0) {
            // A party with zero sugar has MRS 0; no interior price exists
            setWhy(TradeStop::INFEASIBLE);
            return std::nullopt;
        }

        // The dearer good moves in whole quanta, the other at the price
        Quantity q = params_.quantum;
        Quantity sugarQty;
        Quantity spiceQty;
        if (price >= 1.0) {
            spiceQty = q;
            sugarQty = std::max<Quantity>(1, std::llround(price * q));
        }
        else {
            sugarQty = q;
            spiceQty = std::max<Quantity>(1, std::llround(q / price));
        }

        // Rounding may push the realized price out of [buyerMrs, sellerMrs],
        // where one side would be paying more than its own valuation
        double realized = static_cast<double>(sugarQty) / static_cast<double>(spiceQty);
        if (realized < buyerMrs || realized > sellerMrs) {
            setWhy(TradeStop::INFEASIBLE);
            return std::nullopt;
        }

        Quantity sellerSugar = seller.getSugar() - sugarQty;
        Quantity sellerSpice = seller.getSpice() + spiceQty;
        Quantity buyerSugar = buyer.getSugar() + sugarQty;
        Quantity buyerSpice = buyer.getSpice() - spiceQty;

        // Spice must stay positive so both MRS remain defined
        if (sellerSugar < 0 || buyerSpice <= 0) {
            setWhy(TradeStop::INFEASIBLE);
            return std::nullopt;
        }

        double sellerAfter = Trader::mrsOf(sellerSugar, sellerSpice,
            seller.getMetabolismSugar(), seller.getMetabolismSpice());
        double buyerAfter = Trader::mrsOf(buyerSugar, buyerSpice,
            buyer.getMetabolismSugar(), buyer.getMetabolismSpice());

        // No overshoot past the other party's pre-trade valuation, and the
        // ordering between the two must survive the increment
        if (sellerAfter < buyerMrs || buyerAfter > sellerMrs || sellerAfter < buyerAfter) {
            setWhy(TradeStop::INFEASIBLE);
            return std::nullopt;
        }

        TradeProposal p;
        p.sugarSeller = seller.getId();
        p.sugarBuyer = buyer.getId();
        p.sugar = sugarQty;
        p.spice = spiceQty;
        p.price = realized;
        p.sellerMrsBefore = sellerMrs;
        p.buyerMrsBefore = buyerMrs;
        p.sellerMrsAfter = sellerAfter;
        p.buyerMrsAfter = buyerAfter;
        return p;
    }

    TradeRecord TradeProtocol::execute(const TradeProposal& proposal, Trader& seller, Trader& buyer, Step step) const {
        TradeRecord record;
        record.sugarBuyer = proposal.sugarBuyer;
        record.sugarSeller = proposal.sugarSeller;
        record.sugar = proposal.sugar;
        record.spice = proposal.spice;
        record.price = proposal.price;
        record.step = step;

        seller.settleTrade(record);
        buyer.settleTrade(record);
        return record;
    }

    NegotiationResult TradeProtocol::negotiate(Trader& a, Trader& b, Step step) const {
        NegotiationResult result;
        if (a.getId() == b.getId()) {
            result.stop = TradeStop::INFEASIBLE;
            return result;
        }

        for (int i = 0; i < params_.maxIterations; ++i) {
            TradeStop why = TradeStop::CONVERGED;
            auto proposal = propose(a, b, &why);
            if (!proposal) {
                result.stop = why;
                Logger::debug("Trade {} <-> {} stopped after {} increments: {}",
                    a.getId(), b.getId(), result.trades.size(), toString(why));
                return result;
            }

            Trader& seller = (proposal->sugarSeller == a.getId()) ? a : b;
            Trader& buyer = (proposal->sugarSeller == a.getId()) ? b : a;
            result.trades.push_back(execute(*proposal, seller, buyer, step));

            Logger::debug("Trade: {} sells {} sugar to {} for {} spice (price {:.4f}, MRS {:.4f}/{:.4f} -> {:.4f}/{:.4f})",
                proposal->sugarSeller, proposal->sugar, proposal->sugarBuyer, proposal->spice,
                proposal->price, proposal->sellerMrsBefore, proposal->buyerMrsBefore,
                proposal->sellerMrsAfter, proposal->buyerMrsAfter);
        }

        result.stop = TradeStop::ITERATION_CAP;
        Logger::debug("Trade {} <-> {} hit the iteration cap ({})", a.getId(), b.getId(), params_.maxIterations);
        return result;
    }

} // namespace scape
