#pragma once

#include "Types.hpp"

namespace scape {

    // Regenerating stock of one good at a grid cell.
    // Invariant: 0 <= amount <= capacity.
    class Resource {
    public:
        Resource(ObjectId id,
            GoodKind kind,
            Quantity capacity,
            Quantity initialAmount,
            Quantity growback = 1);

        ObjectId getId() const { return id_; }
        GoodKind getKind() const { return kind_; }
        Quantity getAmount() const { return amount_; }
        Quantity getCapacity() const { return capacity_; }
        Quantity getGrowback() const { return growback_; }
        bool isExhausted() const { return amount_ == 0; }

        // amount = min(capacity, amount + growback)
        void regrow();

        // Takes min(requested, amount); exhaustion yields 0, not an error
        Quantity harvest(Quantity requested);

        ResourceSnapshot snapshot(const Coord& location) const;

    private:
        ObjectId id_;
        GoodKind kind_;
        Quantity capacity_;
        Quantity amount_;
        Quantity growback_;
    };

} // namespace scape
