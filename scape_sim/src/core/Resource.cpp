#include "Resource.hpp"
#include <algorithm>

namespace scape {

    Resource::Resource(ObjectId id,
        GoodKind kind,
        Quantity capacity,
        Quantity initialAmount,
        Quantity growback)
        : id_(id)
        , kind_(kind)
        , capacity_(std::max(Quantity(0), capacity))
        , amount_(std::clamp(initialAmount, Quantity(0), std::max(Quantity(0), capacity)))
        , growback_(std::max(Quantity(0), growback))
    {
    }

    void Resource::regrow() {
        amount_ = std::min(capacity_, amount_ + growback_);
    }

    Quantity Resource::harvest(Quantity requested) {
        if (requested <= 0) return 0;
        Quantity taken = std::min(requested, amount_);
        amount_ -= taken;
        return taken;
    }

    ResourceSnapshot Resource::snapshot(const Coord& location) const {
        return ResourceSnapshot{ id_, location, kind_, amount_, capacity_ };
    }

} // namespace scape
