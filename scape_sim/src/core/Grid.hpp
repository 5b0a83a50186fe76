#pragma once

#include "Types.hpp"
#include <map>
#include <optional>
#include <vector>

namespace scape {

    // Bounded, non-wrapping lattice. Each cell holds its occupants in
    // insertion order; an occupant lives in at most one cell.
    class Grid {
    public:
        Grid(int width, int height);

        int getWidth() const { return width_; }
        int getHeight() const { return height_; }

        bool inBounds(const Coord& c) const {
            return c.x >= 0 && c.x < width_ && c.y >= 0 && c.y < height_;
        }

        // Throws OutOfBounds. An occupant already on the grid is relocated.
        void place(ObjectId occupant, const Coord& coord);

        // Throws NotPresent if occupant is not at coord
        void remove(ObjectId occupant, const Coord& coord);

        // Remove from the current cell and place at `to`
        void move(ObjectId occupant, const Coord& to);

        std::optional<Coord> locate(ObjectId occupant) const;

        const std::vector<ObjectId>& cellContents(const Coord& coord) const;

        // Occupants within Chebyshev distance `radius`, ordered by coordinate
        // then insertion order, never including `self`
        std::vector<ObjectId> neighbors(const Coord& coord, int radius,
            std::optional<ObjectId> self = std::nullopt) const;

        size_t occupantCount() const { return locations_.size(); }

    private:
        int width_;
        int height_;
        std::vector<std::vector<ObjectId>> cells_;  // index = x * height + y
        std::map<ObjectId, Coord> locations_;

        size_t index(const Coord& c) const {
            return static_cast<size_t>(c.x) * height_ + c.y;
        }
        void checkBounds(const Coord& c) const;
    };

} // namespace scape
