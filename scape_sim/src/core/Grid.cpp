#include "Grid.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <spdlog/fmt/fmt.h>

namespace scape {

    Grid::Grid(int width, int height)
        : width_(width)
        , height_(height)
    {
        if (width <= 0 || height <= 0) {
            throw OutOfBounds(fmt::format("Grid dimensions must be positive, got {}x{}", width, height));
        }
        cells_.resize(static_cast<size_t>(width) * height);
    }

    void Grid::checkBounds(const Coord& c) const {
        if (!inBounds(c)) {
            throw OutOfBounds(fmt::format("({}, {}) is outside the {}x{} grid",
                c.x, c.y, width_, height_));
        }
    }

    void Grid::place(ObjectId occupant, const Coord& coord) {
        checkBounds(coord);

        auto it = locations_.find(occupant);
        if (it != locations_.end()) {
            auto& old = cells_[index(it->second)];
            old.erase(std::remove(old.begin(), old.end(), occupant), old.end());
        }

        cells_[index(coord)].push_back(occupant);
        locations_[occupant] = coord;
    }

    void Grid::remove(ObjectId occupant, const Coord& coord) {
        checkBounds(coord);

        auto it = locations_.find(occupant);
        if (it == locations_.end() || it->second != coord) {
            throw NotPresent(fmt::format("Occupant {} is not at ({}, {})", occupant, coord.x, coord.y));
        }

        auto& cell = cells_[index(coord)];
        cell.erase(std::remove(cell.begin(), cell.end(), occupant), cell.end());
        locations_.erase(it);
    }

    void Grid::move(ObjectId occupant, const Coord& to) {
        auto from = locate(occupant);
        if (!from) {
            throw NotPresent(fmt::format("Occupant {} is not on the grid", occupant));
        }
        checkBounds(to);
        remove(occupant, *from);
        place(occupant, to);
    }

    std::optional<Coord> Grid::locate(ObjectId occupant) const {
        auto it = locations_.find(occupant);
        if (it == locations_.end()) return std::nullopt;
        return it->second;
    }

    const std::vector<ObjectId>& Grid::cellContents(const Coord& coord) const {
        checkBounds(coord);
        return cells_[index(coord)];
    }

    std::vector<ObjectId> Grid::neighbors(const Coord& coord, int radius,
        std::optional<ObjectId> self) const {
        checkBounds(coord);

        std::vector<ObjectId> result;
        if (radius < 0) return result;

        int x0 = std::max(0, coord.x - radius);
        int x1 = std::min(width_ - 1, coord.x + radius);
        int y0 = std::max(0, coord.y - radius);
        int y1 = std::min(height_ - 1, coord.y + radius);

        for (int x = x0; x <= x1; ++x) {
            for (int y = y0; y <= y1; ++y) {
                for (ObjectId id : cells_[index({ x, y })]) {
                    if (self && id == *self) continue;
                    result.push_back(id);
                }
            }
        }
        return result;
    }

} // namespace scape
