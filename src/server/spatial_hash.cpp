#include "spatial_hash.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace racesync::server {

namespace {

// Keeps cell coordinates and neighbourhood bounds far from int64 overflow
constexpr double MAX_CELL_COORD = 4.0e15;
constexpr int64_t MAX_QUERY_RANGE = 1'000'000'000;  // only bounds the neighbourhood walk

} // namespace

SpatialHash::SpatialHash(double cell_size)
    : cell_size_(std::max(MIN_CELL_SIZE, cell_size)) {
}

void SpatialHash::reset(std::optional<double> cell_size) {
    for (size_t i = 0; i < used_; ++i) {
        pool_[i].clear();
    }
    used_ = 0;
    active_.clear();

    if (cell_size && std::isfinite(*cell_size)) {
        cell_size_ = std::max(MIN_CELL_SIZE, *cell_size);
    }
}

int64_t SpatialHash::to_cell_coord(double v) const {
    double cell = std::floor(v / cell_size_);
    cell = std::clamp(cell, -MAX_CELL_COORD, MAX_CELL_COORD);
    return static_cast<int64_t>(cell);
}

GridCell SpatialHash::cell_for(double x, double z) const {
    return GridCell{to_cell_coord(x), to_cell_coord(z)};
}

void SpatialHash::insert(uint32_t index, double x, double z) {
    if (!std::isfinite(x) || !std::isfinite(z)) {
        return;
    }

    GridCell cell = cell_for(x, z);
    auto it = active_.find(cell);
    if (it == active_.end()) {
        if (used_ == pool_.size()) {
            pool_.emplace_back();
        }
        it = active_.emplace(cell, used_++).first;
    }
    pool_[it->second].push_back(index);
}

void SpatialHash::query_indices(double x, double z, double radius, std::vector<uint32_t>& out) const {
    out.clear();
    if (!std::isfinite(x) || !std::isfinite(z) || !std::isfinite(radius) || radius < 0.0) {
        return;
    }
    if (active_.empty()) {
        return;
    }

    double range_f = std::ceil(radius / cell_size_);
    int64_t range = range_f >= static_cast<double>(MAX_QUERY_RANGE)
        ? MAX_QUERY_RANGE
        : static_cast<int64_t>(range_f);
    GridCell center = cell_for(x, z);

    // A neighbourhood wider than the occupied set is cheaper to answer by
    // walking the occupied cells and testing the square bounds.
    int64_t side = 2 * range + 1;
    bool scan_occupied = side > 4096 ||
        static_cast<uint64_t>(side * side) > active_.size();

    if (scan_occupied) {
        for (const auto& [cell, slot] : active_) {
            // Compared in floating point so a capped range never drops a far cell
            if (static_cast<double>(std::llabs(cell.x - center.x)) <= range_f &&
                static_cast<double>(std::llabs(cell.z - center.z)) <= range_f) {
                const auto& bucket = pool_[slot];
                out.insert(out.end(), bucket.begin(), bucket.end());
            }
        }
    } else {
        for (int64_t cx = center.x - range; cx <= center.x + range; ++cx) {
            for (int64_t cz = center.z - range; cz <= center.z + range; ++cz) {
                auto it = active_.find(GridCell{cx, cz});
                if (it != active_.end()) {
                    const auto& bucket = pool_[it->second];
                    out.insert(out.end(), bucket.begin(), bucket.end());
                }
            }
        }
    }

    if (out.size() > 1) {
        std::sort(out.begin(), out.end());
    }
}

} // namespace racesync::server
