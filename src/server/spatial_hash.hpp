#pragma once

#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

namespace racesync::server {

struct GridCell {
    int64_t x;
    int64_t z;

    bool operator==(const GridCell& other) const {
        return x == other.x && z == other.z;
    }
};

struct GridCellHash {
    size_t operator()(const GridCell& cell) const {
        return std::hash<int64_t>()(cell.x) ^ (std::hash<int64_t>()(cell.z) << 1);
    }
};

// Uniform grid over the x/z plane, rebuilt from scratch every tick.
// Stores opaque indices into a caller-owned entity array. Cell storage is
// pooled: reset() keeps every bucket's capacity for the next rebuild.
// Not thread-safe: all access must occur on the game loop thread.
class SpatialHash {
public:
    static constexpr double MIN_CELL_SIZE = 0.0001;

    explicit SpatialHash(double cell_size = 10.0);

    // Return every cell to the pool. A supplied cell size (clamped) is adopted.
    void reset(std::optional<double> cell_size = std::nullopt);

    // Non-finite coordinates are ignored
    void insert(uint32_t index, double x, double z);

    // Broad-phase candidates: every index inserted within `radius` of (x, z),
    // plus some beyond it. Clears `out` first; sorted ascending.
    void query_indices(double x, double z, double radius, std::vector<uint32_t>& out) const;

    double cell_size() const { return cell_size_; }
    size_t occupied_cell_count() const { return active_.size(); }
    size_t pooled_cell_count() const { return pool_.size(); }

private:
    GridCell cell_for(double x, double z) const;
    int64_t to_cell_coord(double v) const;

    double cell_size_;

    // Active cells map to a slot in pool_; slots [0, used_) are live
    std::unordered_map<GridCell, size_t, GridCellHash> active_;
    std::vector<std::vector<uint32_t>> pool_;
    size_t used_ = 0;
};

} // namespace racesync::server
