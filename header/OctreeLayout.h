#pragma once
#include <Eigen/Dense>
#include <vector>

// Z-slice tiling of a cubic voxel grid into a 2D texture. Slice z occupies
// the tile (z % slices_per_row, z / slices_per_row), each tile grid_size wide.
struct LevelConfig {
    int grid_size;
    int slices_per_row;
    int texture_width;
    int texture_height;

    LevelConfig() : grid_size(1), slices_per_row(1), texture_width(1), texture_height(1) {}
    LevelConfig(int grid, int slices);

    Eigen::Vector2i voxel_to_texel(int x, int y, int z) const {
        return Eigen::Vector2i((z % slices_per_row) * grid_size + x,
                               (z / slices_per_row) * grid_size + y);
    }
    Eigen::Vector2i voxel_to_texel(const Eigen::Vector3i& v) const {
        return voxel_to_texel(v.x(), v.y(), v.z());
    }

    // False for texels in the unused tiles of the last tile row
    bool texel_to_voxel(int tx, int ty, Eigen::Vector3i& voxel) const {
        const int slice = (ty / grid_size) * slices_per_row + tx / grid_size;
        if (slice >= grid_size) return false;
        voxel = Eigen::Vector3i(tx % grid_size, ty % grid_size, slice);
        return true;
    }

    bool contains(const Eigen::Vector3i& v) const {
        return (v.array() >= 0).all() && (v.array() < grid_size).all();
    }

    size_t voxel_count() const {
        return static_cast<size_t>(grid_size) * grid_size * grid_size;
    }
};

bool is_power_of_two(int value);

// Number of levels from grid_size down to and including the 1x1x1 root
int full_level_count(int grid_size);

/*  Level k halves the grid (min 1) and the slices per row (min 1) of level
    k-1. num_levels == 0 builds every level down to the root.
    Throws std::invalid_argument for a non power-of-two grid, slices_per_row
    < 1, or more levels than the grid can be halved into.
*/
std::vector<LevelConfig> build_level_configs(int grid_size, int slices_per_row, int num_levels);
