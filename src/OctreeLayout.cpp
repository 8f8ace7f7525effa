#include "OctreeLayout.h"
#include <algorithm>
#include <stdexcept>
#include <string>

LevelConfig::LevelConfig(int grid, int slices)
    : grid_size(grid), slices_per_row(std::min(slices, grid)) {
    const int tile_rows = (grid_size + slices_per_row - 1) / slices_per_row;
    texture_width = grid_size * slices_per_row;
    texture_height = grid_size * tile_rows;
}

bool is_power_of_two(int value) {
    return value > 0 && (value & (value - 1)) == 0;
}

int full_level_count(int grid_size) {
    int levels = 1;
    while (grid_size > 1) {
        grid_size /= 2;
        ++levels;
    }
    return levels;
}

std::vector<LevelConfig> build_level_configs(int grid_size, int slices_per_row, int num_levels) {
    if (!is_power_of_two(grid_size)) {
        throw std::invalid_argument("octree grid size must be a power of two, got " +
                                    std::to_string(grid_size));
    }
    if (slices_per_row < 1) {
        throw std::invalid_argument("slices per row must be at least 1");
    }
    const int max_levels = full_level_count(grid_size);
    if (num_levels < 0 || num_levels > max_levels) {
        throw std::invalid_argument("grid " + std::to_string(grid_size) + " supports at most " +
                                    std::to_string(max_levels) + " levels, requested " +
                                    std::to_string(num_levels));
    }
    if (num_levels == 0) num_levels = max_levels;

    std::vector<LevelConfig> levels;
    levels.reserve(num_levels);
    int grid = grid_size;
    int slices = slices_per_row;
    for (int k = 0; k < num_levels; ++k) {
        levels.emplace_back(grid, slices);
        grid = std::max(1, grid / 2);
        slices = std::max(1, slices / 2);
    }
    return levels;
}
