#pragma once
#include "Bounds.hpp"
#include "GpuDevice.h"
#include "PipelineResources.h"

// Level-0 deposit: one point primitive per particle, additively blended into
// the three moment targets of the finest level.
class Aggregator {
public:
    static const gpu::KernelSignature& signature();

    explicit Aggregator(gpu::Device& device);

    void run(PipelineResources& resources, const geom::AABB3f& bounds);

    /*  Voxel of `pos` in a grid of side `grid_size` over `bounds`.
        Normalized coordinates are clamped to [0, 0.9999] before flooring and
        the result is clamped to [0, grid_size - 1], so positions outside a
        stale box land in the nearest boundary voxel.
    */
    static Eigen::Vector3i voxel_for_position(const Eigen::Vector3f& pos,
                                              const geom::AABB3f& bounds,
                                              int grid_size);

    // Zero/negative mass and non-finite positions deposit nothing
    static bool contributes(const gpu::Texel& position_mass) {
        return position_mass.w() > 0.0f && position_mass.allFinite();
    }

    size_t last_deposited() const { return last_deposited_; }

private:
    gpu::Device& device_;
    size_t last_deposited_;
};
