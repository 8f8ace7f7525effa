#pragma once
#include "Bounds.hpp"
#include "GpuDevice.h"
#include "PipelineResources.h"
#include <cstdint>
#include <vector>

/*  Per-particle Barnes-Hut walk over the moment pyramid.

    Each invocation keeps a refinement frontier, seeded with every cell of
    the coarsest level. At levels >= 1 a cell is accepted when
        d > cell_size / theta + |com - geometric_centre|
    and then contributes monopole + quadrupole; otherwise its 8 children
    join the frontier of the next finer level. The particle's own cell is
    never accepted. Cells still open at level 0 form the near field and
    contribute softened monopoles, the own voxel with the particle removed.
*/
class TraversalKernel {
public:
    struct Params {
        float theta;
        float softening;
        float gravity;
        bool enable_quadrupole;

        Params() : theta(0.5f), softening(0.2f), gravity(0.0003f), enable_quadrupole(true) {}
    };

    struct Counters {
        uint64_t cells_tested;
        uint64_t far_field_cells;
        uint64_t near_field_cells;

        Counters() : cells_tested(0), far_field_cells(0), near_field_cells(0) {}
    };

    // Own-voxel residuals lighter than this fraction of the voxel are dropped
    static constexpr float kResidualMassFraction = 1e-6f;

    static gpu::KernelSignature signature_for(size_t num_levels);

    TraversalKernel(gpu::Device& device, size_t num_levels);

    // Writes G * acceleration for every particle texel into resources.force
    void run(PipelineResources& resources, const geom::AABB3f& bounds, const Params& params);

    /*  Acceleration at `pos` (already multiplied by G). `self_mass` is the
        mass the caller itself deposited at `pos`; pass 0 for a probe point
        that is not part of the pyramid.
    */
    Eigen::Vector3f evaluate(const PipelineResources& resources,
                             const geom::AABB3f& bounds,
                             const Params& params,
                             const Eigen::Vector3f& pos,
                             float self_mass,
                             Counters& counters) const;

    const Counters& last_counters() const { return last_counters_; }

private:
    struct LevelView {
        const LevelConfig* cfg;
        const gpu::Texture2D* a0;
        const gpu::Texture2D* a1;
        const gpu::Texture2D* a2;
        Eigen::Vector3f voxel_extent;
        float cell_size;
    };

    std::vector<LevelView> build_views(const PipelineResources& resources,
                                       const geom::AABB3f& bounds) const;

    Eigen::Vector3f accumulate(const std::vector<LevelView>& views,
                               const geom::AABB3f& bounds,
                               const Params& params,
                               const Eigen::Vector3f& pos,
                               float self_mass,
                               Counters& counters) const;

    gpu::Device& device_;
    size_t num_levels_;
    Counters last_counters_;
};
