#include "TraversalKernel.h"
#include "Aggregator.h"
#include "Multipole.h"
#include <atomic>
#include <stdexcept>
#include <string>

gpu::KernelSignature TraversalKernel::signature_for(size_t num_levels) {
    // positions + A0/A1/A2 for every level, one force target
    return gpu::KernelSignature{"traverse_quadrupole", 1 + 3 * static_cast<int>(num_levels), 1, false};
}

TraversalKernel::TraversalKernel(gpu::Device& device, size_t num_levels)
    : device_(device), num_levels_(num_levels) {
    if (num_levels_ == 0) {
        throw std::invalid_argument("traversal needs at least one octree level");
    }
    device_.link(signature_for(num_levels_));
}

std::vector<TraversalKernel::LevelView>
TraversalKernel::build_views(const PipelineResources& resources, const geom::AABB3f& bounds) const {
    if (resources.levels.size() != num_levels_) {
        throw std::logic_error("traversal linked for " + std::to_string(num_levels_) +
                               " levels, resources hold " + std::to_string(resources.levels.size()));
    }
    std::vector<LevelView> views;
    views.reserve(num_levels_);
    const Eigen::Vector3f extent = bounds.extent();
    const float max_extent = bounds.max_extent();
    for (size_t k = 0; k < num_levels_; ++k) {
        const LevelConfig& cfg = resources.levels[k];
        const LevelTextures& tex = resources.level_textures[k];
        LevelView v;
        v.cfg = &cfg;
        v.a0 = &device_.arena().texture(tex.a0);
        v.a1 = &device_.arena().texture(tex.a1);
        v.a2 = &device_.arena().texture(tex.a2);
        v.voxel_extent = extent / static_cast<float>(cfg.grid_size);
        v.cell_size = max_extent / static_cast<float>(cfg.grid_size);
        views.push_back(v);
    }
    return views;
}

Eigen::Vector3f TraversalKernel::accumulate(const std::vector<LevelView>& views,
                                            const geom::AABB3f& bounds,
                                            const Params& params,
                                            const Eigen::Vector3f& pos,
                                            float self_mass,
                                            Counters& counters) const {
    const float eps2 = params.softening * params.softening;
    const int coarsest = static_cast<int>(views.size()) - 1;
    const Eigen::Vector3i voxel0 = Aggregator::voxel_for_position(pos, bounds, views[0].cfg->grid_size);

    // Per-thread scratch; capacity survives across particles and steps
    thread_local std::vector<Eigen::Vector3i> frontier;
    thread_local std::vector<Eigen::Vector3i> next;
    frontier.clear();

    const int top_grid = views[coarsest].cfg->grid_size;
    for (int z = 0; z < top_grid; ++z)
        for (int y = 0; y < top_grid; ++y)
            for (int x = 0; x < top_grid; ++x)
                frontier.emplace_back(x, y, z);

    Eigen::Vector3f acc = Eigen::Vector3f::Zero();

    //====== FAR FIELD: coarsest -> level 1 ======
    for (int k = coarsest; k >= 1; --k) {
        const LevelView& lv = views[k];
        const Eigen::Vector3i own(voxel0.x() >> k, voxel0.y() >> k, voxel0.z() >> k);
        next.clear();

        for (const Eigen::Vector3i& cell : frontier) {
            const Eigen::Vector2i t = lv.cfg->voxel_to_texel(cell);
            const gpu::Texel& a0 = lv.a0->fetch(t.x(), t.y());
            if (a0.w() <= 0.0f) continue;
            ++counters.cells_tested;

            if (cell != own) {
                const Eigen::Vector3f com = a0.head<3>() / a0.w();
                const Eigen::Vector3f centre = bounds.min +
                    (cell.cast<float>() + Eigen::Vector3f::Constant(0.5f)).cwiseProduct(lv.voxel_extent);
                const float d = (com - pos).norm();
                const float delta = (com - centre).norm();
                if (d > lv.cell_size / params.theta + delta) {
                    acc += multipole::cell_acceleration(pos, a0, lv.a1->fetch(t.x(), t.y()),
                                                        lv.a2->fetch(t.x(), t.y()), eps2,
                                                        params.enable_quadrupole);
                    ++counters.far_field_cells;
                    continue;
                }
            }

            const Eigen::Vector3i base = 2 * cell;
            for (int dz = 0; dz < 2; ++dz)
                for (int dy = 0; dy < 2; ++dy)
                    for (int dx = 0; dx < 2; ++dx)
                        next.push_back(base + Eigen::Vector3i(dx, dy, dz));
        }
        frontier.swap(next);
    }

    //====== NEAR FIELD: level 0, direct softened monopoles ======
    const LevelView& l0 = views[0];
    for (const Eigen::Vector3i& cell : frontier) {
        const Eigen::Vector2i t = l0.cfg->voxel_to_texel(cell);
        const gpu::Texel& a0 = l0.a0->fetch(t.x(), t.y());
        if (a0.w() <= 0.0f) continue;

        gpu::Texel src = a0;
        if (self_mass > 0.0f && cell == voxel0) {
            src -= gpu::Texel(self_mass * pos.x(), self_mass * pos.y(), self_mass * pos.z(), self_mass);
            if (src.w() <= kResidualMassFraction * a0.w()) continue;
        }
        ++counters.near_field_cells;
        const Eigen::Vector3f com = src.head<3>() / src.w();
        acc += multipole::monopole_acceleration(com - pos, src.w(), eps2);
    }

    return params.gravity * acc;
}

Eigen::Vector3f TraversalKernel::evaluate(const PipelineResources& resources,
                                          const geom::AABB3f& bounds,
                                          const Params& params,
                                          const Eigen::Vector3f& pos,
                                          float self_mass,
                                          Counters& counters) const {
    return accumulate(build_views(resources, bounds), bounds, params, pos, self_mass, counters);
}

void TraversalKernel::run(PipelineResources& resources, const geom::AABB3f& bounds, const Params& params) {
    const std::vector<LevelView> views = build_views(resources, bounds);
    const ParticleLayout& layout = resources.particles.layout();
    const gpu::Texture2D& positions = device_.arena().texture(resources.particles.position());

    std::atomic<uint64_t> tested{0};
    std::atomic<uint64_t> far{0};
    std::atomic<uint64_t> near{0};

    const gpu::Framebuffer fb({resources.force}, gpu::BlendMode::Replace);
    device_.draw_fullscreen(fb, [&](int x, int y, gpu::Texel* out) {
        if (layout.index_of(x, y) >= layout.count) return;
        const gpu::Texel& pm = positions.fetch(x, y);
        if (!Aggregator::contributes(pm)) return;

        Counters local;
        const Eigen::Vector3f a = accumulate(views, bounds, params, pm.head<3>(), pm.w(), local);
        out[0] = gpu::Texel(a.x(), a.y(), a.z(), 0.0f);

        tested.fetch_add(local.cells_tested, std::memory_order_relaxed);
        far.fetch_add(local.far_field_cells, std::memory_order_relaxed);
        near.fetch_add(local.near_field_cells, std::memory_order_relaxed);
    });

    last_counters_.cells_tested = tested.load();
    last_counters_.far_field_cells = far.load();
    last_counters_.near_field_cells = near.load();
}
