#include "BoundsReducer.h"
#include <algorithm>
#include <limits>
#include <string>

namespace {

int blocks_for(int n) { return (n + BoundsReducer::kBlock - 1) / BoundsReducer::kBlock; }

const gpu::Texel kEmptyMin(std::numeric_limits<float>::infinity(),
                           std::numeric_limits<float>::infinity(),
                           std::numeric_limits<float>::infinity(), 0.0f);
const gpu::Texel kEmptyMax(-std::numeric_limits<float>::infinity(),
                           -std::numeric_limits<float>::infinity(),
                           -std::numeric_limits<float>::infinity(), 0.0f);

} // namespace

const gpu::KernelSignature& BoundsReducer::signature() {
    static const gpu::KernelSignature sig{"bounds_minmax", 2, 2, false};
    return sig;
}

BoundsReducer::BoundsReducer(const gpu::Capabilities& caps) : device_(caps, false) {
    device_.link(signature());
}

BoundsReducer::Result BoundsReducer::reduce(const gpu::Texture2D& positions, size_t particle_count) {
    Result result;
    gpu::ResourceArena& arena = device_.arena();

    gpu::TextureId src = arena.create_texture(positions.width, positions.height, "bounds.snapshot");
    arena.texture(src).texels = positions.texels;

    int w = blocks_for(positions.width);
    int h = blocks_for(positions.height);
    gpu::TextureId lo = arena.create_texture(w, h, "bounds.min.0");
    gpu::TextureId hi = arena.create_texture(w, h, "bounds.max.0");

    //====== PASS 0: particles -> block min/max ======
    {
        const gpu::Texture2D& pos = arena.texture(src);
        const size_t stride = static_cast<size_t>(pos.width);
        device_.draw_fullscreen(gpu::Framebuffer({lo, hi}, gpu::BlendMode::Replace),
                                [&](int bx, int by, gpu::Texel* out) {
            gpu::Texel mn = kEmptyMin;
            gpu::Texel mx = kEmptyMax;
            const int x1 = std::min(pos.width, (bx + 1) * kBlock);
            const int y1 = std::min(pos.height, (by + 1) * kBlock);
            for (int y = by * kBlock; y < y1; ++y) {
                for (int x = bx * kBlock; x < x1; ++x) {
                    if (static_cast<size_t>(y) * stride + x >= particle_count) continue;
                    const gpu::Texel& p = pos.fetch(x, y);
                    if (!(p.w() > 0.0f) || !p.allFinite()) continue;
                    mn.head<3>() = mn.head<3>().cwiseMin(p.head<3>());
                    mx.head<3>() = mx.head<3>().cwiseMax(p.head<3>());
                    mn.w() += 1.0f;
                }
            }
            out[0] = mn;
            out[1] = mx;
        });
    }
    arena.release(src);

    //====== PASSES 1..n: fold 8x8 blocks of min/max pairs ======
    int pass = 1;
    while (w > 1 || h > 1) {
        const int nw = blocks_for(w);
        const int nh = blocks_for(h);
        gpu::TextureId nlo = arena.create_texture(nw, nh, "bounds.min." + std::to_string(pass));
        gpu::TextureId nhi = arena.create_texture(nw, nh, "bounds.max." + std::to_string(pass));
        const gpu::Texture2D& in_lo = arena.texture(lo);
        const gpu::Texture2D& in_hi = arena.texture(hi);

        device_.draw_fullscreen(gpu::Framebuffer({nlo, nhi}, gpu::BlendMode::Replace),
                                [&](int bx, int by, gpu::Texel* out) {
            gpu::Texel mn = kEmptyMin;
            gpu::Texel mx = kEmptyMax;
            const int x1 = std::min(in_lo.width, (bx + 1) * kBlock);
            const int y1 = std::min(in_lo.height, (by + 1) * kBlock);
            for (int y = by * kBlock; y < y1; ++y) {
                for (int x = bx * kBlock; x < x1; ++x) {
                    const gpu::Texel& a = in_lo.fetch(x, y);
                    if (a.w() <= 0.0f) continue;
                    mn.head<3>() = mn.head<3>().cwiseMin(a.head<3>());
                    mx.head<3>() = mx.head<3>().cwiseMax(in_hi.fetch(x, y).head<3>());
                    mn.w() += a.w();
                }
            }
            out[0] = mn;
            out[1] = mx;
        });

        arena.release(lo);
        arena.release(hi);
        lo = nlo;
        hi = nhi;
        w = nw;
        h = nh;
        ++pass;
    }

    // Readback of the final texel pair
    const gpu::Texel mn = arena.texture(lo).fetch(0, 0);
    const gpu::Texel mx = arena.texture(hi).fetch(0, 0);
    arena.release(lo);
    arena.release(hi);

    result.valid_particles = static_cast<size_t>(mn.w());
    if (result.valid_particles == 0) {
        result.error = "no particle with positive mass and finite position";
        return result;
    }
    if (!mn.head<3>().allFinite() || !mx.head<3>().allFinite()) {
        result.error = "bounds reduction produced non-finite extent";
        return result;
    }
    result.raw = geom::AABB3f(mn.head<3>(), mx.head<3>());
    result.ok = true;
    return result;
}
