#include "Integrator.h"
#include <atomic>
#include <cmath>

const gpu::KernelSignature& Integrator::signature() {
    // reads position, velocity, force; writes position + velocity
    static const gpu::KernelSignature sig{"integrate_kick_drift", 3, 2, false};
    return sig;
}

Integrator::Integrator(gpu::Device& device) : device_(device), last_suppressed_(0) {
    device_.link(signature());
}

Integrator::Result Integrator::integrate(const gpu::Texel& position_mass,
                                         const gpu::Texel& velocity,
                                         const gpu::Texel& force,
                                         const Params& params) {
    Result out{position_mass, velocity};
    if (!position_mass.allFinite() || !velocity.allFinite() || position_mass.w() <= 0.0f) {
        return out;
    }
    Eigen::Vector3f a = force.head<3>();
    if (!a.allFinite()) {
        return out;
    }

    const float a_mag = a.norm();
    if (a_mag > params.max_accel) {
        a *= params.max_accel / a_mag;
    }

    Eigen::Vector3f v = velocity.head<3>() + a * params.dt;
    v *= (1.0f - params.damping);

    const float speed = v.norm();
    if (speed > params.max_speed) {
        v *= params.max_speed / speed;
    }

    const Eigen::Vector3f p = position_mass.head<3>() + v * params.dt;
    out.position_mass = gpu::Texel(p.x(), p.y(), p.z(), position_mass.w());
    out.velocity = gpu::Texel(v.x(), v.y(), v.z(), velocity.w());
    return out;
}

void Integrator::run(PipelineResources& resources, const Params& params) {
    ParticleStore& particles = resources.particles;
    const ParticleLayout& layout = particles.layout();
    gpu::ResourceArena& arena = device_.arena();
    const gpu::Texture2D& pos = arena.texture(particles.position());
    const gpu::Texture2D& vel = arena.texture(particles.velocity());
    const gpu::Texture2D& force = arena.texture(resources.force);

    std::atomic<size_t> suppressed{0};
    const gpu::Framebuffer fb({particles.target_position(), particles.target_velocity()},
                              gpu::BlendMode::Replace);
    device_.draw_fullscreen(fb, [&](int x, int y, gpu::Texel* out) {
        const gpu::Texel& pm = pos.fetch(x, y);
        const gpu::Texel& v = vel.fetch(x, y);
        if (layout.index_of(x, y) >= layout.count) {
            out[0] = pm;
            out[1] = v;
            return;
        }
        const Result r = integrate(pm, v, force.fetch(x, y), params);
        out[0] = r.position_mass;
        out[1] = r.velocity;
        if (pm.w() > 0.0f && (!pm.allFinite() || !v.allFinite() || !force.fetch(x, y).head<3>().allFinite())) {
            suppressed.fetch_add(1, std::memory_order_relaxed);
        }
    });
    last_suppressed_ = suppressed.load();

    particles.swap();
}
