#pragma once
#include "GpuDevice.h"
#include "PipelineResources.h"

// Kick-drift update from the current particle buffers into the target pair.
class Integrator {
public:
    struct Params {
        float dt;
        float damping;
        float max_speed;
        float max_accel;

        Params() : dt(1.0f / 60.0f), damping(0.0f), max_speed(2.0f), max_accel(1.0f) {}
    };

    struct Result {
        gpu::Texel position_mass;
        gpu::Texel velocity;
    };

    static const gpu::KernelSignature& signature();

    explicit Integrator(gpu::Device& device);

    // Writes the target buffers, then swaps the ping-pong pair
    void run(PipelineResources& resources, const Params& params);

    /*  Per-particle update, exposed for tests.
        INPUTS:  position+mass, velocity, force (acceleration) texels
        OUTPUTS: new position+mass and velocity texels; the inputs unchanged
                 when position/velocity/force is non-finite or mass <= 0
    */
    static Result integrate(const gpu::Texel& position_mass,
                            const gpu::Texel& velocity,
                            const gpu::Texel& force,
                            const Params& params);

    size_t last_suppressed() const { return last_suppressed_; }

private:
    gpu::Device& device_;
    size_t last_suppressed_;
};
