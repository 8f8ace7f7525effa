#pragma once
#include "Bounds.hpp"
#include "GpuDevice.h"
#include <string>

/*  Min/max reduction of a position texture. The first pass folds 8x8 texel
    blocks of valid particles (mass > 0, finite) into a min and a max target;
    further passes fold 8x8 blocks of those until a single texel pair is left,
    which is read back. min.w carries the number of valid particles.
*/
class BoundsReducer {
public:
    static constexpr int kBlock = 8;

    struct Result {
        bool ok;
        geom::AABB3f raw;          // unpadded extent of the valid particles
        size_t valid_particles;
        std::string error;

        Result() : ok(false), valid_particles(0) {}
    };

    static const gpu::KernelSignature& signature();

    // Owns a private single-threaded device so it can run off the main thread
    explicit BoundsReducer(const gpu::Capabilities& caps = gpu::Capabilities{});

    Result reduce(const gpu::Texture2D& positions, size_t particle_count);

    uint64_t passes_issued() const { return device_.passes_issued(); }

private:
    gpu::Device device_;
};
