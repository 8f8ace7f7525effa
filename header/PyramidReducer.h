#pragma once
#include "GpuDevice.h"
#include "PipelineResources.h"

// Builds levels 1..N-1 from level 0. Each parent voxel sums the 8 children
// at 2*parent + {0,1}^3 of the level below, for all three moment targets.
class PyramidReducer {
public:
    static const gpu::KernelSignature& signature();

    explicit PyramidReducer(gpu::Device& device);

    // Reduces every level in increasing order
    void run(PipelineResources& resources);

    // One pass: level k-1 -> level k
    void reduce_level(PipelineResources& resources, size_t k);

private:
    gpu::Device& device_;
};
