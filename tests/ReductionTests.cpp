#include <gtest/gtest.h>
#include "Aggregator.h"
#include "GpuDevice.h"
#include "PipelineResources.h"
#include "PyramidReducer.h"
#include <cmath>
#include <random>
#include <stdexcept>

namespace {

struct PyramidRig {
  gpu::Device device{gpu::Capabilities{}, false};
  PipelineResources res;

  PyramidRig(int grid, int slices, size_t particles = 1) {
    res.allocate(device.arena(), ParticleLayout::for_count(particles), build_level_configs(grid, slices, 0));
  }

  gpu::Texture2D& tex(size_t level, int which) {
    const LevelTextures& t = res.level_textures[level];
    return device.arena().texture(which == 0 ? t.a0 : (which == 1 ? t.a1 : t.a2));
  }

  gpu::Texel& voxel(size_t level, int which, const Eigen::Vector3i& v) {
    const Eigen::Vector2i t = res.levels[level].voxel_to_texel(v);
    return tex(level, which).at(t.x(), t.y());
  }

  double level_sum(size_t level, int which, int channel) {
    double s = 0.0;
    for (const gpu::Texel& t : tex(level, which).texels) s += t[channel];
    return s;
  }
};

} // namespace

TEST(Reduction, ParentIsSumOfItsEightChildren) {
  PyramidRig rig(4, 2);
  int value = 0;
  for (int dz = 0; dz < 2; ++dz)
    for (int dy = 0; dy < 2; ++dy)
      for (int dx = 0; dx < 2; ++dx) {
        const Eigen::Vector3i child = Eigen::Vector3i(2, 0, 2) + Eigen::Vector3i(dx, dy, dz);
        rig.voxel(0, 0, child) = gpu::Texel(0.0f, 0.0f, 0.0f, static_cast<float>(value));
        rig.voxel(0, 2, child) = gpu::Texel(1.0f, 0.0f, 0.0f, 0.0f);
        ++value;
      }

  PyramidReducer reducer(rig.device);
  reducer.reduce_level(rig.res, 1);

  EXPECT_FLOAT_EQ(rig.voxel(1, 0, Eigen::Vector3i(1, 0, 1)).w(), 28.0f);
  EXPECT_FLOAT_EQ(rig.voxel(1, 2, Eigen::Vector3i(1, 0, 1)).x(), 8.0f);
  // Neighbouring parents received nothing
  EXPECT_FLOAT_EQ(rig.voxel(1, 0, Eigen::Vector3i(0, 0, 1)).w(), 0.0f);
  EXPECT_FLOAT_EQ(rig.voxel(1, 0, Eigen::Vector3i(1, 1, 1)).w(), 0.0f);
}

TEST(Reduction, ReduceLevelRejectsLevelZeroAndOutOfRange) {
  PyramidRig rig(4, 2);
  PyramidReducer reducer(rig.device);
  EXPECT_THROW(reducer.reduce_level(rig.res, 0), std::out_of_range);
  EXPECT_THROW(reducer.reduce_level(rig.res, rig.res.num_levels()), std::out_of_range);
}

TEST(Reduction, EveryLevelCarriesTheSameTotals) {
  std::mt19937 rng(17);
  std::uniform_real_distribution<float> d(-0.95f, 0.95f);
  std::uniform_real_distribution<float> m(0.5f, 1.5f);
  const size_t n = 300;
  std::vector<float> pos;
  for (size_t i = 0; i < n; ++i) pos.insert(pos.end(), {d(rng), d(rng), d(rng), m(rng)});

  PyramidRig rig(16, 4, n);
  rig.res.particles.upload(rig.device.arena(), pos, std::vector<float>(pos.size(), 0.0f));
  const geom::AABB3f bounds(Eigen::Vector3f::Constant(-1.0f), Eigen::Vector3f::Constant(1.0f));
  Aggregator(rig.device).run(rig.res, bounds);
  PyramidReducer(rig.device).run(rig.res);

  ASSERT_EQ(rig.res.num_levels(), 5u);
  for (int which = 0; which < 3; ++which) {
    for (int c = 0; c < 4; ++c) {
      const double base = rig.level_sum(0, which, c);
      for (size_t k = 1; k < rig.res.num_levels(); ++k) {
        EXPECT_NEAR(rig.level_sum(k, which, c), base, 1e-3 * (1.0 + std::abs(base)))
            << "target " << which << " channel " << c << " level " << k;
      }
    }
  }

  // The root holds the whole system
  const gpu::Texel& root = rig.voxel(4, 0, Eigen::Vector3i::Zero());
  EXPECT_NEAR(root.w(), rig.level_sum(0, 0, 3), 1e-3);
  EXPECT_EQ(rig.res.levels.back().texture_width, 1);
}

TEST(Reduction, EachParentMatchesItsChildrenAtEveryLevel) {
  std::mt19937 rng(3);
  std::uniform_real_distribution<float> d(-1.9f, 1.9f);
  const size_t n = 120;
  std::vector<float> pos;
  for (size_t i = 0; i < n; ++i) pos.insert(pos.end(), {d(rng), d(rng), d(rng), 1.0f});

  PyramidRig rig(8, 4, n);
  rig.res.particles.upload(rig.device.arena(), pos, std::vector<float>(pos.size(), 0.0f));
  const geom::AABB3f bounds(Eigen::Vector3f::Constant(-2.0f), Eigen::Vector3f::Constant(2.0f));
  Aggregator(rig.device).run(rig.res, bounds);
  PyramidReducer(rig.device).run(rig.res);

  for (size_t k = 1; k < rig.res.num_levels(); ++k) {
    const int g = rig.res.levels[k].grid_size;
    for (int z = 0; z < g; ++z)
      for (int y = 0; y < g; ++y)
        for (int x = 0; x < g; ++x) {
          const Eigen::Vector3i parent(x, y, z);
          gpu::Texel expected = gpu::Texel::Zero();
          for (int c = 0; c < 8; ++c) {
            const Eigen::Vector3i child = 2 * parent + Eigen::Vector3i(c & 1, (c >> 1) & 1, (c >> 2) & 1);
            expected += rig.voxel(k - 1, 1, child);
          }
          const gpu::Texel& got = rig.voxel(k, 1, parent);
          ASSERT_TRUE(got.isApprox(expected, 1e-5f) || (got - expected).norm() < 1e-4f)
              << "level " << k << " voxel " << parent.transpose();
        }
  }
}

TEST(Reduction, UnusedChildTilesDoNotLeakIntoParents) {
  // 8 slices with 3 per row leaves one unused tile at level 0
  gpu::Device device{gpu::Capabilities{}, false};
  PipelineResources res;
  res.allocate(device.arena(), ParticleLayout::for_count(1), build_level_configs(8, 3, 0));
  gpu::Texture2D& l0 = device.arena().texture(res.level_textures[0].a0);
  l0.clear(gpu::Texel::Ones());

  PyramidReducer(device).run(res);
  const LevelConfig& l1 = res.levels[1];
  const gpu::Texture2D& t1 = device.arena().texture(res.level_textures[1].a0);
  for (int ty = 0; ty < l1.texture_height; ++ty)
    for (int tx = 0; tx < l1.texture_width; ++tx) {
      Eigen::Vector3i v;
      if (l1.texel_to_voxel(tx, ty, v)) {
        EXPECT_FLOAT_EQ(t1.fetch(tx, ty).w(), 8.0f);
      }
    }
}
