#include <gtest/gtest.h>
#include "Aggregator.h"
#include "GpuDevice.h"
#include "PipelineResources.h"
#include <cmath>
#include <limits>
#include <random>

// Device + resources with a single-level pyramid of the given grid
struct AggregationRig {
  gpu::Device device{gpu::Capabilities{}, false};
  PipelineResources res;
  geom::AABB3f bounds{Eigen::Vector3f::Constant(-2.0f), Eigen::Vector3f::Constant(2.0f)};

  AggregationRig(const std::vector<float>& pos, int grid, int slices) {
    const size_t n = pos.size() / 4;
    res.allocate(device.arena(), ParticleLayout::for_count(n), build_level_configs(grid, slices, 0));
    res.particles.upload(device.arena(), pos, std::vector<float>(pos.size(), 0.0f));
  }

  const gpu::Texel& a(int which, const Eigen::Vector3i& v) {
    const LevelConfig& cfg = res.levels[0];
    const LevelTextures& t = res.level_textures[0];
    const gpu::TextureId id = which == 0 ? t.a0 : (which == 1 ? t.a1 : t.a2);
    const Eigen::Vector2i tx = cfg.voxel_to_texel(v);
    return device.arena().texture(id).fetch(tx.x(), tx.y());
  }
};

TEST(Aggregation, VoxelIndexClampsOutsideBounds) {
  geom::AABB3f b(Eigen::Vector3f::Zero(), Eigen::Vector3f::Constant(8.0f));
  EXPECT_EQ(Aggregator::voxel_for_position(Eigen::Vector3f(0.5f, 1.5f, 7.5f), b, 8), Eigen::Vector3i(0, 1, 7));
  EXPECT_EQ(Aggregator::voxel_for_position(Eigen::Vector3f(-3.0f, 9.0f, 8.0f), b, 8), Eigen::Vector3i(0, 7, 7));
}

TEST(Aggregation, SingleParticleDepositsAllMoments) {
  const std::vector<float> pos = {0.3f, -0.7f, 1.1f, 2.0f};
  AggregationRig rig(pos, 8, 4);
  Aggregator agg(rig.device);
  agg.run(rig.res, rig.bounds);

  const Eigen::Vector3i v = Aggregator::voxel_for_position(Eigen::Vector3f(0.3f, -0.7f, 1.1f), rig.bounds, 8);
  const gpu::Texel& a0 = rig.a(0, v);
  const gpu::Texel& a1 = rig.a(1, v);
  const gpu::Texel& a2 = rig.a(2, v);
  EXPECT_FLOAT_EQ(a0.w(), 2.0f);
  EXPECT_FLOAT_EQ(a0.x(), 0.6f);
  EXPECT_FLOAT_EQ(a0.y(), -1.4f);
  EXPECT_FLOAT_EQ(a0.z(), 2.2f);
  EXPECT_FLOAT_EQ(a1.x(), 2.0f * 0.3f * 0.3f);
  EXPECT_FLOAT_EQ(a1.y(), 2.0f * 0.7f * 0.7f);
  EXPECT_FLOAT_EQ(a1.z(), 2.0f * 1.1f * 1.1f);
  EXPECT_FLOAT_EQ(a1.w(), 2.0f * 0.3f * -0.7f);
  EXPECT_FLOAT_EQ(a2.x(), 2.0f * 0.3f * 1.1f);
  EXPECT_FLOAT_EQ(a2.y(), 2.0f * -0.7f * 1.1f);
  EXPECT_EQ(agg.last_deposited(), 1u);
}

TEST(Aggregation, ConservesMassAndFirstMoment) {
  std::mt19937 rng(5);
  std::uniform_real_distribution<float> d(-1.9f, 1.9f);
  std::uniform_real_distribution<float> m(0.1f, 2.0f);
  std::vector<float> pos;
  double mass = 0.0, mx = 0.0;
  for (int i = 0; i < 500; ++i) {
    const float x = d(rng), y = d(rng), z = d(rng), w = m(rng);
    pos.insert(pos.end(), {x, y, z, w});
    mass += w;
    mx += double(w) * x;
  }
  AggregationRig rig(pos, 16, 4);
  Aggregator(rig.device).run(rig.res, rig.bounds);

  double got_mass = 0.0, got_mx = 0.0;
  for (const gpu::Texel& t : rig.device.arena().texture(rig.res.level_textures[0].a0).texels) {
    got_mass += t.w();
    got_mx += t.x();
  }
  EXPECT_NEAR(got_mass, mass, 1e-3 * mass);
  EXPECT_NEAR(got_mx, mx, 1e-2);
}

TEST(Aggregation, InvalidParticlesDepositNothing) {
  const float nan = std::numeric_limits<float>::quiet_NaN();
  const float inf = std::numeric_limits<float>::infinity();
  const std::vector<float> pos = {
    0.5f, 0.5f, 0.5f, 1.0f,     // valid
    0.5f, 0.5f, 0.5f, 0.0f,     // zero mass
    0.5f, 0.5f, 0.5f, -3.0f,    // negative mass
    nan,  0.5f, 0.5f, 1.0f,     // NaN position
    0.5f, inf,  0.5f, 1.0f,     // infinite position
  };
  AggregationRig rig(pos, 8, 4);
  Aggregator agg(rig.device);
  agg.run(rig.res, rig.bounds);
  EXPECT_EQ(agg.last_deposited(), 1u);

  double total = 0.0;
  for (const gpu::Texel& t : rig.device.arena().texture(rig.res.level_textures[0].a0).texels) {
    ASSERT_TRUE(t.allFinite());
    total += t.w();
  }
  EXPECT_DOUBLE_EQ(total, 1.0);
}

TEST(Aggregation, LevelIsClearedBetweenRuns) {
  const std::vector<float> pos = {1.0f, 1.0f, 1.0f, 1.0f, -1.0f, -1.0f, -1.0f, 1.0f};
  AggregationRig rig(pos, 8, 4);
  Aggregator agg(rig.device);
  agg.run(rig.res, rig.bounds);
  agg.run(rig.res, rig.bounds);

  double total = 0.0;
  for (const gpu::Texel& t : rig.device.arena().texture(rig.res.level_textures[0].a0).texels) {
    total += t.w();
  }
  EXPECT_DOUBLE_EQ(total, 2.0);
}

TEST(Aggregation, StrayParticlesLandInBoundaryVoxels) {
  // Beyond a stale box: still counted, in the clamped voxel
  const std::vector<float> pos = {5.0f, -7.0f, 0.0f, 1.0f};
  AggregationRig rig(pos, 8, 4);
  Aggregator(rig.device).run(rig.res, rig.bounds);
  EXPECT_FLOAT_EQ(rig.a(0, Eigen::Vector3i(7, 0, 4)).w(), 1.0f);
}
