// benchmarks/pipeline_bench.cpp
#include <benchmark/benchmark.h>
#include "Aggregator.h"
#include "BoundsReducer.h"
#include "Diagnostics.h"
#include "Integrator.h"
#include "PyramidReducer.h"
#include "QuadrupoleGravity.h"
#include "ScenarioFactory.h"
#include "TraversalKernel.h"
#include <iostream>
#include <memory>

// One set of pipeline stages over a Plummer cloud, built outside the timed loop
class StageFixture {
public:
    explicit StageFixture(size_t n, bool threading = true)
        : device_(gpu::Capabilities{}, threading) {
        ScenarioFactory factory(123);
        scenario_ = factory.plummer_cloud(n);
        const QuadrupoleGravity::Config& cfg = scenario_.config;
        bounds_ = cfg.world_bounds;

        resources_.allocate(device_.arena(), ParticleLayout::for_count(n),
                            build_level_configs(cfg.grid_size, cfg.slices_per_row, cfg.num_levels));
        resources_.particles.upload(device_.arena(), scenario_.position_mass, scenario_.velocity);

        aggregator_ = std::make_unique<Aggregator>(device_);
        reducer_ = std::make_unique<PyramidReducer>(device_);
        traversal_ = std::make_unique<TraversalKernel>(device_, resources_.num_levels());
        integrator_ = std::make_unique<Integrator>(device_);

        params_.theta = cfg.theta;
        params_.softening = cfg.softening;
        params_.gravity = cfg.gravity;
    }

    void aggregate() { aggregator_->run(resources_, bounds_); }
    void reduce() { reducer_->run(resources_); }
    void traverse() { traversal_->run(resources_, bounds_, params_); }
    void integrate() { integrator_->run(resources_, Integrator::Params{}); }

    const gpu::Texture2D& positions() const { return device_.arena().texture(resources_.particles.position()); }
    const Scenario& scenario() const { return scenario_; }
    TraversalKernel::Params& params() { return params_; }
    const TraversalKernel& traversal() const { return *traversal_; }

private:
    gpu::Device device_;
    Scenario scenario_;
    geom::AABB3f bounds_;
    PipelineResources resources_;
    TraversalKernel::Params params_;
    std::unique_ptr<Aggregator> aggregator_;
    std::unique_ptr<PyramidReducer> reducer_;
    std::unique_ptr<TraversalKernel> traversal_;
    std::unique_ptr<Integrator> integrator_;
};

// ===========================================================================================
// STAGE BENCHMARKS
// ===========================================================================================

static void BM_AggregateLevel0(benchmark::State& st) {
    StageFixture fx(st.range(0));
    for (auto _ : st) {
        fx.aggregate();
        benchmark::ClobberMemory();
    }
    st.SetItemsProcessed(st.iterations() * st.range(0));
}
BENCHMARK(BM_AggregateLevel0)->RangeMultiplier(4)->Range(1<<10, 1<<16)->Unit(benchmark::kMicrosecond);

static void BM_ReducePyramid(benchmark::State& st) {
    StageFixture fx(st.range(0));
    fx.aggregate();
    for (auto _ : st) {
        fx.reduce();
        benchmark::ClobberMemory();
    }
}
BENCHMARK(BM_ReducePyramid)->Arg(1<<12)->Unit(benchmark::kMicrosecond);

static void BM_Traversal(benchmark::State& st) {
    StageFixture fx(st.range(0));
    fx.aggregate();
    fx.reduce();
    for (auto _ : st) {
        fx.traverse();
        benchmark::ClobberMemory();
    }
    const TraversalKernel::Counters& c = fx.traversal().last_counters();
    st.counters["cells/particle"] = static_cast<double>(c.cells_tested) / st.range(0);
    st.counters["far/particle"] = static_cast<double>(c.far_field_cells) / st.range(0);
    st.SetItemsProcessed(st.iterations() * st.range(0));
}
BENCHMARK(BM_Traversal)->RangeMultiplier(4)->Range(1<<10, 1<<14)->Unit(benchmark::kMillisecond);

static void BM_TraversalTheta(benchmark::State& st) {
    StageFixture fx(4096);
    fx.params().theta = static_cast<float>(st.range(0)) / 10.0f;
    fx.aggregate();
    fx.reduce();
    for (auto _ : st) {
        fx.traverse();
        benchmark::ClobberMemory();
    }
    st.counters["cells/particle"] =
        static_cast<double>(fx.traversal().last_counters().cells_tested) / 4096.0;
}
BENCHMARK(BM_TraversalTheta)->DenseRange(3, 9, 3)->Unit(benchmark::kMillisecond);

static void BM_Integrate(benchmark::State& st) {
    StageFixture fx(st.range(0));
    fx.aggregate();
    fx.reduce();
    fx.traverse();
    for (auto _ : st) {
        fx.integrate();
        benchmark::ClobberMemory();
    }
    st.SetItemsProcessed(st.iterations() * st.range(0));
}
BENCHMARK(BM_Integrate)->RangeMultiplier(4)->Range(1<<10, 1<<16)->Unit(benchmark::kMicrosecond);

static void BM_BoundsReduction(benchmark::State& st) {
    StageFixture fx(st.range(0));
    BoundsReducer reducer;
    for (auto _ : st) {
        BoundsReducer::Result r = reducer.reduce(fx.positions(), st.range(0));
        benchmark::DoNotOptimize(r);
    }
    st.SetItemsProcessed(st.iterations() * st.range(0));
}
BENCHMARK(BM_BoundsReduction)->RangeMultiplier(4)->Range(1<<10, 1<<16)->Unit(benchmark::kMicrosecond);

// ===========================================================================================
// FULL STEP AND REFERENCE
// ===========================================================================================

static void BM_FullStep(benchmark::State& st) {
    EventBus bus;
    ScenarioFactory factory(123);
    Scenario s = factory.plummer_cloud(st.range(0));
    QuadrupoleGravity sim(bus, s.config, s.position_mass, s.velocity);
    for (auto _ : st) {
        sim.step();
    }
    st.counters["traversal_ms"] = sim.get_performance_stats().last_traversal_ms;
    st.SetItemsProcessed(st.iterations() * st.range(0));
}
BENCHMARK(BM_FullStep)->RangeMultiplier(4)->Range(1<<10, 1<<14)->Unit(benchmark::kMillisecond);

static void BM_DirectSumReference(benchmark::State& st) {
    ScenarioFactory factory(123);
    Scenario s = factory.plummer_cloud(st.range(0));
    for (auto _ : st) {
        auto acc = diagnostics::direct_accelerations(s.position_mass, s.config.gravity, s.config.softening);
        benchmark::DoNotOptimize(acc.data());
    }
    st.SetItemsProcessed(st.iterations() * st.range(0));
}
BENCHMARK(BM_DirectSumReference)->RangeMultiplier(4)->Range(1<<10, 1<<12)->Unit(benchmark::kMillisecond);

// Custom main with configuration reporting
int main(int argc, char** argv) {
    ::benchmark::Initialize(&argc, argv);

    if (::benchmark::ReportUnrecognizedArguments(argc, argv)) return 1;

    QuadrupoleGravity::Config cfg;
    const auto levels = build_level_configs(cfg.grid_size, cfg.slices_per_row, cfg.num_levels);

    std::cout << "\nGravity Pyramid Benchmark Suite\n";
    std::cout << "===============================\n";
    std::cout << "Configuration:\n";
    std::cout << "  Finest grid: " << cfg.grid_size << "^3 (" << levels.front().texture_width
              << "x" << levels.front().texture_height << " texels)\n";
    std::cout << "  Levels: " << levels.size() << "\n";
    std::cout << "  Theta: " << cfg.theta << "\n";
    std::cout << "  Quadrupole: " << (cfg.enable_quadrupole ? "on" : "off") << "\n";

#ifdef _OPENMP
    std::cout << "  OpenMP support: available\n";
#else
    std::cout << "  OpenMP support: not available\n";
#endif

    std::cout << "\nRunning benchmarks...\n\n";

    ::benchmark::RunSpecifiedBenchmarks();
    ::benchmark::Shutdown();
    return 0;
}
