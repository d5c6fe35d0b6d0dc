#include "brotbench/brotbench.hpp"
#include <benchmark/benchmark.h>
#include <algorithm>
#include <chrono>
#include <complex>
#include <cstdint>
#include <format>
#include <memory>
#include <thread>

#include <exec/static_thread_pool.hpp>

struct TestPoint {
  std::complex<double> point;
  std::string_view name;
};

constexpr TestPoint test_points[] = {
    {{0.0, 0.0}, "WorstCase"},  // Will run full iterations
    {{-0.75, 0.1}, "EdgeCase"}, // Medium iterations
    {{2.0, 2.0}, "BestCase"},   // Will escape quickly
};

constexpr auto MAX_ITER = 10'000uz;

// 1400x800 at 256 iterations, the classic SQL benchmark size.
constexpr auto VIEW_WIDTH = 1400uz;
constexpr auto VIEW_HEIGHT = 800uz;
constexpr auto VIEW_MAX_ITER = 256uz;
static auto THREAD_COUNT = std::max(1u, std::thread::hardware_concurrency());

/// Global state
static std::unique_ptr<exec::static_thread_pool> pool;

/// Setup and Teardown
static void PoolSetup(const benchmark::State &state) {
  pool = std::make_unique<exec::static_thread_pool>(static_cast<std::uint32_t>(state.range(1)));
}
static void PoolTeardown(const benchmark::State &) { pool.reset(); }

/// Single point
static void BM_EscapeTime_Naive(benchmark::State &state) {
  auto const &test_point = test_points[state.range(0)];
  auto c = test_point.point;
  state.SetLabel(std::format("std::complex [{}]", test_point.name));
  for (auto _ : state) {
    benchmark::DoNotOptimize(c);
    auto result = brotbench::naive::escape_time(c, MAX_ITER);
    benchmark::DoNotOptimize(result);
  }
  state.counters["calc"] = benchmark::Counter(1, benchmark::Counter::kIsIterationInvariantRate);
}
BENCHMARK(BM_EscapeTime_Naive)->DenseRange(0, 2);

static void BM_EscapeTime_Scalar(benchmark::State &state) {
  auto const &test_point = test_points[state.range(0)];
  auto c = test_point.point;
  state.SetLabel(std::format("Save partial calculations [{}]", test_point.name));
  for (auto _ : state) {
    benchmark::DoNotOptimize(c);
    auto result = brotbench::escape_time(c, MAX_ITER);
    benchmark::DoNotOptimize(result);
  }
  state.counters["calc"] = benchmark::Counter(1, benchmark::Counter::kIsIterationInvariantRate);
}
BENCHMARK(BM_EscapeTime_Scalar)->DenseRange(0, 2);

static void BM_EscapeTime_Simd(benchmark::State &state) {
  using batch = brotbench::simd::batch;
  constexpr auto width = batch::size;

  auto const &test_point = test_points[state.range(0)];
  auto a = batch(test_point.point.real());
  auto b = batch(test_point.point.imag());
  state.SetLabel(std::format("SIMD [{}]", test_point.name));
  for (auto _ : state) {
    benchmark::DoNotOptimize(a);
    benchmark::DoNotOptimize(b);
    auto result = brotbench::simd::escape_time(a, b, MAX_ITER);
    benchmark::DoNotOptimize(result);
  }
  state.counters["calc"] = benchmark::Counter(width, benchmark::Counter::kIsIterationInvariantRate);
}
BENCHMARK(BM_EscapeTime_Simd)->DenseRange(0, 2);

/// Whole viewport, one run per registered backend
static void BM_Evaluate(benchmark::State &state) {
  auto const &backend = brotbench::backends()[state.range(0)];
  auto const viewport = brotbench::standard_viewport(VIEW_WIDTH, VIEW_HEIGHT);
  state.SetLabel(std::string{backend.name});

  for (auto _ : state) {
    auto start = std::chrono::high_resolution_clock::now();
    auto grid = backend.evaluate(viewport, VIEW_MAX_ITER, *pool);
    auto end = std::chrono::high_resolution_clock::now();
    benchmark::DoNotOptimize(grid);
    auto elapsed_seconds = std::chrono::duration_cast<std::chrono::duration<double>>(end - start);
    state.SetIterationTime(elapsed_seconds.count());
    benchmark::ClobberMemory();
  }
  state.counters["pixels"] = benchmark::Counter(
      double(viewport.pixel_count()), benchmark::Counter::kIsIterationInvariantRate
  );
}
BENCHMARK(BM_Evaluate)
    ->UseManualTime()
    ->Unit(benchmark::kMillisecond)
    ->Setup(PoolSetup)
    ->Teardown(PoolTeardown)
    ->Apply([](benchmark::internal::Benchmark *b) {
      for (std::int64_t i = 0; i != std::int64_t(brotbench::backends().size()); ++i) {
        b->Args({i, THREAD_COUNT});
      }
    });

/// Color encoding of a precomputed grid
static void BM_Render(benchmark::State &state) {
  auto const palette = static_cast<brotbench::Palette>(state.range(0));
  auto const grid = brotbench::evaluate(
      brotbench::standard_viewport(VIEW_WIDTH, VIEW_HEIGHT), VIEW_MAX_ITER
  );
  state.SetLabel(std::format("{} palette", brotbench::palette_name(palette)));
  for (auto _ : state) {
    auto pixels = brotbench::render(grid, VIEW_MAX_ITER, palette);
    benchmark::DoNotOptimize(pixels);
  }
  state.counters["pixels"] =
      benchmark::Counter(double(grid.size()), benchmark::Counter::kIsIterationInvariantRate);
}
BENCHMARK(BM_Render)
    ->Unit(benchmark::kMillisecond)
    ->Arg(static_cast<int>(brotbench::Palette::polynomial))
    ->Arg(static_cast<int>(brotbench::Palette::hot));

BENCHMARK_MAIN();
