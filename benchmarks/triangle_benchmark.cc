// SPDX-License-Identifier: MIT
#include <benchmark/benchmark.h>
#include "src/triangle/arithmetic_triangle.hpp"
#include <cstdint>

using namespace arith;

// Value lookup on a fresh triangle: every interior value is computed
static void BM_ValueCold(benchmark::State& state) {
    const int64_t row = state.range(0);
    for (auto _ : state) {
        ArithmeticTriangle<double> triangle(1.0);
        benchmark::DoNotOptimize(triangle.value(row, row / 2));
    }
    state.SetComplexityN(row);
}

// Value lookup served from the memo table
static void BM_ValueWarm(benchmark::State& state) {
    const int64_t row = state.range(0);
    ArithmeticTriangle<double> triangle(1.0);
    benchmark::DoNotOptimize(triangle.value(row, row / 2));

    for (auto _ : state) {
        benchmark::DoNotOptimize(triangle.value(row, row / 2));
    }
}

// Lookup without write-back: scratch-row fill on every call
static void BM_ValueNoWriteBack(benchmark::State& state) {
    const int64_t row = state.range(0);
    ArithmeticTriangle<double> triangle(1.0, TriangleConfig{.write_back = CacheWriteBack::Disabled});

    for (auto _ : state) {
        benchmark::DoNotOptimize(triangle.value(row, row / 2));
    }
    state.SetComplexityN(row);
}

static void BM_RowSumShift(benchmark::State& state) {
    const int64_t row = state.range(0);
    ArithmeticTriangle<int64_t> triangle;

    for (auto _ : state) {
        benchmark::DoNotOptimize(triangle.sum_of_row(row));
    }
    state.SetLabel("integer shift");
}

static void BM_RowSumByHalves(benchmark::State& state) {
    const int64_t row = state.range(0);
    ArithmeticTriangle<double> triangle(1.0);

    for (auto _ : state) {
        benchmark::DoNotOptimize(triangle.sum_of_row(row));
    }
    state.SetLabel("half row");
}

// Wide range over the interior: row sum minus the four exterior columns
static void BM_RangeSumMinusExterior(benchmark::State& state) {
    const int64_t row = state.range(0);
    ArithmeticTriangle<int64_t> triangle;

    for (auto _ : state) {
        benchmark::DoNotOptimize(triangle.sum_of_columns(ColumnRange{1, row}, row));
    }
}

// Same width summed column by column (double has no exact subtraction shortcut)
static void BM_RangeSumInterior(benchmark::State& state) {
    const int64_t row = state.range(0);
    ArithmeticTriangle<double> triangle(1.0);

    for (auto _ : state) {
        benchmark::DoNotOptimize(triangle.sum_of_columns(ColumnRange{2, row - 1}, row));
    }
}

BENCHMARK(BM_ValueCold)->RangeMultiplier(4)->Range(16, 1024)->Complexity();
BENCHMARK(BM_ValueWarm)->Arg(64)->Arg(1024);
BENCHMARK(BM_ValueNoWriteBack)->RangeMultiplier(4)->Range(16, 1024)->Complexity();
BENCHMARK(BM_RowSumShift)->Arg(62);
BENCHMARK(BM_RowSumByHalves)->Arg(62)->Arg(1000);
BENCHMARK(BM_RangeSumMinusExterior)->Arg(60);
BENCHMARK(BM_RangeSumInterior)->Arg(60)->Arg(1000);

BENCHMARK_MAIN();
