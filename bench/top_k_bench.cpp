#include <benchmark/benchmark.h>

#include <functional>
#include <vector>

#include "dev/utils.hpp"
#include "seqflow/seqflow.hpp"

using namespace seqflow;

namespace {
constexpr size_t data_size = 100000;
}

static void BM_FilterAllMax(benchmark::State &state) {
  auto const data = utils::make_unif_vector<int>(data_size, 0, 1000, 7);

  for (auto _ : state) {
    benchmark::DoNotOptimize(count(filter_all_max(from_vector(data))));
  }
}

// Table size crosses the linear-scan / binary-search threshold
static void BM_FilterMaxKeys(benchmark::State &state) {
  auto const n = state.range(0);
  auto const data = utils::make_unif_vector<int>(data_size, 0, 100000, 7);

  for (auto _ : state) {
    benchmark::DoNotOptimize(count(filter_max_keys(from_vector(data), n, std::less<int>{})));
  }
}

static void BM_FilterMaxValues(benchmark::State &state) {
  auto const n = state.range(0);
  auto const data = utils::make_unif_vector<int>(data_size, 0, 1000, 7);

  for (auto _ : state) {
    benchmark::DoNotOptimize(count(filter_max_values(from_vector(data), n, std::less<int>{})));
  }
}

static void BM_CrossProductOrdered(benchmark::State &state) {
  auto const n = static_cast<size_t>(state.range(0));
  auto const data = utils::make_unif_shuffle(utils::make_unif_vector<int>(n, 0, 1 << 20, 3), 5);

  for (auto _ : state) {
    benchmark::DoNotOptimize(count(cross_product_naturally_ordered(from_vector(data))));
  }
}

BENCHMARK(BM_FilterAllMax);
BENCHMARK(BM_FilterMaxKeys)->Arg(8)->Arg(64)->Arg(512);
BENCHMARK(BM_FilterMaxValues)->Arg(8)->Arg(64)->Arg(512);
BENCHMARK(BM_CrossProductOrdered)->Arg(100)->Arg(1000);

BENCHMARK_MAIN();
