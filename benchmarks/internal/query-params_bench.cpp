// QueryParams benchmarks measuring query string parsing and lookup under
// various inputs:
//  - Typical short URLs (a handful of small parameters)
//  - Percent-heavy values (most chars are escapes)
//  - Inputs hitting the limits (more parameters than slots, oversized values)
//  - Lookups of present and missing keys

#include <benchmark/benchmark.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "stackquery/percent-decode.hpp"
#include "stackquery/query-params.hpp"

namespace stackquery {

namespace {

constexpr std::string_view kTypicalUrl =
    "https://example.com/search?q=fixed+capacity&lang=en&page=2&sort=date&utm_source=newsletter";

std::string MakePercentHeavyUrl() {
  std::string url = "/p?data=";
  for (int idx = 0; idx < 40; ++idx) {
    url.append("%E2%98%83");
  }
  url.append("&path=%2Fusr%2Flocal%2Fbin");
  return url;
}

std::string MakeOverflowingUrl() {
  std::string url = "/p?";
  for (std::size_t idx = 0; idx < 4 * kDefaultMaxQueryParams; ++idx) {
    url.append("key").append(std::to_string(idx)).append("=").append(std::string(2 * kDefaultMaxValueLen, 'v'));
    url.push_back('&');
  }
  return url;
}

const std::string kPercentHeavyUrl = MakePercentHeavyUrl();
const std::string kOverflowingUrl = MakeOverflowingUrl();

}  // namespace

static void BM_ParseTypical(benchmark::State& state) {
  for (auto _ : state) {
    DefaultQueryParams params;
    params.parse(kTypicalUrl);
    benchmark::DoNotOptimize(params);
  }
  state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations()) * static_cast<std::int64_t>(kTypicalUrl.size()));
}
BENCHMARK(BM_ParseTypical);

static void BM_ParsePercentHeavy(benchmark::State& state) {
  for (auto _ : state) {
    DefaultQueryParams params;
    params.parse(kPercentHeavyUrl);
    benchmark::DoNotOptimize(params);
  }
  state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations()) * static_cast<std::int64_t>(kPercentHeavyUrl.size()));
}
BENCHMARK(BM_ParsePercentHeavy);

static void BM_ParseOverflowing(benchmark::State& state) {
  for (auto _ : state) {
    DefaultQueryParams params;
    params.parse(kOverflowingUrl);
    benchmark::DoNotOptimize(params);
  }
}
BENCHMARK(BM_ParseOverflowing);

static void BM_PercentDecode(benchmark::State& state) {
  constexpr std::string_view kEncoded = "New%20York+City%2C%20NY%20%E2%9C%93";
  for (auto _ : state) {
    auto decoded = url::PercentDecode<kDefaultMaxValueLen>(kEncoded);
    benchmark::DoNotOptimize(decoded);
  }
}
BENCHMARK(BM_PercentDecode);

static void BM_GetPresentAndMissing(benchmark::State& state) {
  DefaultQueryParams params;
  params.parse(kTypicalUrl);
  for (auto _ : state) {
    benchmark::DoNotOptimize(params.get("utm_source"));
    benchmark::DoNotOptimize(params.get("missing"));
  }
}
BENCHMARK(BM_GetPresentAndMissing);

}  // namespace stackquery

BENCHMARK_MAIN();
