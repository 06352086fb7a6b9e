/*----- System Includes -----*/

#include <random>
#include <string>
#include <vector>
#include <algorithm>
#include <benchmark/benchmark.h>

/*----- Local Includes -----*/

#include "../include/concord.h"

/*----- Type Declarations -----*/

struct benchmark_helper : benchmark::Fixture {

  /*---- Test Construction/Destruction Functions -----*/

  void SetUp(benchmark::State const&) override;
  void TearDown(benchmark::State const&) override;

  /*----- Helpers -----*/

  std::string generate_flat_document(size_t num_flows) const;
  std::string generate_nested_document(size_t depth) const;
  std::vector<concord::event> record_events(std::string const& yaml) const;

  /*----- Members -----*/

  std::string flat_yaml, nested_yaml;
  std::vector<concord::event> flat_events;

  benchmark::Counter rate_counter;

};

/*----- Globals -----*/

constexpr auto static_flow_count = 64;
constexpr auto static_nesting_depth = 32;

/*----- Helpers -----*/

template <int64_t low, int64_t high>
int64_t rand_int() {
  static std::mt19937 engine(std::random_device {}());
  static std::uniform_int_distribution<int64_t> dist(low, high);
  return dist(engine);
}

std::string rand_string(size_t len) {
  std::string retval(len, '\0');
  std::generate(retval.begin(), retval.end(), [] {
    return static_cast<char>('a' + rand_int<0, 25>());
  });
  return retval;
}

/*----- Benchmark Definitions -----*/

BENCHMARK_F(benchmark_helper, parse_flat_document) (benchmark::State& state) {
  for (auto _ : state) {
    benchmark::DoNotOptimize(concord::parse_stream(flat_yaml));
    ++rate_counter;
  }
  state.counters["parsed flat documents"] = rate_counter;
}

BENCHMARK_F(benchmark_helper, parse_nested_document) (benchmark::State& state) {
  for (auto _ : state) {
    benchmark::DoNotOptimize(concord::parse_stream(nested_yaml));
    ++rate_counter;
  }
  state.counters["parsed nested documents"] = rate_counter;
}

BENCHMARK_F(benchmark_helper, parse_recorded_events) (benchmark::State& state) {
  for (auto _ : state) {
    concord::replay_source src {flat_events};
    concord::cursor in {src};
    benchmark::DoNotOptimize(concord::parse_stream(in));
    ++rate_counter;
  }
  state.counters["parsed flat documents"] = rate_counter;
}

BENCHMARK_F(benchmark_helper, scan_flat_document) (benchmark::State& state) {
  for (auto _ : state) {
    benchmark::DoNotOptimize(record_events(flat_yaml));
    ++rate_counter;
  }
  state.counters["scanned flat documents"] = rate_counter;
}

BENCHMARK_DEFINE_F(benchmark_helper, decode_plain_scalars) (benchmark::State& state) {
  std::vector<std::string> scalars;
  for (auto i = 0; i < state.range(0); ++i) {
    switch (i % 4) {
      case 0:
        scalars.push_back(std::to_string(rand_int<-100000, 100000>()));
        break;
      case 1:
        scalars.push_back(std::to_string(rand_int<0, 1000>()) + "." + std::to_string(rand_int<0, 1000>()));
        break;
      case 2:
        scalars.push_back(i % 8 == 2 ? "true" : "false");
        break;
      default:
        scalars.push_back(rand_string(12));
    }
  }

  for (auto _ : state) {
    for (auto const& text : scalars) {
      benchmark::DoNotOptimize(concord::decode_scalar(text, concord::scalar_style::plain));
    }
    rate_counter += scalars.size();
  }
  state.counters["decoded scalars"] = rate_counter;
}

BENCHMARK_REGISTER_F(benchmark_helper, decode_plain_scalars)->Range(1 << 4, 1 << 12);

BENCHMARK_MAIN();

/*----- Helper Implementations -----*/

void benchmark_helper::SetUp(benchmark::State const&) {
  flat_yaml = generate_flat_document(static_flow_count);
  nested_yaml = generate_nested_document(static_nesting_depth);
  flat_events = record_events(flat_yaml);
  rate_counter = benchmark::Counter(0, benchmark::Counter::kIsRate);
}

void benchmark_helper::TearDown(benchmark::State const&) {

}

std::string benchmark_helper::generate_flat_document(size_t num_flows) const {
  std::string yaml = "configuration:\n  runtime: concord-v2\n  debug: false\nflows:\n";
  for (size_t i = 0; i < num_flows; ++i) {
    yaml += "  " + rand_string(10) + ":\n";
    yaml += "    - log: \"" + rand_string(24) + "\"\n";
    yaml += "    - task: " + rand_string(6) + "\n";
    yaml += "      in:\n";
    yaml += "        url: https://" + rand_string(8) + ".example.com\n";
    yaml += "        attempts: " + std::to_string(rand_int<1, 10>()) + "\n";
    yaml += "        ratio: 0." + std::to_string(rand_int<1, 99>()) + "\n";
    yaml += "      out: result\n";
    yaml += "      retry:\n";
    yaml += "        times: 3\n";
    yaml += "        delay: 5\n";
    yaml += "    - if: ${result.ok}\n";
    yaml += "      then:\n";
    yaml += "        - checkpoint: " + rand_string(8) + "\n";
    yaml += "      else:\n";
    yaml += "        - throw: failed\n";
    yaml += "    - set:\n";
    yaml += "        a: 1\n";
    yaml += "        b: [x, y, z]\n";
  }
  return yaml;
}

std::string benchmark_helper::generate_nested_document(size_t depth) const {
  std::string yaml = "flows:\n  main:\n";
  std::string indent = "    ";
  for (size_t i = 0; i < depth; ++i) {
    yaml += indent + "- block:\n";
    indent += "    ";
  }
  yaml += indent + "- log: bottom\n";
  return yaml;
}

std::vector<concord::event> benchmark_helper::record_events(std::string const& yaml) const {
  concord::yaml_source src {yaml};
  std::vector<concord::event> events;
  do {
    events.push_back(src.next());
  } while (!events.back().is(concord::event_type::stream_end));
  return events;
}
