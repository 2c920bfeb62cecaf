#include <benchmark/benchmark.h>

#include <map>
#include <string>

#include "io_util.h"

// Inputs loaded from disk, keyed by path
std::map<std::string, std::string> test_data;

// Cached contents of `filename`; throws CsvException when it cannot be read
const std::string& corpus(const std::string& filename) {
  auto it = test_data.find(filename);
  if (it == test_data.end()) {
    it = test_data.emplace(filename, unicsv::load_file(filename)).first;
  }
  return it->second;
}

BENCHMARK_MAIN();
