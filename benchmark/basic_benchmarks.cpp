#include <benchmark/benchmark.h>

#include <cstdlib>
#include <string>
#include <vector>

#include "csv_reader.h"
#include "csv_writer.h"
#include "decoding_buffer.h"
#include "dialect.h"
#include "error.h"
#include "scalar_buffer.h"
#include "scalar_encoder.h"
#include "scalar_source.h"
#include "stream_writer.h"

const std::string& corpus(const std::string& filename);

namespace {

// rows x cols of short numeric and text cells, every fourth cell quoted
std::string make_csv(size_t rows, size_t cols, char delimiter = ',') {
  std::string out;
  for (size_t r = 0; r < rows; ++r) {
    for (size_t c = 0; c < cols; ++c) {
      if (c > 0) out += delimiter;
      if ((r + c) % 4 == 0) {
        out += "\"cell " + std::to_string(r) + delimiter + "\"\"" + std::to_string(c) + "\"\"\"";
      } else {
        out += std::to_string(r * cols + c);
      }
    }
    out += '\n';
  }
  return out;
}

}  // namespace

// Reading with explicit delimiters
static void BM_ReadRows(benchmark::State& state) {
  std::string data = make_csv(static_cast<size_t>(state.range(0)), 8);
  for (auto _ : state) {
    unicsv::Utf8Source source(data);
    unicsv::CsvReader reader(source);
    size_t fields = 0;
    while (auto row = reader.read_row()) fields += row->size();
    benchmark::DoNotOptimize(fields);
  }
  state.SetBytesProcessed(static_cast<int64_t>(data.size() * state.iterations()));
}
BENCHMARK(BM_ReadRows)->RangeMultiplier(10)->Range(100, 100000)->Unit(benchmark::kMillisecond);

// Reading with delimiters and header left to inference
static void BM_ReadInferred(benchmark::State& state) {
  std::string data = make_csv(static_cast<size_t>(state.range(0)), 8, ';');
  for (auto _ : state) {
    unicsv::Utf8Source source(data);
    unicsv::CsvReader reader(source, unicsv::ReaderOptions::inferred());
    benchmark::DoNotOptimize(reader.read_all());
  }
  state.SetBytesProcessed(static_cast<int64_t>(data.size() * state.iterations()));
}
BENCHMARK(BM_ReadInferred)->RangeMultiplier(10)->Range(100, 100000)->Unit(benchmark::kMillisecond);

static void BM_InferDelimiters(benchmark::State& state) {
  std::string data = make_csv(200, static_cast<size_t>(state.range(0)), '\t');
  unicsv::DialectDetector detector;
  for (auto _ : state) {
    unicsv::Utf8Source source(data);
    unicsv::ScalarBuffer buffer;
    benchmark::DoNotOptimize(detector.infer_delimiters(source, buffer));
  }
  state.counters["Columns"] = static_cast<double>(state.range(0));
}
BENCHMARK(BM_InferDelimiters)->Arg(2)->Arg(8)->Arg(32)->Unit(benchmark::kMicrosecond);

// UTF-16 input goes through the byte-order-mark check and unit decoding
static void BM_ReadUtf16(benchmark::State& state) {
  std::string utf8 = make_csv(static_cast<size_t>(state.range(0)), 8);
  unicsv::WriterOptions options;
  options.encoding = unicsv::TextEncoding::UTF16_LE;
  options.bom = unicsv::BomStrategy::ALWAYS;
  unicsv::MemorySink sink;
  {
    unicsv::CsvWriter writer(sink, options);
    unicsv::Utf8Source source(utf8);
    unicsv::CsvReader reader(source);
    while (auto row = reader.read_row()) writer.write_row(row->fields);
  }
  std::string data = sink.str();
  for (auto _ : state) {
    auto source = unicsv::make_source(data);
    unicsv::CsvReader reader(*source);
    benchmark::DoNotOptimize(reader.read_all());
  }
  state.SetBytesProcessed(static_cast<int64_t>(data.size() * state.iterations()));
}
BENCHMARK(BM_ReadUtf16)->Arg(1000)->Arg(10000)->Unit(benchmark::kMillisecond);

static void BM_SequentialBuffer(benchmark::State& state) {
  std::string data = make_csv(static_cast<size_t>(state.range(0)), 4);
  for (auto _ : state) {
    unicsv::Utf8Source source(data);
    unicsv::DecoderConfig config;
    config.buffering = unicsv::BufferingPolicy::SEQUENTIAL;
    unicsv::RowDecoder decoder(source, config);
    size_t total = 0;
    for (size_t i = 0; decoder.contains(i); ++i) total += decoder.field(i, 0).size();
    benchmark::DoNotOptimize(total);
  }
}
BENCHMARK(BM_SequentialBuffer)->Arg(1000)->Arg(10000)->Unit(benchmark::kMillisecond);

static void BM_EncodeScalars(benchmark::State& state) {
  auto encoding = static_cast<unicsv::TextEncoding>(state.range(0));
  std::u32string text;
  for (int i = 0; i < 4096; ++i) text += static_cast<char32_t>(U'a' + i % 26);
  for (auto _ : state) {
    unicsv::MemorySink sink;
    auto encoder = unicsv::make_scalar_encoder(sink, encoding);
    encoder->encode(text);
    benchmark::DoNotOptimize(sink.bytes().data());
  }
  state.SetItemsProcessed(static_cast<int64_t>(text.size() * state.iterations()));
  state.SetLabel(unicsv::encoding_to_string(encoding));
}
BENCHMARK(BM_EncodeScalars)
    ->Arg(static_cast<int>(unicsv::TextEncoding::UTF8))
    ->Arg(static_cast<int>(unicsv::TextEncoding::UTF16_LE))
    ->Arg(static_cast<int>(unicsv::TextEncoding::UTF32_BE))
    ->Arg(static_cast<int>(unicsv::TextEncoding::SHIFT_JIS));

static void BM_WriteRows(benchmark::State& state) {
  std::vector<std::string> row = {"id", "a,b", "say \"hi\"", "", "multi\nline"};
  for (auto _ : state) {
    unicsv::MemorySink sink;
    unicsv::CsvWriter writer(sink);
    for (int64_t i = 0; i < state.range(0); ++i) writer.write_row(row);
    benchmark::DoNotOptimize(sink.bytes().data());
  }
}
BENCHMARK(BM_WriteRows)->Arg(1000)->Arg(10000)->Unit(benchmark::kMillisecond);

// Files named by the UNICSV_BENCH_FILE environment variable
static void BM_ReadFile(benchmark::State& state) {
  const char* filename = std::getenv("UNICSV_BENCH_FILE");
  if (filename == nullptr) {
    state.SkipWithError("UNICSV_BENCH_FILE not set");
    return;
  }
  const std::string* data = nullptr;
  try {
    data = &corpus(filename);
  } catch (const unicsv::CsvException& e) {
    state.SkipWithError(e.what());
    return;
  }
  for (auto _ : state) {
    auto source = unicsv::make_source(*data);
    unicsv::CsvReader reader(*source, unicsv::ReaderOptions::inferred());
    benchmark::DoNotOptimize(reader.read_all());
  }
  state.SetBytesProcessed(static_cast<int64_t>(data->size() * state.iterations()));
}
BENCHMARK(BM_ReadFile)->Unit(benchmark::kMillisecond);
