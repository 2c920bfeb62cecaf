/**
 * @file fuzz_csv_reader.cpp
 * @brief LibFuzzer target for the reader and the writer read-back path.
 *
 * Input bytes go through encoding detection and the reader with explicit
 * comma/newline delimiters. Rows that parse are written back out and parsed
 * again; a different result is a crash.
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "csv_reader.h"
#include "csv_writer.h"
#include "error.h"
#include "scalar_source.h"
#include "stream_writer.h"

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
  // 64KB limit: long enough for multi-row quoting cases
  constexpr size_t MAX_INPUT_SIZE = 64 * 1024;
  if (size > MAX_INPUT_SIZE) size = MAX_INPUT_SIZE;

  std::vector<unicsv::Row> rows;
  try {
    auto source = unicsv::make_source(std::string(reinterpret_cast<const char*>(data), size));
    unicsv::CsvReader reader(*source);
    rows = reader.read_all();
  } catch (const unicsv::CsvException&) {
    // Malformed input is reported, not crashed on
    return 0;
  }

  unicsv::MemorySink sink;
  unicsv::CsvWriter writer(sink);
  for (const auto& row : rows) writer.write_row(row.fields);

  unicsv::Utf8Source again(sink.str());
  unicsv::CsvReader reader(again);
  std::vector<unicsv::Row> reread = reader.read_all();
  if (reread.size() != rows.size()) __builtin_trap();
  for (size_t i = 0; i < rows.size(); ++i) {
    if (reread[i].fields != rows[i].fields) __builtin_trap();
  }
  return 0;
}
