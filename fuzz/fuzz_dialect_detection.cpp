/**
 * @file fuzz_dialect_detection.cpp
 * @brief LibFuzzer target for delimiter and header inference.
 */

#include <cstddef>
#include <cstdint>
#include <string>

#include "dialect.h"
#include "error.h"
#include "scalar_buffer.h"
#include "scalar_source.h"

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
  if (size == 0)
    return 0;
  // 16KB limit: inference only samples the first 16384 scalars
  constexpr size_t MAX_INPUT_SIZE = 16 * 1024;
  if (size > MAX_INPUT_SIZE)
    size = MAX_INPUT_SIZE;

  std::string bytes(reinterpret_cast<const char*>(data), size);
  try {
    unicsv::Utf8Source source(bytes);
    unicsv::ScalarBuffer buffer;
    unicsv::ReaderConfig config =
        unicsv::ReaderConfig::resolve(unicsv::ReaderOptions::inferred(), source, buffer);
    // Inferred delimiters always pass validation
    config.delimiters.validate();
  } catch (const unicsv::CsvException& e) {
    if (e.code() != unicsv::ErrorCode::INFERENCE_FAILED &&
        e.code() != unicsv::ErrorCode::INVALID_UTF8)
      __builtin_trap();
  }
  return 0;
}
