#include "io_util.h"

#include <cerrno>
#include <cstdio>
#include <cstring>

#include "error.h"

namespace unicsv {

std::string load_file(const std::string& filename) {
  std::FILE* fp = std::fopen(filename.c_str(), "rb");
  if (fp == nullptr) {
    throw CsvException(CsvError(ErrorCode::IO_ERROR, "Cannot open '" + filename + "'")
                           .with_detail("errno", std::strerror(errno)));
  }
  std::fseek(fp, 0, SEEK_END);
  long end = std::ftell(fp);
  if (end < 0) {
    std::fclose(fp);
    throw CsvException(CsvError(ErrorCode::IO_ERROR, "Cannot determine the size of '" + filename + "'"));
  }
  std::rewind(fp);

  std::string data(static_cast<size_t>(end), '\0');
  size_t readb = std::fread(&data[0], 1, data.size(), fp);
  std::fclose(fp);
  if (readb != data.size()) {
    throw CsvException(CsvError(ErrorCode::IO_ERROR, "Could not read '" + filename + "'")
                           .with_detail("expected", std::to_string(data.size()))
                           .with_detail("read", std::to_string(readb)));
  }
  return data;
}

std::string read_stdin() {
  const size_t chunk_size = 64 * 1024;
  std::string data;
  char buffer[chunk_size];
  while (true) {
    size_t bytes_read = std::fread(buffer, 1, chunk_size, stdin);
    data.append(buffer, bytes_read);
    if (bytes_read < chunk_size) {
      if (std::ferror(stdin)) {
        throw CsvException(CsvError(ErrorCode::IO_ERROR, "Could not read from stdin"));
      }
      break;
    }
  }
  return data;
}

}  // namespace unicsv
