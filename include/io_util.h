/**
 * @file io_util.h
 * @brief Loading whole inputs from files and stdin.
 *
 * The bytes are returned undecoded; make_source() picks the matching
 * code-point source from their byte-order mark or content.
 */

#ifndef UNICSV_IO_UTIL_H
#define UNICSV_IO_UTIL_H

#include <string>

namespace unicsv {

/**
 * @brief Read an entire file.
 * @throws CsvException IO_ERROR when the file cannot be opened or read
 */
std::string load_file(const std::string& filename);

/**
 * @brief Read stdin until EOF, in 64KB chunks.
 * @throws CsvException IO_ERROR on a read error
 */
std::string read_stdin();

}  // namespace unicsv

#endif  // UNICSV_IO_UTIL_H
