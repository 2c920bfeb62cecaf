/**
 * @file unicsv.h
 * @brief unicsv - CSV codec over Unicode code points.
 * @version 0.1.0
 *
 * This is the main public header for the unicsv library. Include this single
 * header to access all public functionality:
 *
 * - Reading: ScalarSource -> ReaderConfig::resolve (inference) -> CsvReader
 *   -> DecodingBuffer / RowDecoder
 * - Writing: CsvWriter -> ScalarEncoder -> stream_write -> OutputSink
 *
 * @example
 * @code
 * auto source = unicsv::make_source(unicsv::load_file("data.csv"));
 * unicsv::DecoderConfig config;
 * config.reader = unicsv::ReaderOptions::inferred();
 * unicsv::RowDecoder decoder(*source, config);
 * std::string name = decoder.field(0, "name");
 * @endcode
 */

#ifndef UNICSV_H
#define UNICSV_H

#define UNICSV_VERSION_MAJOR 0
#define UNICSV_VERSION_MINOR 1
#define UNICSV_VERSION_PATCH 0
#define UNICSV_VERSION_STRING "0.1.0"

#include "error.h"
#include "debug.h"
#include "utf8.h"
#include "encoding.h"
#include "scalar_buffer.h"
#include "scalar_source.h"
#include "dialect.h"
#include "csv_reader.h"
#include "decoding_buffer.h"
#include "stream_writer.h"
#include "scalar_encoder.h"
#include "csv_writer.h"
#include "io_util.h"

#endif  // UNICSV_H
