/**
 * unicsv - Command-line utility for inspecting and re-encoding CSV files
 *
 * Delimiters and header presence that are not given on the command line are
 * inferred from the start of the input.
 */

#include "unicsv.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>
#include <unistd.h>
#include <vector>

using namespace std;

constexpr size_t DEFAULT_NUM_ROWS = 10;
constexpr const char* VERSION = "0.1.0";

struct CliOptions {
  unicsv::ReaderOptions reader = unicsv::ReaderOptions::inferred();
  bool header_given = false;
  size_t num_rows = DEFAULT_NUM_ROWS;
  bool json_output = false;
  unicsv::TextEncoding encoding = unicsv::TextEncoding::UTF8;
  bool encoding_given = false;
  unicsv::BomStrategy bom = unicsv::BomStrategy::CONVENTION;
  string output;
};

void printVersion() {
  cout << "unicsv version " << VERSION << '\n';
}

void printUsage(const char* prog) {
  cerr << "unicsv - CSV reader/writer with delimiter inference and re-encoding\n\n";
  cerr << "Usage: " << prog << " <command> [options] [csvfile]\n\n";
  cerr << "Commands:\n";
  cerr << "  detect        Infer and print the delimiters and header presence\n";
  cerr << "  head          Display the first N rows (default: " << DEFAULT_NUM_ROWS << ")\n";
  cerr << "  convert       Re-encode the CSV in another text encoding\n";
  cerr << "\nArguments:\n";
  cerr << "  csvfile       Path to CSV file, or '-' to read from stdin.\n";
  cerr << "                If omitted, reads from stdin.\n";
  cerr << "\nOptions:\n";
  cerr << "  -d <delim>    Field delimiter (comma, tab, semicolon, pipe, colon or literal)\n";
  cerr << "  -r <delim>    Row delimiter (lf, crlf, cr or literal)\n";
  cerr << "  -H <mode>     Header row: yes, no or auto\n";
  cerr << "                (default: auto for detect/head, no for convert)\n";
  cerr << "  -t            Trim spaces and tabs around unquoted fields\n";
  cerr << "  -n <num>      Number of rows (for head)\n";
  cerr << "  -j            Output in JSON format (for detect)\n";
  cerr << "  -e <enc>      Output encoding (for convert): ascii, utf-8, utf-16,\n";
  cerr << "                utf-16be, utf-16le, utf-32, utf-32be, utf-32le, shift-jis\n";
  cerr << "  -b <bom>      Byte-order mark: convention, always or never\n";
  cerr << "  -o <file>     Output file (for convert; default: stdout)\n";
  cerr << "  -V            Trace inference and parsing to stderr\n";
  cerr << "  -h            Show this help message\n";
  cerr << "  -v            Show version information\n";
  cerr << "\nExamples:\n";
  cerr << "  " << prog << " detect data.csv\n";
  cerr << "  " << prog << " detect -j data.csv\n";
  cerr << "  " << prog << " head -n 5 -d semicolon european.csv\n";
  cerr << "  " << prog << " convert -e utf-16le -b always -o out.csv data.csv\n";
  cerr << "  cat data.csv | " << prog << " head\n";
}

static bool isStdinInput(const char* filename) {
  return filename == nullptr || strcmp(filename, "-") == 0;
}

static u32string parseFieldDelimiter(const string& value) {
  if (value == "comma") return U",";
  if (value == "tab" || value == "\\t") return U"\t";
  if (value == "semicolon") return U";";
  if (value == "pipe") return U"|";
  if (value == "colon") return U":";
  return unicsv::from_utf8(value);
}

static u32string parseRowDelimiter(const string& value) {
  if (value == "lf" || value == "\\n") return U"\n";
  if (value == "crlf" || value == "\\r\\n") return U"\r\n";
  if (value == "cr" || value == "\\r") return U"\r";
  return unicsv::from_utf8(value);
}

static string escapeJson(const string& s) {
  string out;
  for (char c : s) {
    switch (c) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(c) < 0x20) {
        char buf[8];
        snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
        out += buf;
      } else {
        out += c;
      }
    }
  }
  return out;
}

static string loadInput(const char* filename) {
  if (isStdinInput(filename)) {
    return unicsv::read_stdin();
  }
  return unicsv::load_file(filename);
}

// Command: detect - resolve the configuration and print it
int cmdDetect(const char* filename, const CliOptions& opts) {
  string bytes = loadInput(filename);
  auto enc = unicsv::detect_encoding(reinterpret_cast<const uint8_t*>(bytes.data()),
                                     bytes.size());
  auto source = unicsv::make_source(std::move(bytes));

  unicsv::ReaderOptions options = opts.reader;
  if (!opts.header_given) options.header = unicsv::HeaderStrategy::UNKNOWN;
  unicsv::CsvReader reader(*source, options);
  const auto& config = reader.config();

  string field = unicsv::escape_scalars(config.delimiters.field);
  string row = unicsv::escape_scalars(config.delimiters.row);
  if (opts.json_output) {
    cout << "{\n";
    cout << "  \"field_delimiter\": \"" << escapeJson(unicsv::to_utf8(config.delimiters.field))
         << "\",\n";
    cout << "  \"row_delimiter\": \"" << escapeJson(unicsv::to_utf8(config.delimiters.row))
         << "\",\n";
    cout << "  \"encoding\": \"" << unicsv::encoding_to_string(enc.encoding) << "\",\n";
    cout << "  \"has_header\": " << (config.has_header ? "true" : "false") << ",\n";
    cout << "  \"columns\": " << reader.headers().size() << "\n";
    cout << "}\n";
  } else {
    cout << "Detected configuration:\n";
    cout << "  Field delimiter: '" << field << "'\n";
    cout << "  Row delimiter:   '" << row << "'\n";
    cout << "  Encoding:        " << unicsv::encoding_to_string(enc.encoding) << "\n";
    cout << "  Has header:      " << (config.has_header ? "yes" : "no") << "\n";
    if (config.has_header) {
      cout << "  Columns:         " << reader.headers().size() << "\n";
    }
  }
  return 0;
}

static void outputRow(const vector<string>& fields) {
  for (size_t i = 0; i < fields.size(); ++i) {
    if (i > 0) cout << " | ";
    cout << fields[i];
  }
  cout << '\n';
}

// Command: head - print the first N rows
int cmdHead(const char* filename, const CliOptions& opts) {
  auto source = unicsv::make_source(loadInput(filename));
  unicsv::ReaderOptions options = opts.reader;
  if (!opts.header_given) options.header = unicsv::HeaderStrategy::UNKNOWN;
  unicsv::CsvReader reader(*source, options);

  if (reader.config().has_header) {
    outputRow(reader.headers());
  }
  for (size_t i = 0; i < opts.num_rows; ++i) {
    auto row = reader.read_row();
    if (!row) break;
    outputRow(row->fields);
  }
  return 0;
}

// Command: convert - read with the resolved configuration, write re-encoded
int cmdConvert(const char* filename, const CliOptions& opts) {
  auto source = unicsv::make_source(loadInput(filename));
  unicsv::ReaderOptions options = opts.reader;
  if (!opts.header_given) options.header = unicsv::HeaderStrategy::NONE;
  unicsv::CsvReader reader(*source, options);

  unicsv::FileSink sink(STDOUT_FILENO);
  if (!opts.output.empty()) {
    sink.open(opts.output);
  }

  unicsv::WriterOptions writer_options;
  writer_options.delimiters = reader.config().delimiters;
  writer_options.encoding = opts.encoding;
  writer_options.bom = opts.bom;
  writer_options.headers = reader.headers();
  unicsv::CsvWriter writer(sink, writer_options);

  while (auto row = reader.read_row()) {
    writer.write_row(row->fields);
  }
  if (unicsv::debug::enabled()) {
    unicsv::debug::global_trace().log("converted %zu row(s), %zu byte(s)",
                                      writer.rows_written(), writer.encoder().bytes_written());
  }
  sink.close();
  return 0;
}

int main(int argc, char* argv[]) {
  if (argc < 2) {
    printUsage(argv[0]);
    return 1;
  }

  if (strcmp(argv[1], "-h") == 0 || strcmp(argv[1], "--help") == 0) {
    printUsage(argv[0]);
    return 0;
  }
  if (strcmp(argv[1], "-v") == 0 || strcmp(argv[1], "--version") == 0) {
    printVersion();
    return 0;
  }

  string command = argv[1];
  optind = 2;

  CliOptions opts;
  unicsv::DebugConfig debug_config;

  int c;
  try {
    while ((c = getopt(argc, argv, "d:r:H:tn:je:b:o:Vhv")) != -1) {
      switch (c) {
      case 'd':
        opts.reader.field_delimiter = parseFieldDelimiter(optarg);
        break;
      case 'r':
        opts.reader.row_delimiter = parseRowDelimiter(optarg);
        break;
      case 'H':
        opts.header_given = true;
        if (strcmp(optarg, "yes") == 0) {
          opts.reader.header = unicsv::HeaderStrategy::FIRST_LINE;
        } else if (strcmp(optarg, "no") == 0) {
          opts.reader.header = unicsv::HeaderStrategy::NONE;
        } else if (strcmp(optarg, "auto") == 0) {
          opts.reader.header = unicsv::HeaderStrategy::UNKNOWN;
        } else {
          cerr << "Error: Header mode must be yes, no or auto\n";
          return 1;
        }
        break;
      case 't':
        opts.reader.trim = unicsv::TrimStrategy::WHITESPACES;
        break;
      case 'n': {
        char* endptr;
        long val = strtol(optarg, &endptr, 10);
        if (*endptr != '\0' || val < 0) {
          cerr << "Error: Invalid row count '" << optarg << "'\n";
          return 1;
        }
        opts.num_rows = static_cast<size_t>(val);
        break;
      }
      case 'j':
        opts.json_output = true;
        break;
      case 'e': {
        auto enc = unicsv::parse_encoding(optarg);
        if (!enc) {
          cerr << "Error: Unknown encoding '" << optarg << "'\n";
          return 1;
        }
        opts.encoding = *enc;
        opts.encoding_given = true;
        break;
      }
      case 'b':
        if (strcmp(optarg, "convention") == 0) {
          opts.bom = unicsv::BomStrategy::CONVENTION;
        } else if (strcmp(optarg, "always") == 0) {
          opts.bom = unicsv::BomStrategy::ALWAYS;
        } else if (strcmp(optarg, "never") == 0) {
          opts.bom = unicsv::BomStrategy::NEVER;
        } else {
          cerr << "Error: BOM strategy must be convention, always or never\n";
          return 1;
        }
        break;
      case 'o':
        opts.output = optarg;
        break;
      case 'V':
        debug_config.verbose = true;
        break;
      case 'h':
        printUsage(argv[0]);
        return 0;
      case 'v':
        printVersion();
        return 0;
      default:
        printUsage(argv[0]);
        return 1;
      }
    }
  } catch (const unicsv::CsvException& e) {
    cerr << "Error: " << e.error().to_string() << '\n';
    return 1;
  }
  unicsv::debug::set_config(debug_config);

  const char* filename = nullptr;
  if (optind < argc) {
    filename = argv[optind];
  }

  int result = 0;
  try {
    if (command == "detect") {
      result = cmdDetect(filename, opts);
    } else if (command == "head") {
      result = cmdHead(filename, opts);
    } else if (command == "convert") {
      if (!opts.encoding_given) {
        cerr << "Error: -e option required for convert command\n";
        return 1;
      }
      result = cmdConvert(filename, opts);
    } else {
      cerr << "Error: Unknown command '" << command << "'\n";
      printUsage(argv[0]);
      return 1;
    }
  } catch (const unicsv::CsvException& e) {
    cerr << "Error: " << e.error().to_string() << '\n';
    return 1;
  }

  std::cout.flush();
  return result;
}
