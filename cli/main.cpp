/**
 * @file main.cpp
 * @brief endec-decode: offline decoder for captured ENDEC serial output.
 *
 * Responsibilities:
 *  - Read lines from a file (or stdin) and run them through the same
 *    FrameAssembler + resolve_block() path the relay uses.
 *  - Print one JSON object per resolved alert on stdout:
 *      {"message": ..., "header_source": "line|embedded|none", "eas_data": {...}}
 *    eas_data has the broker payload's shape.
 *  - --block skips marker framing: the whole input is one block.
 *
 * Logs go to stderr so stdout can be piped into jq.
 * Exit codes: 0 ok, 1 input error, 2 bad option value.
 */

#include <cstdio>
#include <ctime>
#include <fstream>
#include <iostream>
#include <string>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "endec/block_resolver.hpp"
#include "endec/frame_assembler.hpp"
#include "endec/location_directory.hpp"
#include "endec/logging.hpp"
#include "endec/payloads.hpp"
#include "endec/relay.hpp"
#include "endec/text_util.hpp"
#include "endec/time_zone.hpp"

using json = nlohmann::json;
using namespace endec;

static const char* source_name(HeaderSource s) {
  switch (s) {
    case HeaderSource::Line:     return "line";
    case HeaderSource::Embedded: return "embedded";
    case HeaderSource::None:     return "none";
  }
  return "none";
}

static void print_alert(const ResolvedAlert& a, std::time_t now, bool pretty) {
  json out{
    {"message",       a.body},
    {"header_source", source_name(a.source)},
    {"eas_data",      broker_alert_payload(a, "endec-decode", now)["eas_data"]},
  };
  std::cout << to_wire(out, pretty ? 2 : -1) << "\n";
}

int main(int argc, char** argv) {
  CLI::App app{"endec-decode: decode captured ENDEC output into JSON"};

  std::string input = "-";
  std::string timezone = "UTC";
  std::string locations_file;
  int year = 0;
  bool whole_block = false, pretty = false, debug = false;

  app.add_option("input", input, "Capture file, or - for stdin");
  app.add_option("--timezone", timezone, "IANA zone for start_time_local");
  app.add_option("--locations", locations_file, "County names JSON")->check(CLI::ExistingFile);
  app.add_option("--year", year, "Year for JJJHHMM timestamps (default: current UTC year)");
  app.add_flag("--block", whole_block, "Treat the whole input as one alert block");
  app.add_flag("--pretty", pretty, "Indent JSON output");
  app.add_flag("-d,--debug", debug, "Debug logging on stderr");

  CLI11_PARSE(app, argc, argv);

  init_logging(debug, {}, true);

  const auto zone = TimeZone::load(timezone);
  if (!zone) {
    spdlog::error("unknown timezone '{}'", timezone);
    return 2;
  }

  LocationDirectory locations;
  if (!locations_file.empty()) {
    std::string err;
    auto loaded = LocationDirectory::load_file(locations_file, err);
    if (!loaded) {
      spdlog::error("{}: {}", locations_file, err);
      return 2;
    }
    locations = std::move(*loaded);
  }

  std::ifstream file;
  std::istream* in = &std::cin;
  if (input != "-") {
    file.open(input);
    if (!file) {
      spdlog::error("cannot open {}", input);
      return 1;
    }
    in = &file;
  }

  const auto now = Clock::now();
  const HeaderContext ctx{locations, *zone, year > 0 ? year : utc_year(now)};
  const std::time_t stamp = Clock::to_time_t(now);

  size_t printed = 0;
  auto emit = [&](const AlertBlock& block) {
    const ResolvedAlert a = resolve_block(block, ctx);
    if (a.empty()) return;
    print_alert(a, stamp, pretty);
    ++printed;
  };

  std::string line;
  if (whole_block) {
    AlertBlock block;
    while (std::getline(*in, line)) {
      const auto t = trim(line);
      if (!t.empty()) block.lines.emplace_back(t);
    }
    emit(block);
  } else {
    FrameAssembler assembler;
    AlertBlock block;
    while (std::getline(*in, line)) {
      if (!line.empty() && line.back() == '\r') line.pop_back();
      assembler.push_line(line);
      while (assembler.get_block(block)) emit(block);
    }
    // end of input acts like a read timeout
    assembler.on_read_timeout();
    while (assembler.get_block(block)) emit(block);
  }

  spdlog::debug("{} alert(s) decoded", printed);
  return 0;
}
