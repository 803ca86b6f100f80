/* Copyright 2025 HiveVM (http://www.hivevm.org)
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 * http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */
#include <boost/algorithm/string.hpp>
#include <boost/program_options.hpp>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

#include "ewkb_parser.hpp"
#include "ewkb_wrapper.hpp"

namespace po = boost::program_options;

static const int EXIT_DECODE_FAILED = 1;
static const int EXIT_USAGE = 2;

static bool print_geometry(const ewkb::Parser &parser, const std::string &label, const std::string &format,
                           int precision) {
  try {
    ewkb::ParseResult result = parser.parse();

    if (format == "wkt") {
      std::string text = ewkb::wkt(result, precision);
      if (result.srid) {
        text = "SRID=" + std::to_string(*result.srid) + ";" + text;
      }
      std::cout << text << std::endl;
    } else {
      std::cout << ewkb::json(result) << std::endl;
    }

    spdlog::debug("{}: {} with {} point(s)", label, ewkb::type_name(result.type), ewkb::num_points(result));
    return true;
  } catch (const ewkb::ParseError &e) {
    spdlog::error("{}: {}", label, e.what());
    return false;
  }
}

static bool dump_hex(const std::string &text, const ewkb::ParserOptions &options, const std::string &format,
                     int precision) {
  try {
    return print_geometry(ewkb::Parser::from_hex(text, options), "hex input", format, precision);
  } catch (const ewkb::InvalidHexInput &e) {
    spdlog::error("hex input: {}", e.what());
    return false;
  }
}

static bool dump_file(const std::string &path, const ewkb::ParserOptions &options, const std::string &format,
                      int precision) {
  std::ifstream in(path.c_str(), std::ios::binary);

  if (!in) {
    spdlog::error("{}: cannot open file", path);
    return false;
  }

  std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  spdlog::debug("{}: {} bytes", path, bytes.size());

  return print_geometry(ewkb::Parser(bytes, options), path, format, precision);
}

int main(int argc, char **argv) {
  auto logger = spdlog::stderr_color_mt("ewkbdump");
  logger->set_pattern("[%^%l%$] %v");
  spdlog::set_default_logger(logger);

  std::vector<std::string> hexes;
  std::vector<std::string> files;
  std::string format;
  int precision;
  int max_depth;

  po::options_description desc("Decode WKB/EWKB geometries.\n\nOptions");
  desc.add_options()
      ("help,h", "print this help")
      ("hex,x", po::value<std::vector<std::string>>(&hexes), "hex encoded geometry, repeatable")
      ("file,f", po::value<std::vector<std::string>>(&files), "file holding one binary geometry, repeatable")
      ("format", po::value<std::string>(&format)->default_value("json"), "output format: json or wkt")
      ("precision", po::value<int>(&precision)->default_value(-1), "WKT decimals, negative for stream default")
      ("max-depth", po::value<int>(&max_depth)->default_value(static_cast<int>(ewkb::DEFAULT_MAX_DEPTH)),
       "maximum geometry nesting depth")
      ("verbose,v", "trace decoding on stderr");

  po::positional_options_description positional;
  positional.add("hex", -1);

  po::variables_map vm;

  try {
    po::store(po::command_line_parser(argc, argv).options(desc).positional(positional).run(), vm);
    po::notify(vm);
  } catch (const po::error &e) {
    spdlog::error("{}", e.what());
    std::cerr << desc << std::endl;
    return EXIT_USAGE;
  }

  if (vm.count("help")) {
    std::cout << desc << std::endl;
    return EXIT_SUCCESS;
  }

  if (format != "json" && format != "wkt") {
    spdlog::error("unknown format '{}'", format);
    return EXIT_USAGE;
  }

  if (max_depth < 0) {
    spdlog::error("--max-depth must not be negative, got {}", max_depth);
    return EXIT_USAGE;
  }

  if (vm.count("verbose")) {
    spdlog::set_level(spdlog::level::trace);
  }

  ewkb::ParserOptions options;
  options.max_depth = static_cast<unsigned>(max_depth);

  bool ok = true;

  for (auto it = hexes.cbegin(); it < hexes.cend(); ++it) {
    ok = dump_hex(*it, options, format, precision) && ok;
  }

  for (auto it = files.cbegin(); it < files.cend(); ++it) {
    ok = dump_file(*it, options, format, precision) && ok;
  }

  if (hexes.empty() && files.empty()) {
    std::string line;

    while (std::getline(std::cin, line)) {
      boost::trim(line);
      if (!line.empty()) {
        ok = dump_hex(line, options, format, precision) && ok;
      }
    }
  }

  return ok ? EXIT_SUCCESS : EXIT_DECODE_FAILED;
}
