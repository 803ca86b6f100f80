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
#ifndef EWKB_PARSER_HPP
#define EWKB_PARSER_HPP

#include <cstddef>
#include <cstdint>
#include <string>

#include "ewkb_errors.hpp"
#include "ewkb_geometries.hpp"

namespace ewkb {

const unsigned DEFAULT_MAX_DEPTH = 32;

struct ParserOptions {
  ParserOptions() : max_depth(DEFAULT_MAX_DEPTH) {}

  /** Maximum number of geometry headers nested below the top-level one. */
  unsigned max_depth;
};

/**
 * Decoder for one WKB/EWKB geometry value.
 *
 * A Parser built from a pointer does not copy the buffer, which must then outlive it. Every call to parse() decodes
 * from the start of the buffer with fresh state, so a Parser can be reused. Bytes following the top-level geometry are
 * ignored.
 */
class Parser {
public:
  Parser(const uint8_t *data, std::size_t size, const ParserOptions &options = ParserOptions());
  explicit Parser(std::string bytes, const ParserOptions &options = ParserOptions());

  /** Builds a parser over hex encoded EWKB, see unhex(). */
  static Parser from_hex(const std::string &text, const ParserOptions &options = ParserOptions());

  /**
   * Decodes the geometry. Throws a ParseError subclass on malformed input; there is no partial result.
   *
   * When nested geometries also carry an SRID, the last one read is reported.
   */
  ParseResult parse() const;

  const ParserOptions &options() const { return _options; }

private:
  const uint8_t *data() const;

  std::string _owned;
  bool _owns;
  const uint8_t *_data;
  std::size_t _size;
  ParserOptions _options;
};

} // namespace ewkb

#endif
