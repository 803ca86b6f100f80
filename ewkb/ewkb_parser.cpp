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
#include <algorithm>
#include <spdlog/spdlog.h>
#include <utility>

#include "ewkb_parser.hpp"
#include "ewkb_reader.hpp"

namespace ewkb {

namespace detail {

// Smallest encoded size of one element, used to cap reservations on hostile counts.
const std::size_t POINT_SIZE = 2 * sizeof(double);
const std::size_t COUNT_SIZE = sizeof(uint32_t);
const std::size_t HEADER_SIZE = 1 + sizeof(uint32_t);

inline std::size_t capacity(uint32_t count, const Reader &reader, std::size_t element_size) {
  return std::min<std::size_t>(count, reader.remaining() / element_size);
}

/** Decoding state shared by one parse() call. srid is the accumulator, the last SRID read wins. */
struct context {
  Reader reader;
  const ParserOptions &options;
  boost::optional<uint32_t> srid;

  context(const uint8_t *data, std::size_t size, const ParserOptions &options)
      : reader(data, size), options(options) {}
};

Geometry geometry(context &ctx, unsigned depth);

Point point(Reader &reader) {
  double x = reader.read_double();
  double y = reader.read_double();
  return Point(x, y);
}

LineString line_string(Reader &reader) {
  uint32_t count = reader.read_uint32();
  LineString line;
  line.reserve(capacity(count, reader, POINT_SIZE));

  for (uint32_t i = 0; i < count; i++) {
    line.push_back(point(reader));
  }

  return line;
}

Polygon polygon(Reader &reader) {
  uint32_t count = reader.read_uint32();
  Polygon rings;
  rings.reserve(capacity(count, reader, COUNT_SIZE));

  for (uint32_t i = 0; i < count; i++) {
    rings.push_back(line_string(reader));
  }

  return rings;
}

template <typename Multi> Multi multi(context &ctx, unsigned depth, GeometryType expected) {
  typedef typename Multi::value_type Part;

  uint32_t count = ctx.reader.read_uint32();
  Multi parts;
  parts.reserve(capacity(count, ctx.reader, HEADER_SIZE));

  for (uint32_t i = 0; i < count; i++) {
    Geometry part = geometry(ctx, depth + 1);

    if (part.type != expected) {
      throw UnexpectedGeometryType(expected, part.type);
    }

    parts.push_back(std::move(boost::get<Part>(part.value)));
  }

  return parts;
}

GeometryCollection collection(context &ctx, unsigned depth) {
  uint32_t count = ctx.reader.read_uint32();
  GeometryCollection members;
  members.reserve(capacity(count, ctx.reader, HEADER_SIZE));

  for (uint32_t i = 0; i < count; i++) {
    members.push_back(geometry(ctx, depth + 1));
  }

  return members;
}

GeometryType classify(uint32_t type) {
  // Z and M are header bits only; coordinates are always read as x, y.
  if ((type & (flags::WKB_Z | flags::WKB_M)) != 0) {
    throw UnsupportedType(type);
  }

  switch (type) {
  case 1:
  case 2:
  case 3:
  case 4:
  case 5:
  case 6:
  case 7:
    return static_cast<GeometryType>(type);
  default:
    throw UnsupportedType(type);
  }
}

Geometry geometry(context &ctx, unsigned depth) {
  if (depth > ctx.options.max_depth) {
    throw NestingTooDeep(depth, ctx.options.max_depth);
  }

  Reader &reader = ctx.reader;
  std::size_t offset = reader.position();

  ByteOrder order = reader.byte_order();
  uint32_t type = reader.read_uint32();

  if ((type & flags::WKB_SRID) == flags::WKB_SRID) {
    type ^= flags::WKB_SRID;
    ctx.srid = reader.read_uint32();
    spdlog::trace("ewkb: srid {} at offset {}", *ctx.srid, offset);
  }

  spdlog::trace("ewkb: header at offset {}, depth {}, {} endian, type {:#x}", offset, depth,
                order == ByteOrder::LittleEndian ? "little" : "big", type);

  GeometryType tag = classify(type);

  switch (tag) {
  case GeometryType::Point:
    return Geometry(tag, point(reader));
  case GeometryType::LineString:
    return Geometry(tag, line_string(reader));
  case GeometryType::Polygon:
    return Geometry(tag, polygon(reader));
  case GeometryType::MultiPoint:
    return Geometry(tag, multi<MultiPoint>(ctx, depth, GeometryType::Point));
  case GeometryType::MultiLineString:
    return Geometry(tag, multi<MultiLineString>(ctx, depth, GeometryType::LineString));
  case GeometryType::MultiPolygon:
    return Geometry(tag, multi<MultiPolygon>(ctx, depth, GeometryType::Polygon));
  case GeometryType::GeometryCollection:
    return Geometry(tag, collection(ctx, depth));
  }

  throw UnsupportedType(type);
}

} // namespace detail

Parser::Parser(const uint8_t *data, std::size_t size, const ParserOptions &options)
    : _owns(false), _data(data), _size(size), _options(options) {}

Parser::Parser(std::string bytes, const ParserOptions &options)
    : _owned(std::move(bytes)), _owns(true), _data(nullptr), _size(_owned.size()), _options(options) {}

Parser Parser::from_hex(const std::string &text, const ParserOptions &options) { return Parser(unhex(text), options); }

const uint8_t *Parser::data() const {
  return _owns ? reinterpret_cast<const uint8_t *>(_owned.data()) : _data;
}

ParseResult Parser::parse() const {
  detail::context ctx(data(), _size, _options);
  Geometry geometry = detail::geometry(ctx, 0);
  return ParseResult(std::move(geometry), ctx.srid);
}

} // namespace ewkb
