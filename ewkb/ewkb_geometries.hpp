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
#ifndef EWKB_GEOMETRIES_HPP
#define EWKB_GEOMETRIES_HPP

#include <boost/geometry/geometry.hpp>
#include <boost/optional.hpp>
#include <boost/variant/recursive_wrapper.hpp>
#include <boost/variant/variant.hpp>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace ewkb {

/** WKB geometry codes, as found in the low bits of a geometry header. */
enum class GeometryType : uint32_t {
  Point = 1,
  LineString = 2,
  Polygon = 3,
  MultiPoint = 4,
  MultiLineString = 5,
  MultiPolygon = 6,
  GeometryCollection = 7
};

namespace flags {
const uint32_t WKB_SRID = 0x20000000;
const uint32_t WKB_M = 0x40000000;
const uint32_t WKB_Z = 0x80000000;
} // namespace flags

typedef ::boost::geometry::model::point<double, 2, ::boost::geometry::cs::cartesian> Point;
typedef ::boost::geometry::model::linestring<Point> LineString;
// Rings are kept exactly as encoded: any count, any order, closure unchecked.
typedef std::vector<LineString> Polygon;
typedef ::boost::geometry::model::multi_point<Point> MultiPoint;
typedef ::boost::geometry::model::multi_linestring<LineString> MultiLineString;
typedef std::vector<Polygon> MultiPolygon;
typedef ::boost::geometry::model::box<Point> Envelope;

struct Geometry;
typedef std::vector<Geometry> GeometryCollection;

typedef ::boost::variant<Point, LineString, Polygon, MultiPoint, MultiLineString, MultiPolygon,
                         ::boost::recursive_wrapper<GeometryCollection>>
    Payload;

/** A decoded geometry: the type tag plus the payload shape the tag selects. */
struct Geometry {
  Geometry() : type(GeometryType::Point) {}
  Geometry(GeometryType type, Payload value) : type(type), value(std::move(value)) {}

  GeometryType type;
  Payload value;
};

/**
 * Result of decoding one top-level EWKB value. srid is only set when a header carried the SRID flag, it is never
 * defaulted to zero.
 */
struct ParseResult : Geometry {
  ParseResult() = default;
  ParseResult(Geometry geometry, boost::optional<uint32_t> srid) : Geometry(std::move(geometry)), srid(srid) {}

  boost::optional<uint32_t> srid;
};

/** Upper case tag name: POINT, LINESTRING, ..., GEOMETRYCOLLECTION. */
const char *type_name(GeometryType type);

} // namespace ewkb

#endif
