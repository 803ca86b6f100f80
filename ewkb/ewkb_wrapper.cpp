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
#include <boost/geometry/geometry.hpp>
#include <boost/variant/variant.hpp>
#include <cmath>
#include <functional>
#include <iomanip>
#include <limits>
#include <sstream>

#include "ewkb_geometries.hpp"
#include "ewkb_wrapper.hpp"

namespace ewkb {

const char *type_name(GeometryType type) {
  switch (type) {
  case GeometryType::Point:
    return "POINT";
  case GeometryType::LineString:
    return "LINESTRING";
  case GeometryType::Polygon:
    return "POLYGON";
  case GeometryType::MultiPoint:
    return "MULTIPOINT";
  case GeometryType::MultiLineString:
    return "MULTILINESTRING";
  case GeometryType::MultiPolygon:
    return "MULTIPOLYGON";
  case GeometryType::GeometryCollection:
    return "GEOMETRYCOLLECTION";
  }
  return "GEOMETRY";
}

namespace detail {

typedef ::boost::geometry::model::polygon<Point, true, true> WktPolygon;

// WKB encodes an empty point as NaN coordinates.
inline bool is_empty_point(const Point &p) {
  return std::isnan(boost::geometry::get<0>(p)) && std::isnan(boost::geometry::get<1>(p));
}

inline bool same_coordinate(double a, double b) { return (a == b) || (std::isnan(a) && std::isnan(b)); }

WktPolygon to_wkt_polygon(const Polygon &rings) {
  WktPolygon poly;

  for (auto it = rings.cbegin(); it < rings.cend(); ++it) {
    if (it == rings.cbegin()) {
      poly.outer().assign(it->begin(), it->end());
    } else {
      poly.inners().push_back(WktPolygon::ring_type(it->begin(), it->end()));
    }
  }

  return poly;
}

bool same(const Point &p1, const Point &p2);
bool same(const Geometry &geom1, const Geometry &geom2);

template <typename Range> bool same(const Range &range1, const Range &range2) {
  if (range1.size() != range2.size()) {
    return false;
  }

  auto it1 = range1.cbegin();
  auto it2 = range2.cbegin();

  for (; ((it1 < range1.cend()) && (it2 < range2.cend())); ++it1, ++it2) {
    if (!same(*it1, *it2)) {
      return false;
    }
  }

  return true;
}

struct equal : boost::static_visitor<int> {
  template <typename Geom> int operator()(const Geom &geom1, const Geom &geom2) const { return same(geom1, geom2); }

  template <typename Geom1, typename Geom2> int operator()(const Geom1 &, const Geom2 &) const { return 0; }
};

bool same(const Point &p1, const Point &p2) {
  return same_coordinate(boost::geometry::get<0>(p1), boost::geometry::get<0>(p2)) &&
         same_coordinate(boost::geometry::get<1>(p1), boost::geometry::get<1>(p2));
}

bool same(const Geometry &geom1, const Geometry &geom2) {
  return (geom1.type == geom2.type) && boost::apply_visitor(equal(), geom1.value, geom2.value);
}

struct is_empty : boost::static_visitor<int> {
  int operator()(const Point &geom) const { return is_empty_point(geom); }

  int operator()(const Polygon &geom) const {
    for (auto it = geom.cbegin(); it < geom.cend(); ++it) {
      if (!it->empty()) {
        return false;
      }
    }
    return true;
  }

  template <typename Multi> int all_empty(const Multi &geom) const {
    for (auto it = geom.cbegin(); it < geom.cend(); ++it) {
      if (!this->operator()(*it)) {
        return false;
      }
    }
    return true;
  }

  int operator()(const MultiPoint &geom) const { return all_empty(geom); }
  int operator()(const MultiLineString &geom) const { return all_empty(geom); }
  int operator()(const MultiPolygon &geom) const { return all_empty(geom); }

  int operator()(const GeometryCollection &geom) const {
    for (auto it = geom.cbegin(); it < geom.cend(); ++it) {
      if (!boost::apply_visitor(*this, it->value)) {
        return false;
      }
    }
    return true;
  }

  template <typename Geometry> int operator()(const Geometry &geom) const { return boost::geometry::is_empty(geom); }
};

struct num_points : boost::static_visitor<int> {
  int operator()(const Point &geom) const { return is_empty_point(geom) ? 0 : 1; }

  int operator()(const Polygon &geom) const {
    int total = 0;

    for (auto it = geom.cbegin(); it < geom.cend(); ++it) {
      total += static_cast<int>(it->size());
    }

    return total;
  }

  int operator()(const MultiPolygon &geom) const {
    int total = 0;

    for (auto it = geom.cbegin(); it < geom.cend(); ++it) {
      total += this->operator()(*it);
    }

    return total;
  }

  int operator()(const GeometryCollection &geom) const {
    int total = 0;

    for (auto it = geom.cbegin(); it < geom.cend(); ++it) {
      total += boost::apply_visitor(*this, it->value);
    }

    return total;
  }

  template <typename Geometry> int operator()(const Geometry &geom) const {
    return static_cast<int>(boost::geometry::num_points(geom));
  }
};

struct num_geometries : boost::static_visitor<int> {
  int operator()(const Point &) const { return 1; }
  int operator()(const LineString &) const { return 1; }
  int operator()(const Polygon &) const { return 1; }

  template <typename Multi> int operator()(const Multi &geom) const { return static_cast<int>(geom.size()); }
};

/** Gathers every non-empty coordinate into a multi point. */
struct collect_points : boost::static_visitor<> {
  MultiPoint &points;

  explicit collect_points(MultiPoint &points) : points(points) {}

  void operator()(const Point &geom) const {
    if (!is_empty_point(geom)) {
      points.push_back(geom);
    }
  }

  void operator()(const GeometryCollection &geom) const {
    for (auto it = geom.cbegin(); it < geom.cend(); ++it) {
      boost::apply_visitor(*this, it->value);
    }
  }

  template <typename Range> void operator()(const Range &geom) const {
    for (auto it = geom.cbegin(); it < geom.cend(); ++it) {
      this->operator()(*it);
    }
  }
};

struct wkt : boost::static_visitor<std::string> {
  static std::string empty(GeometryType type) { return std::string(type_name(type)) + " EMPTY"; }

  template <typename Geometry> static std::string stream(const Geometry &geom, const int &precision) {
    std::stringstream ss;

    if (precision >= 0) {
      ss << std::fixed << std::setprecision(precision);
    }

    // rings are printed as decoded, never closed implicitly
    ss << boost::geometry::wkt_manipulator<Geometry>(geom, false);
    std::string boostWkt = ss.str();
    boost::replace_first(boostWkt, "(", " (");

    return boostWkt;
  }

  std::string operator()(const Point &geom, const int &precision) const {
    return is_empty_point(geom) ? empty(GeometryType::Point) : stream(geom, precision);
  }

  std::string operator()(const LineString &geom, const int &precision) const {
    return geom.empty() ? empty(GeometryType::LineString) : stream(geom, precision);
  }

  std::string operator()(const Polygon &geom, const int &precision) const {
    return is_empty()(geom) ? empty(GeometryType::Polygon) : stream(to_wkt_polygon(geom), precision);
  }

  // member text without its tag, "EMPTY" for an empty member
  template <typename Member> std::string member(const Member &geom, const int &precision) const {
    std::string text = this->operator()(geom, precision);
    return text.substr(text.find(' ') + 1);
  }

  template <typename Multi> std::string multi(GeometryType type, const Multi &geom, const int &precision) const {
    if (is_empty()(geom)) {
      return empty(type);
    }

    std::string text = std::string(type_name(type)) + " (";

    for (auto it = geom.cbegin(); it < geom.cend(); ++it) {
      if (it != geom.cbegin()) {
        text.append(",");
      }

      text.append(member(*it, precision));
    }

    text.append(")");
    return text;
  }

  std::string operator()(const MultiPoint &geom, const int &precision) const {
    return multi(GeometryType::MultiPoint, geom, precision);
  }

  std::string operator()(const MultiLineString &geom, const int &precision) const {
    return multi(GeometryType::MultiLineString, geom, precision);
  }

  std::string operator()(const MultiPolygon &geom, const int &precision) const {
    return multi(GeometryType::MultiPolygon, geom, precision);
  }

  std::string operator()(const GeometryCollection &geom, const int &precision) const {
    if (geom.empty()) {
      return empty(GeometryType::GeometryCollection);
    }

    std::string collection = "GEOMETRYCOLLECTION (";
    auto bound_visitor = std::bind(*this, std::placeholders::_1, precision);

    for (auto it = geom.cbegin(); it < geom.cend(); ++it) {
      if (it != geom.cbegin()) {
        collection.append(",");
      }

      collection.append(boost::apply_visitor(bound_visitor, it->value));
    }

    collection.append(")");
    return collection;
  }
};

struct json : boost::static_visitor<> {
  std::ostream &os;

  explicit json(std::ostream &os) : os(os) {}

  void coordinate(double value) const {
    if (std::isfinite(value)) {
      os << value;
    } else {
      os << "null";
    }
  }

  void operator()(const Point &geom) const {
    os << "[";
    coordinate(boost::geometry::get<0>(geom));
    os << ",";
    coordinate(boost::geometry::get<1>(geom));
    os << "]";
  }

  void operator()(const Geometry &geom) const {
    os << "{\"type\":\"" << type_name(geom.type) << "\",\"value\":";
    boost::apply_visitor(*this, geom.value);
    os << "}";
  }

  template <typename Range> void operator()(const Range &geom) const {
    os << "[";

    for (auto it = geom.cbegin(); it < geom.cend(); ++it) {
      if (it != geom.cbegin()) {
        os << ",";
      }

      this->operator()(*it);
    }

    os << "]";
  }
};

} // namespace detail

int is_empty(const Geometry &geometry) { return boost::apply_visitor(detail::is_empty(), geometry.value); }

int num_points(const Geometry &geometry) { return boost::apply_visitor(detail::num_points(), geometry.value); }

int num_geometries(const Geometry &geometry) {
  return boost::apply_visitor(detail::num_geometries(), geometry.value);
}

boost::optional<Envelope> envelope(const Geometry &geometry) {
  MultiPoint points;
  boost::apply_visitor(detail::collect_points(points), geometry.value);

  if (points.empty()) {
    return boost::none;
  }

  Envelope e;
  boost::geometry::envelope(points, e);
  return e;
}

int equal(const Geometry &geometry1, const Geometry &geometry2) { return detail::same(geometry1, geometry2); }

std::string wkt(const Geometry &geometry, const int &precision) {
  auto bound_visitor = std::bind(detail::wkt(), std::placeholders::_1, precision);
  std::string geomWkt = boost::apply_visitor(bound_visitor, geometry.value);

  boost::replace_all(geomWkt, ",", ", ");
  return geomWkt;
}

std::string json(const Geometry &geometry) {
  std::stringstream ss;
  ss << std::setprecision(std::numeric_limits<double>::max_digits10);
  detail::json writer(ss);
  writer(geometry);
  return ss.str();
}

std::string json(const ParseResult &result) {
  std::string geomJson = json(static_cast<const Geometry &>(result));
  geomJson.pop_back();
  geomJson.append(",\"srid\":");
  geomJson.append(result.srid ? std::to_string(*result.srid) : "null");
  geomJson.append("}");
  return geomJson;
}

} // namespace ewkb
