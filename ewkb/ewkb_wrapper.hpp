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
#ifndef EWKB_WRAPPER_HPP
#define EWKB_WRAPPER_HPP

#include <string>

#include "ewkb_geometries.hpp"

namespace ewkb {
int is_empty(const Geometry &geometry);

int num_points(const Geometry &geometry);
int num_geometries(const Geometry &geometry);

/** Bounding box of all coordinates, none when the geometry holds no coordinate. */
boost::optional<Envelope> envelope(const Geometry &geometry);

/** Exact structural equality: same tags, same nesting, same coordinates. */
int equal(const Geometry &geometry1, const Geometry &geometry2);

/** WKT text. A negative precision keeps the stream default. */
std::string wkt(const Geometry &geometry, const int &precision = -1);

/** {"type":...,"value":...,"srid":...} with coordinates printed round-trip exact. */
std::string json(const ParseResult &result);
std::string json(const Geometry &geometry);
} // namespace ewkb

#endif
