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
#ifndef EWKB_TEST_WKB_BUILDER_HPP
#define EWKB_TEST_WKB_BUILDER_HPP

#include <boost/endian/conversion.hpp>
#include <cstdint>
#include <cstring>
#include <string>

#include "ewkb_geometries.hpp"
#include "ewkb_reader.hpp"

namespace ewkb {
namespace test {

/** Test-only EWKB writer. Every value is written in the byte order last selected with order(). */
class WkbBuilder {
public:
  explicit WkbBuilder(ByteOrder order = ByteOrder::LittleEndian) : _order(order) {}

  WkbBuilder &order(ByteOrder order) {
    _order = order;
    return *this;
  }

  WkbBuilder &byte(uint8_t value) {
    _bytes.push_back(static_cast<char>(value));
    return *this;
  }

  WkbBuilder &uint32(uint32_t value) {
    value = (_order == ByteOrder::LittleEndian) ? boost::endian::native_to_little(value)
                                                : boost::endian::native_to_big(value);
    _bytes.append(reinterpret_cast<const char *>(&value), sizeof(value));
    return *this;
  }

  WkbBuilder &float64(double value) {
    uint64_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    bits = (_order == ByteOrder::LittleEndian) ? boost::endian::native_to_little(bits)
                                               : boost::endian::native_to_big(bits);
    _bytes.append(reinterpret_cast<const char *>(&bits), sizeof(bits));
    return *this;
  }

  /** Byte order marker followed by the type code. */
  WkbBuilder &header(GeometryType type) {
    byte(static_cast<uint8_t>(_order));
    return uint32(static_cast<uint32_t>(type));
  }

  /** Header with the SRID flag set. */
  WkbBuilder &header(GeometryType type, uint32_t srid) {
    byte(static_cast<uint8_t>(_order));
    uint32(static_cast<uint32_t>(type) | flags::WKB_SRID);
    return uint32(srid);
  }

  WkbBuilder &xy(double x, double y) { return float64(x).float64(y); }

  WkbBuilder &point(double x, double y) { return header(GeometryType::Point).xy(x, y); }

  const std::string &bytes() const { return _bytes; }

private:
  ByteOrder _order;
  std::string _bytes;
};

} // namespace test
} // namespace ewkb

#endif
