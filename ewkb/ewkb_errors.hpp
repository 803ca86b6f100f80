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
#ifndef EWKB_ERRORS_HPP
#define EWKB_ERRORS_HPP

#include <boost/format.hpp>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

#include "ewkb_geometries.hpp"

namespace ewkb {

/** Base of every decoding failure. A parse that throws produces no result at all. */
class ParseError : public std::runtime_error {
public:
  explicit ParseError(const std::string &message) : std::runtime_error(message) {}
};

class InvalidByteOrder : public ParseError {
public:
  InvalidByteOrder(uint8_t marker, std::size_t offset)
      : ParseError(boost::str(boost::format("Invalid byte order marker %1% at offset %2%.") %
                              static_cast<unsigned>(marker) % offset)),
        _marker(marker) {}

  uint8_t marker() const { return _marker; }

private:
  uint8_t _marker;
};

class UnsupportedType : public ParseError {
public:
  explicit UnsupportedType(uint32_t type)
      : ParseError(boost::str(boost::format("Unsupported WKB type \"%1%\".") % type)), _type(type) {}

  uint32_t type() const { return _type; }

private:
  uint32_t _type;
};

class UnexpectedEndOfInput : public ParseError {
public:
  UnexpectedEndOfInput(std::size_t offset, std::size_t wanted, std::size_t available)
      : ParseError(boost::str(boost::format("Unexpected end of input at offset %1%: %2% bytes needed, %3% left.") %
                              offset % wanted % available)),
        _offset(offset) {}

  std::size_t offset() const { return _offset; }

private:
  std::size_t _offset;
};

class UnexpectedGeometryType : public ParseError {
public:
  UnexpectedGeometryType(GeometryType expected, GeometryType actual)
      : ParseError(boost::str(boost::format("Expected %1% element, found %2%.") % type_name(expected) %
                              type_name(actual))),
        _expected(expected), _actual(actual) {}

  GeometryType expected() const { return _expected; }
  GeometryType actual() const { return _actual; }

private:
  GeometryType _expected;
  GeometryType _actual;
};

class NestingTooDeep : public ParseError {
public:
  NestingTooDeep(unsigned depth, unsigned max_depth)
      : ParseError(boost::str(boost::format("Geometry nesting depth %1% exceeds the limit of %2%.") % depth %
                              max_depth)) {}
};

class InvalidHexInput : public ParseError {
public:
  explicit InvalidHexInput(const std::string &reason) : ParseError("Invalid hex input: " + reason) {}
};

} // namespace ewkb

#endif
