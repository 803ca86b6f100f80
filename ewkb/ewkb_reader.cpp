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
#include <boost/algorithm/hex.hpp>
#include <boost/algorithm/string.hpp>
#include <boost/endian/conversion.hpp>
#include <cstring>
#include <iterator>

#include "ewkb_errors.hpp"
#include "ewkb_reader.hpp"

namespace ewkb {

namespace detail {
template <typename T> T to_native(T value, ByteOrder order) {
  return (order == ByteOrder::LittleEndian) ? boost::endian::little_to_native(value)
                                            : boost::endian::big_to_native(value);
}
} // namespace detail

Reader::Reader(const uint8_t *data, std::size_t size)
    : _data(data), _size(size), _offset(0), _order(ByteOrder::BigEndian) {}

Reader::Reader(const std::string &bytes)
    : Reader(reinterpret_cast<const uint8_t *>(bytes.data()), bytes.size()) {}

const uint8_t *Reader::reserve(std::size_t width) {
  if (remaining() < width) {
    throw UnexpectedEndOfInput(_offset, width, remaining());
  }

  const uint8_t *ptr = _data + _offset;
  _offset += width;
  return ptr;
}

ByteOrder Reader::byte_order() {
  std::size_t offset = _offset;
  uint8_t marker = *reserve(1);

  switch (marker) {
  case 0:
    _order = ByteOrder::BigEndian;
    break;
  case 1:
    _order = ByteOrder::LittleEndian;
    break;
  default:
    throw InvalidByteOrder(marker, offset);
  }

  return _order;
}

uint32_t Reader::read_uint32() {
  uint32_t value;
  std::memcpy(&value, reserve(sizeof(value)), sizeof(value));
  return detail::to_native(value, _order);
}

double Reader::read_double() {
  uint64_t bits;
  std::memcpy(&bits, reserve(sizeof(bits)), sizeof(bits));
  bits = detail::to_native(bits, _order);

  double value;
  std::memcpy(&value, &bits, sizeof(value));
  return value;
}

std::string unhex(const std::string &text) {
  std::string digits = boost::trim_copy(text);

  if (boost::istarts_with(digits, "x'") && boost::ends_with(digits, "'") && digits.size() >= 3) {
    digits = digits.substr(2, digits.size() - 3);
  } else if (boost::istarts_with(digits, "0x")) {
    digits.erase(0, 2);
  }

  if (digits.size() % 2 != 0) {
    throw InvalidHexInput("odd number of digits");
  }

  std::string bytes;
  bytes.reserve(digits.size() / 2);

  try {
    boost::algorithm::unhex(digits.begin(), digits.end(), std::back_inserter(bytes));
  } catch (const boost::algorithm::hex_decode_error &) {
    throw InvalidHexInput("non-hex character");
  }

  return bytes;
}

} // namespace ewkb
