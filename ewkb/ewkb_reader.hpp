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
#ifndef EWKB_READER_HPP
#define EWKB_READER_HPP

#include <cstddef>
#include <cstdint>
#include <string>

namespace ewkb {

enum class ByteOrder : uint8_t { BigEndian = 0, LittleEndian = 1 };

/**
 * Forward-only cursor over an immutable byte buffer. Multi-byte values are decoded in the byte order selected by the
 * last call to byte_order(); before any such call the reader assumes big endian (XDR).
 *
 * The buffer is not copied and must outlive the reader.
 */
class Reader {
public:
  Reader(const uint8_t *data, std::size_t size);
  explicit Reader(const std::string &bytes);

  /** Reads a one byte marker: 1 selects little endian, 0 big endian, anything else throws InvalidByteOrder. */
  ByteOrder byte_order();

  uint32_t read_uint32();
  double read_double();

  ByteOrder order() const { return _order; }
  std::size_t position() const { return _offset; }
  std::size_t remaining() const { return _size - _offset; }

private:
  const uint8_t *reserve(std::size_t width);

  const uint8_t *_data;
  std::size_t _size;
  std::size_t _offset;
  ByteOrder _order;
};

/**
 * Converts hex text to raw bytes. Accepts an optional 0x prefix or the SQL literal form x'...', and digits of either
 * case. Throws InvalidHexInput on odd length or non-hex characters.
 */
std::string unhex(const std::string &text);

} // namespace ewkb

#endif
