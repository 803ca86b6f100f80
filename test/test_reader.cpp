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
#include <gtest/gtest.h>
#include <string>

#include "ewkb_errors.hpp"
#include "ewkb_reader.hpp"
#include "wkb_builder.hpp"

using namespace ewkb;
using ewkb::test::WkbBuilder;

TEST(ReaderTest, LittleEndianMarker) {
  std::string bytes = WkbBuilder(ByteOrder::LittleEndian).byte(1).uint32(0x01020304).bytes();
  Reader reader(bytes);

  EXPECT_EQ(reader.byte_order(), ByteOrder::LittleEndian);
  EXPECT_EQ(reader.read_uint32(), 0x01020304u);
  EXPECT_EQ(reader.remaining(), 0u);
}

TEST(ReaderTest, BigEndianMarker) {
  std::string bytes = WkbBuilder(ByteOrder::BigEndian).byte(0).uint32(0x01020304).float64(-2.25).bytes();
  Reader reader(bytes);

  EXPECT_EQ(reader.byte_order(), ByteOrder::BigEndian);
  EXPECT_EQ(reader.read_uint32(), 0x01020304u);
  EXPECT_EQ(reader.read_double(), -2.25);
}

TEST(ReaderTest, RawBytesHonourOrder) {
  const uint8_t little[] = {0x01, 0xE6, 0x10, 0x00, 0x00};
  const uint8_t big[] = {0x00, 0x00, 0x00, 0x10, 0xE6};

  Reader r1(little, sizeof(little));
  r1.byte_order();
  EXPECT_EQ(r1.read_uint32(), 4326u);

  Reader r2(big, sizeof(big));
  r2.byte_order();
  EXPECT_EQ(r2.read_uint32(), 4326u);
}

TEST(ReaderTest, DoubleFromKnownBytes) {
  // 1.5 as IEEE-754, little endian
  const uint8_t bytes[] = {0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0xF8, 0x3F};
  Reader reader(bytes, sizeof(bytes));

  // Reader starts out big endian until a marker is read.
  EXPECT_EQ(reader.order(), ByteOrder::BigEndian);

  const uint8_t marked[] = {0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0xF8, 0x3F};
  Reader le(marked, sizeof(marked));
  le.byte_order();
  EXPECT_EQ(le.read_double(), 1.5);
}

TEST(ReaderTest, OrderSwitchesMidStream) {
  std::string bytes = WkbBuilder(ByteOrder::LittleEndian)
                          .byte(1)
                          .uint32(7)
                          .order(ByteOrder::BigEndian)
                          .byte(0)
                          .uint32(7)
                          .bytes();
  Reader reader(bytes);

  reader.byte_order();
  EXPECT_EQ(reader.read_uint32(), 7u);
  reader.byte_order();
  EXPECT_EQ(reader.read_uint32(), 7u);
  EXPECT_EQ(reader.position(), 10u);
}

TEST(ReaderTest, InvalidMarker) {
  const uint8_t bytes[] = {0x02, 0x00, 0x00, 0x00, 0x01};
  Reader reader(bytes, sizeof(bytes));

  try {
    reader.byte_order();
    FAIL() << "marker 2 accepted";
  } catch (const InvalidByteOrder &e) {
    EXPECT_EQ(e.marker(), 2);
  }
}

TEST(ReaderTest, ShortBufferThrows) {
  const uint8_t bytes[] = {0x01, 0x00, 0x00};
  Reader reader(bytes, sizeof(bytes));

  reader.byte_order();
  EXPECT_THROW(reader.read_uint32(), UnexpectedEndOfInput);
  // A failed read does not move the cursor.
  EXPECT_EQ(reader.position(), 1u);
  EXPECT_THROW(reader.read_double(), UnexpectedEndOfInput);
}

TEST(ReaderTest, EmptyBufferThrows) {
  Reader reader(nullptr, 0);
  EXPECT_THROW(reader.byte_order(), UnexpectedEndOfInput);
}

TEST(UnhexTest, PlainDigits) {
  EXPECT_EQ(unhex("0101000000"), std::string("\x01\x01\x00\x00\x00", 5));
  EXPECT_EQ(unhex("e610"), std::string("\xE6\x10"));
  EXPECT_EQ(unhex("E610"), std::string("\xE6\x10"));
}

TEST(UnhexTest, Prefixes) {
  EXPECT_EQ(unhex("0x0102"), std::string("\x01\x02"));
  EXPECT_EQ(unhex("X'0102'"), std::string("\x01\x02"));
  EXPECT_EQ(unhex("  x'0102'\n"), std::string("\x01\x02"));
  EXPECT_EQ(unhex(""), std::string());
}

TEST(UnhexTest, Rejects) {
  EXPECT_THROW(unhex("010"), InvalidHexInput);
  EXPECT_THROW(unhex("01zz"), InvalidHexInput);
  EXPECT_THROW(unhex("x'01"), InvalidHexInput);
}
