/**
 * @file test_mem_writer.cpp
 * @brief Memory sink tests
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest.h>

#include <cstring>
#include <vector>

#include "support/scripted_stream.hpp"
#include "xmboot/mem_writer.hpp"
#include "xmboot/xmodem.hpp"

using namespace xmboot;
using namespace xmboot::test;

namespace
{

uintptr_t address_of(uint8_t* p)
{
  return reinterpret_cast<uintptr_t>(p);
}

}  // namespace

TEST_CASE("MemoryWriter bounds")
{
  uint8_t ram[64 + 1];
  std::memset(ram, 0xEE, sizeof(ram));
  const uintptr_t start = address_of(ram);
  const uintptr_t end = start + 64;
  MemoryWriter writer(start, end);

  CHECK(writer.cursor() == start);
  CHECK(writer.remaining() == 64);

  for (int i = 0; i < 64; ++i)
  {
    REQUIRE(writer.write_byte(static_cast<uint8_t>(i)) == ErrorCode::OK);
  }
  CHECK(writer.cursor() == end);
  CHECK(writer.written() == 64);
  CHECK(writer.remaining() == 0);
  CHECK(ram[0] == 0);
  CHECK(ram[63] == 63);

  // Exhausted: refused, cursor stays, guard byte untouched
  CHECK(writer.write_byte(0x55) == ErrorCode::UNEXPECTED_EOF);
  CHECK(writer.cursor() == end);
  CHECK(ram[64] == 0xEE);
}

TEST_CASE("MemoryWriter bulk write")
{
  uint8_t ram[16] = {0};
  MemoryWriter writer(address_of(ram), address_of(ram) + sizeof(ram));

  const uint8_t data[20] = {1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12, 13, 14, 15, 16, 17, 18, 19, 20};
  size_t count = 0;
  CHECK(writer.write(data, sizeof(data), count) == ErrorCode::UNEXPECTED_EOF);
  CHECK(count == 16);
  CHECK(std::memcmp(ram, data, sizeof(ram)) == 0);
}

TEST_CASE("MemoryWriter with an empty range")
{
  uint8_t ram[1] = {0};
  MemoryWriter writer(address_of(ram), address_of(ram));
  CHECK(writer.remaining() == 0);
  CHECK(writer.write_byte(1) == ErrorCode::UNEXPECTED_EOF);
  CHECK(ram[0] == 0);
}

TEST_CASE("Receiving an image into memory")
{
  std::vector<uint8_t> ram(4 * PACKET_SIZE, 0);
  MemoryWriter image(address_of(ram.data()), address_of(ram.data()) + ram.size());

  ScriptedStream port;
  for (uint8_t p = 1; p <= 3; ++p)
  {
    port.feed(encode_packet(p, counting_payload(static_cast<uint8_t>(p * 16))));
  }
  port.feed({EOT, EOT});

  size_t received = 0;
  REQUIRE(Xmodem::receive(port, image, received) == ErrorCode::OK);
  CHECK(received == 3 * PACKET_SIZE);
  CHECK(image.written() == 3 * PACKET_SIZE);
  CHECK(ram[0] == 16);
  CHECK(ram[PACKET_SIZE] == 32);
  CHECK(ram[2 * PACKET_SIZE + 1] == 49);
  CHECK(ram[3 * PACKET_SIZE] == 0);
}

TEST_CASE("Oversized image is rejected")
{
  std::vector<uint8_t> ram(2 * PACKET_SIZE, 0);
  MemoryWriter image(address_of(ram.data()), address_of(ram.data()) + ram.size());

  ScriptedStream port;
  for (uint8_t p = 1; p <= 3; ++p)
  {
    port.feed(encode_packet(p, counting_payload(p)));
  }
  port.feed({EOT, EOT});

  size_t received = 0;
  CHECK(Xmodem::receive(port, image, received) == ErrorCode::UNEXPECTED_EOF);
  CHECK(received == 2 * PACKET_SIZE);
  CHECK(image.remaining() == 0);
}
