/**
 * @file test_bootloader.cpp
 * @brief Boot loop tests against a fake board
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest.h>

#include <cstring>
#include <memory>
#include <vector>

#include "support/scripted_stream.hpp"
#include "xmboot/bootloader.hpp"

using namespace xmboot;
using namespace xmboot::test;

namespace
{

/**
 * @brief Board whose serial port replays one script per attempt
 */
class FakeBoard : public Board
{
 public:
  void add_attempt(const std::vector<uint8_t>& script)
  {
    ports_.push_back(std::make_unique<ScriptedStream>(script));
  }

  Stream& open_serial(uint32_t read_timeout_ms) override
  {
    timeouts.push_back(read_timeout_ms);
    ScriptedStream& port = *ports_.at(opened_);
    ++opened_;
    return port;
  }

  void set_status_led(bool on) override
  {
    led.push_back(on);
  }

  void sleep_ms(uint32_t ms) override
  {
    sleeps.push_back(ms);
  }

  void jump_to(uintptr_t address) override
  {
    jumps.push_back(address);
  }

  const ScriptedStream& port(size_t i) const
  {
    return *ports_.at(i);
  }

  std::vector<uint32_t> timeouts;
  std::vector<bool> led;
  std::vector<uint32_t> sleeps;
  std::vector<uintptr_t> jumps;

 private:
  std::vector<std::unique_ptr<ScriptedStream>> ports_;
  size_t opened_ = 0;
};

std::vector<uint8_t> good_image_script()
{
  std::vector<uint8_t> script = encode_packet(1, counting_payload(0x40));
  script.push_back(EOT);
  script.push_back(EOT);
  return script;
}

}  // namespace

TEST_CASE("Boot loop")
{
  std::vector<uint8_t> ram(2 * PACKET_SIZE, 0);
  BootConfig config;
  config.load_address = reinterpret_cast<uintptr_t>(ram.data());
  config.load_limit = config.load_address + ram.size();
  config.read_timeout_ms = 500;
  config.retry_delay_ms = 250;

  FakeBoard board;

  SUBCASE("Starts the image after the first good transfer")
  {
    board.add_attempt(good_image_script());
    Bootloader loader(board, config);
    loader.run();

    CHECK(loader.attempts() == 1);
    REQUIRE(board.jumps.size() == 1);
    CHECK(board.jumps[0] == config.load_address);
    CHECK(board.timeouts == std::vector<uint32_t>{500});
    CHECK(board.sleeps.empty());
    CHECK(ram[0] == 0x40);
    CHECK(ram[PACKET_SIZE - 1] == static_cast<uint8_t>(0x40 + PACKET_SIZE - 1));
  }

  SUBCASE("Retries after failed transfers")
  {
    board.add_attempt({0x42});                                 // garbage
    board.add_attempt({});                                     // silence
    board.add_attempt({SOH, 1, 0xFE, 0x00, CAN});              // truncated
    board.add_attempt(good_image_script());

    Bootloader loader(board, config);
    loader.run();

    CHECK(loader.attempts() == 4);
    CHECK(board.jumps.size() == 1);
    CHECK(board.sleeps == std::vector<uint32_t>{250, 250, 250});
    CHECK(board.led == std::vector<bool>{true, false, true, false, true, false, true});
    CHECK(ram[0] == 0x40);

    // Every attempt opens with its own handshake
    for (size_t i = 0; i < 4; ++i)
    {
      REQUIRE_FALSE(board.port(i).output().empty());
      CHECK(board.port(i).output()[0] == NAK);
    }
  }

  SUBCASE("Oversized image is never started")
  {
    std::vector<uint8_t> big;
    for (uint8_t p = 1; p <= 3; ++p)
    {
      const std::vector<uint8_t> packet = encode_packet(p, counting_payload(p));
      big.insert(big.end(), packet.begin(), packet.end());
    }
    big.push_back(EOT);
    big.push_back(EOT);

    board.add_attempt(big);
    Bootloader loader(board, config);

    size_t received = 0;
    CHECK(loader.attempt(received) == ErrorCode::UNEXPECTED_EOF);
    CHECK(received == 2 * PACKET_SIZE);
    CHECK(board.jumps.empty());
  }
}

TEST_CASE("Default configuration")
{
  const BootConfig config;
  CHECK(config.load_address == 0x80000);
  CHECK(config.load_limit == 0x4000000);
  CHECK(config.read_timeout_ms == 750);
  CHECK(config.retry_delay_ms == 1000);
}
