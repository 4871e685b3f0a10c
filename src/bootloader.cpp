/**
 * @file bootloader.cpp
 * @brief Serial boot loop implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "xmboot/bootloader.hpp"

#include <spdlog/spdlog.h>

#include "xmboot/mem_writer.hpp"
#include "xmboot/xmodem.hpp"

namespace xmboot
{

Bootloader::Bootloader(Board& board, const BootConfig& config, ProgressFn progress, void* user)
    : board_(board),
      config_(config),
      progress_(progress != nullptr ? progress : noop_progress),
      user_context_(user),
      attempts_(0)
{
}

ErrorCode Bootloader::attempt(size_t& received)
{
  ++attempts_;
  board_.set_status_led(true);

  Stream& serial = board_.open_serial(config_.read_timeout_ms);

  // A fresh writer per attempt: a failed transfer is simply overwritten
  MemoryWriter image(config_.load_address, config_.load_limit);

  return Xmodem::receive(serial, image, received, progress_, user_context_);
}

void Bootloader::run()
{
  while (true)
  {
    size_t received = 0;
    const ErrorCode err = attempt(received);

    if (err == ErrorCode::OK)
    {
      spdlog::info("boot: received {} bytes, starting image at {:#x}", received,
                   config_.load_address);
      board_.jump_to(config_.load_address);
      return;
    }

    spdlog::warn("boot: attempt {} failed: {}", attempts_, to_string(err));
    board_.set_status_led(false);
    board_.sleep_ms(config_.retry_delay_ms);
  }
}

}  // namespace xmboot
