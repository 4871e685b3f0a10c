/**
 * @file bootloader.hpp
 * @brief Serial boot loop
 *
 * Waits for an image over the serial line, writes it to the load address
 * and starts it. Failed transfers are retried forever.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>

#include "xmboot/io.hpp"
#include "xmboot/progress.hpp"
#include "xmboot/protocol.hpp"

namespace xmboot
{

/**
 * @brief Boot loader configuration
 *
 * [load_address, load_limit) must not overlap the boot loader itself.
 */
struct BootConfig
{
  uintptr_t load_address = DEFAULT_LOAD_ADDRESS;         ///< Image destination and entry point
  uintptr_t load_limit = DEFAULT_LOAD_LIMIT;             ///< First address past the image area
  uint32_t read_timeout_ms = DEFAULT_READ_TIMEOUT_MS;    ///< Serial read timeout, 0 = none
  uint32_t retry_delay_ms = DEFAULT_RETRY_DELAY_MS;      ///< Pause after a failed attempt
};

/**
 * @brief Hardware the boot loop runs on
 *
 * Wraps the UART, GPIO and timer drivers of a board.
 */
class Board
{
 public:
  virtual ~Board() = default;

  /**
   * @brief Prepare the serial port for a transfer
   *
   * Called once per attempt. Configures pins and line settings as needed.
   *
   * @param read_timeout_ms Read timeout; reads exceeding it fail with
   *                        TIMED_OUT. 0 blocks indefinitely.
   * @return The serial stream, owned by the board
   */
  virtual Stream& open_serial(uint32_t read_timeout_ms) = 0;

  /** @brief Drive the status LED */
  virtual void set_status_led(bool on) = 0;

  /** @brief Busy-wait */
  virtual void sleep_ms(uint32_t ms) = 0;

  /**
   * @brief Transfer control to address
   *
   * Does not return on hardware.
   */
  virtual void jump_to(uintptr_t address) = 0;
};

/**
 * @brief Receive-and-start loop
 *
 * Example usage:
 * @code
 * RpiBoard board;
 * Bootloader loader(board, BootConfig());
 * loader.run();
 * @endcode
 */
class Bootloader
{
 public:
  /**
   * @param board    Board drivers
   * @param config   Memory map and timing
   * @param progress Progress callback for each transfer (default: no-op)
   * @param user     User context pointer passed to progress
   */
  Bootloader(Board& board, const BootConfig& config, ProgressFn progress = noop_progress,
             void* user = nullptr);

  /**
   * @brief Run one transfer attempt into the load area
   *
   * The status LED is switched on for the attempt.
   *
   * @param received Receives the number of bytes written to memory
   * @return Result of the transfer
   */
  ErrorCode attempt(size_t& received);

  /**
   * @brief Retry attempt() until one succeeds, then jump to the image
   *
   * Between failed attempts the LED is switched off for retry_delay_ms.
   * Returns only if Board::jump_to() returns.
   */
  void run();

  /** @brief Number of attempts started so far */
  uint32_t attempts() const
  {
    return attempts_;
  }

  const BootConfig& config() const
  {
    return config_;
  }

 private:
  Board& board_;
  BootConfig config_;
  ProgressFn progress_;
  void* user_context_;
  uint32_t attempts_;
};

}  // namespace xmboot
