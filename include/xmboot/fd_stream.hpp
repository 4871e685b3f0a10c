/**
 * @file fd_stream.hpp
 * @brief Stream over a POSIX file descriptor
 *
 * Host-side transport for talking to a boot loader through a tty, a pipe
 * or a pseudo terminal.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>

#include "xmboot/io.hpp"

namespace xmboot
{

/**
 * @brief Blocking byte stream over an open file descriptor
 *
 * Does not own the fd.
 */
class FdStream : public Stream
{
 public:
  /**
   * @param fd              Open, blocking file descriptor
   * @param read_timeout_ms Read timeout, 0 blocks indefinitely
   */
  explicit FdStream(int fd, uint32_t read_timeout_ms = 0);

  void set_read_timeout(uint32_t read_timeout_ms)
  {
    read_timeout_ms_ = read_timeout_ms;
  }

  uint32_t read_timeout() const
  {
    return read_timeout_ms_;
  }

  /**
   * Signals do not cut the wait short: EINTR is retried until the byte
   * arrives or the timeout runs out.
   *
   * @return TIMED_OUT if nothing arrived in time, UNEXPECTED_EOF on hang-up
   *         or a failed read
   */
  ErrorCode read_byte(uint8_t& byte) override;

  /**
   * @brief Wait for one byte, then take whatever else is already buffered
   */
  ErrorCode read(uint8_t* buf, size_t len, size_t& count) override;

  ErrorCode write_byte(uint8_t byte) override;

  /** Writes everything or fails. */
  ErrorCode write(const uint8_t* buf, size_t len, size_t& count) override;

  /**
   * @brief Put a terminal into raw 8N1 mode at 115200 baud
   *
   * @return false if fd is not a terminal or a termios call failed
   */
  static bool configure_tty(int fd);

 private:
  ErrorCode wait_readable();

  int fd_;
  uint32_t read_timeout_ms_;
};

}  // namespace xmboot
