/**
 * @file io.hpp
 * @brief Byte endpoint interfaces
 *
 * Minimal readable/writable contracts the transfer engine is written
 * against. Hardware drivers, host file descriptors, memory regions and
 * test doubles all plug in through these.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>

#include "xmboot/protocol.hpp"

namespace xmboot
{

/**
 * @brief Source of bytes
 */
class Readable
{
 public:
  virtual ~Readable() = default;

  /**
   * @brief Read one byte, blocking until it is available
   *
   * @param byte Receives the byte on success
   * @return ErrorCode::OK, or the endpoint's error
   */
  virtual ErrorCode read_byte(uint8_t& byte) = 0;

  /**
   * @brief Read into a buffer
   *
   * The default fills the whole buffer with read_byte() and fails on the
   * first error. Endpoints that can run dry (files, memory) override this
   * to report a short count, and a count of 0 once exhausted.
   *
   * @param buf   Destination buffer
   * @param len   Buffer length in bytes
   * @param count Receives the number of bytes stored in buf, also on error
   * @return ErrorCode::OK, or the first error encountered
   */
  virtual ErrorCode read(uint8_t* buf, size_t len, size_t& count);
};

/**
 * @brief Sink of bytes
 */
class Writable
{
 public:
  virtual ~Writable() = default;

  /**
   * @brief Write one byte
   *
   * @param byte Byte to write
   * @return ErrorCode::OK, or the endpoint's error
   */
  virtual ErrorCode write_byte(uint8_t byte) = 0;

  /**
   * @brief Write a buffer
   *
   * The default writes byte by byte and fails on the first error. On
   * success every byte has been written.
   *
   * @param buf   Source buffer
   * @param len   Number of bytes to write
   * @param count Receives the number of bytes written, also on error
   * @return ErrorCode::OK, or the first error encountered
   */
  virtual ErrorCode write(const uint8_t* buf, size_t len, size_t& count);
};

/**
 * @brief Bidirectional endpoint, e.g. a UART
 */
class Stream : public Readable, public Writable
{
};

/**
 * @brief Fill a buffer from a source that may deliver short reads
 *
 * Issues bulk reads over the remaining part of the buffer until it is
 * full or a read returns 0. INTERRUPTED is retried, any other error is
 * returned.
 *
 * @param src   Data source
 * @param buf   Destination buffer
 * @param len   Buffer length in bytes
 * @param count Receives the number of bytes filled (less than len only when
 *              the source is exhausted)
 */
ErrorCode read_max(Readable& src, uint8_t* buf, size_t len, size_t& count);

/**
 * @brief Readable view over a caller-owned byte range
 */
class BufferReader : public Readable
{
 public:
  BufferReader(const uint8_t* data, size_t len);

  /** @return UNEXPECTED_EOF once every byte has been consumed */
  ErrorCode read_byte(uint8_t& byte) override;

  /** Copies what is left, up to len; count is 0 once exhausted. */
  ErrorCode read(uint8_t* buf, size_t len, size_t& count) override;

  size_t remaining() const
  {
    return len_ - pos_;
  }

 private:
  const uint8_t* data_;
  size_t len_;
  size_t pos_;
};

/**
 * @brief Writable view over a caller-owned fixed-size buffer
 */
class BufferWriter : public Writable
{
 public:
  BufferWriter(uint8_t* data, size_t capacity);

  /** @return UNEXPECTED_EOF when the buffer is full */
  ErrorCode write_byte(uint8_t byte) override;

  size_t size() const
  {
    return pos_;
  }

  size_t capacity() const
  {
    return capacity_;
  }

 private:
  uint8_t* data_;
  size_t capacity_;
  size_t pos_;
};

}  // namespace xmboot
