/**
 * @file io.cpp
 * @brief Byte endpoint helpers
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "xmboot/io.hpp"

#include <cstring>

namespace xmboot
{

ErrorCode Readable::read(uint8_t* buf, size_t len, size_t& count)
{
  count = 0;
  for (size_t i = 0; i < len; ++i)
  {
    const ErrorCode err = read_byte(buf[i]);
    if (err != ErrorCode::OK)
    {
      count = i;
      return err;
    }
  }
  count = len;
  return ErrorCode::OK;
}

ErrorCode Writable::write(const uint8_t* buf, size_t len, size_t& count)
{
  count = 0;
  for (size_t i = 0; i < len; ++i)
  {
    const ErrorCode err = write_byte(buf[i]);
    if (err != ErrorCode::OK)
    {
      count = i;
      return err;
    }
  }
  count = len;
  return ErrorCode::OK;
}

ErrorCode read_max(Readable& src, uint8_t* buf, size_t len, size_t& count)
{
  size_t filled = 0;
  count = 0;

  while (filled < len)
  {
    size_t n = 0;
    const ErrorCode err = src.read(buf + filled, len - filled, n);

    if (err == ErrorCode::INTERRUPTED)
    {
      // Keep whatever arrived before the interruption
      filled += n;
      continue;
    }
    if (err != ErrorCode::OK)
    {
      return err;
    }
    if (n == 0)
    {
      // Source exhausted
      break;
    }
    filled += n;
  }

  count = filled;
  return ErrorCode::OK;
}

/* ========================================================================= */
/* BufferReader                                                              */
/* ========================================================================= */

BufferReader::BufferReader(const uint8_t* data, size_t len) : data_(data), len_(len), pos_(0)
{
}

ErrorCode BufferReader::read_byte(uint8_t& byte)
{
  if (pos_ >= len_)
  {
    return ErrorCode::UNEXPECTED_EOF;
  }
  byte = data_[pos_++];
  return ErrorCode::OK;
}

ErrorCode BufferReader::read(uint8_t* buf, size_t len, size_t& count)
{
  const size_t n = len < remaining() ? len : remaining();
  if (n > 0)
  {
    std::memcpy(buf, data_ + pos_, n);
    pos_ += n;
  }
  count = n;
  return ErrorCode::OK;
}

/* ========================================================================= */
/* BufferWriter                                                              */
/* ========================================================================= */

BufferWriter::BufferWriter(uint8_t* data, size_t capacity)
    : data_(data), capacity_(capacity), pos_(0)
{
}

ErrorCode BufferWriter::write_byte(uint8_t byte)
{
  if (pos_ >= capacity_)
  {
    return ErrorCode::UNEXPECTED_EOF;
  }
  data_[pos_++] = byte;
  return ErrorCode::OK;
}

}  // namespace xmboot
