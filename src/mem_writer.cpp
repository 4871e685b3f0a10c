/**
 * @file mem_writer.cpp
 * @brief Raw memory sink implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "xmboot/mem_writer.hpp"

namespace xmboot
{

namespace
{

/**
 * @brief Store a byte at a physical address
 *
 * The only integer-to-pointer conversion in xmboot. Volatile so the
 * compiler neither drops nor reorders stores into memory it cannot see
 * being read before the jump.
 */
inline void store_byte(uintptr_t address, uint8_t byte)
{
  *reinterpret_cast<volatile uint8_t*>(address) = byte;
}

}  // namespace

MemoryWriter::MemoryWriter(uintptr_t start, uintptr_t end)
    : start_(start), end_(end < start ? start : end), cursor_(start)
{
}

ErrorCode MemoryWriter::write_byte(uint8_t byte)
{
  if (cursor_ == end_)
  {
    return ErrorCode::UNEXPECTED_EOF;
  }

  store_byte(cursor_, byte);
  ++cursor_;
  return ErrorCode::OK;
}

}  // namespace xmboot
