/**
 * @file mem_writer.hpp
 * @brief Raw memory sink for received images
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
 * @brief Writes successive bytes to successive addresses in [start, end)
 *
 * The writer does not own the memory. The caller guarantees that nothing
 * else, including the running program, lives in the range.
 */
class MemoryWriter : public Writable
{
 public:
  /**
   * @param start First address to write
   * @param end   One past the last address to write (start <= end)
   */
  MemoryWriter(uintptr_t start, uintptr_t end);

  /**
   * @brief Store one byte at the cursor and advance it
   *
   * @return UNEXPECTED_EOF if the range is exhausted; the cursor does not
   *         move in that case
   */
  ErrorCode write_byte(uint8_t byte) override;

  uintptr_t start() const
  {
    return start_;
  }

  uintptr_t end() const
  {
    return end_;
  }

  /** @brief Address of the next write */
  uintptr_t cursor() const
  {
    return cursor_;
  }

  size_t written() const
  {
    return static_cast<size_t>(cursor_ - start_);
  }

  size_t remaining() const
  {
    return static_cast<size_t>(end_ - cursor_);
  }

 private:
  const uintptr_t start_;
  const uintptr_t end_;
  uintptr_t cursor_;
};

}  // namespace xmboot
