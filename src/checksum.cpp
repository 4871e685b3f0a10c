/**
 * @file checksum.cpp
 * @brief XMODEM packet checksum implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "checksum.hpp"

namespace xmboot
{
namespace internal
{

uint8_t calc_checksum(const uint8_t* data, size_t len)
{
  uint8_t sum = 0x00;

  for (size_t i = 0; i < len; ++i)
  {
    sum = static_cast<uint8_t>(sum + data[i]);
  }

  return sum;
}

}  // namespace internal
}  // namespace xmboot
