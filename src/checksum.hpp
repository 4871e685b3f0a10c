/**
 * @file checksum.hpp
 * @brief XMODEM packet checksum (internal)
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace xmboot
{
namespace internal
{

/**
 * @brief Calculate the 8-bit packet checksum
 *
 * Wraparound sum of all bytes, initial value 0x00.
 *
 * @param data Pointer to data buffer
 * @param len  Length of data in bytes
 * @return Checksum value
 */
uint8_t calc_checksum(const uint8_t* data, size_t len);

}  // namespace internal
}  // namespace xmboot
