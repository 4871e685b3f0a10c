/**
 * @file progress.hpp
 * @brief Transfer progress notifications
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstdint>

namespace xmboot
{

/**
 * @brief Transfer lifecycle events
 */
enum class ProgressKind : uint8_t
{
  WAITING,  ///< Sender is about to block for the receiver's first NAK
  STARTED,  ///< Handshake done, packets follow
  PACKET,   ///< Packet Progress::packet was transferred and acknowledged
};

/**
 * @brief One progress event
 */
struct Progress
{
  ProgressKind kind;
  uint8_t packet;  ///< Sequence number, only meaningful for PACKET
};

/**
 * @brief Progress callback function type
 *
 * Called synchronously from inside the transfer engine. Must not block;
 * it has no way to influence the transfer.
 *
 * @param user     User context pointer passed alongside the callback
 * @param progress Event
 */
using ProgressFn = void (*)(void* user, const Progress& progress);

/**
 * @brief Progress callback that ignores every event
 */
void noop_progress(void* user, const Progress& progress);

/**
 * @brief Progress callback that reports events to the default logger
 *
 * user is ignored.
 */
void log_progress(void* user, const Progress& progress);

const char* to_string(ProgressKind kind);

}  // namespace xmboot
