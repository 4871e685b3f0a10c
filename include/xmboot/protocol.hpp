/**
 * @file protocol.hpp
 * @brief xmboot protocol definitions
 *
 * XMODEM (checksum variant) control bytes, packet geometry, retry limits
 * and the boot loader's default memory map.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace xmboot
{

/* ========================================================================= */
/* Control bytes                                                             */
/* ========================================================================= */

/** @brief Start of a 128-byte packet */
constexpr uint8_t SOH = 0x01;

/** @brief End of transmission */
constexpr uint8_t EOT = 0x04;

/** @brief Packet or EOT accepted */
constexpr uint8_t ACK = 0x06;

/**
 * @brief Packet rejected
 *
 * Also sent once by the receiver to announce it is ready for the first
 * packet.
 */
constexpr uint8_t NAK = 0x15;

/** @brief Abort the transfer */
constexpr uint8_t CAN = 0x18;

/* ========================================================================= */
/* Packet structure                                                          */
/* ========================================================================= */

/**
 * @brief Payload size of every data packet in bytes
 *
 * The last chunk of a stream is zero-padded up to this size.
 */
constexpr size_t PACKET_SIZE = 128;

/**
 * @brief Sequence number of the first packet of a session
 */
constexpr uint8_t FIRST_SEQUENCE = 1;

/**
 * @brief Consecutive attempts per packet before giving up
 *
 * Bounds the time spent on a dead link when the transport has no
 * read timeout configured.
 */
constexpr int MAX_PACKET_ATTEMPTS = 10;

/**
 * Packet format:
 *
 * [SOH][SEQ][~SEQ][DATA x 128][SUM]
 *
 * - SOH:  1 byte   (0x01)
 * - SEQ:  1 byte   (starts at 1, wraps 255 -> 0)
 * - ~SEQ: 1 byte   (255 - SEQ)
 * - DATA: 128 bytes
 * - SUM:  1 byte   (8-bit wraparound sum of DATA)
 *
 * End of transmission:
 *
 *   sender   [EOT]       [EOT]
 *   receiver       [NAK]       [ACK]
 *
 * The receiver opens every transfer with a single unsolicited NAK.
 */

/** @brief Encoded size of a data packet on the wire */
constexpr size_t WIRE_PACKET_SIZE = 3 + PACKET_SIZE + 1;

/* ========================================================================= */
/* Error codes                                                               */
/* ========================================================================= */

/**
 * @brief Result of every fallible xmboot operation
 *
 * Defined via errors.def so the C API shares the same values.
 * Only INTERRUPTED is retryable, and only by the stream drivers.
 */
enum class ErrorCode : uint8_t
{
#define ERR(name, val, msg) name = val,
#include "xmboot/errors.def"
#undef ERR
};

/**
 * @brief Get the static message for an error code
 */
const char* to_string(ErrorCode code);

/* ========================================================================= */
/* Boot loader defaults                                                      */
/* ========================================================================= */

/** @brief Address the received image is written to and started from */
constexpr uintptr_t DEFAULT_LOAD_ADDRESS = 0x80000;

/**
 * @brief First address the image may not touch
 *
 * The boot loader relocates itself here, so this also bounds the image size.
 */
constexpr uintptr_t DEFAULT_LOAD_LIMIT = 0x4000000;

/** @brief Serial read timeout used by the boot loop */
constexpr uint32_t DEFAULT_READ_TIMEOUT_MS = 750;

/** @brief Pause between failed transfer attempts */
constexpr uint32_t DEFAULT_RETRY_DELAY_MS = 1000;

}  // namespace xmboot
