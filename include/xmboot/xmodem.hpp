/**
 * @file xmodem.hpp
 * @brief XMODEM transfer engine
 *
 * Half-duplex, checksum-verified, 128-byte packet transfer over any
 * byte Stream. Platform-agnostic: the engine only talks to the Stream,
 * Readable and Writable interfaces.
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
 * @brief One XMODEM transfer session
 *
 * A session uses its port exclusively from construction until it is
 * destroyed. The same session can receive (download) or send (upload).
 *
 * Example usage:
 * @code
 * // Boot loader: receive an image straight into RAM
 * MemoryWriter image(0x80000, 0x4000000);
 * size_t received = 0;
 * if (Xmodem::receive(uart, image, received) == ErrorCode::OK) {
 *   jump_to(0x80000);
 * }
 *
 * // Host: send a file
 * BufferReader data(file_bytes, file_len);
 * size_t written = 0;
 * ErrorCode err = Xmodem::transmit(data, tty, written);
 * @endcode
 */
class Xmodem
{
 public:
  /**
   * @brief Session state
   *
   * Checksum failures and peer NAKs leave the state untouched. Only the
   * EOT exchange moves IN_TRANSFER to FINISHED.
   */
  enum class State
  {
    AWAITING_START,  // No handshake yet
    IN_TRANSFER,     // Handshake done, packets flowing
    FINISHED,        // EOT exchange completed
  };

  /**
   * @brief Construct a session
   *
   * @param port     Transport, used exclusively by this session
   * @param progress Progress callback (default: no-op)
   * @param user     User context pointer passed to progress (can be nullptr)
   */
  explicit Xmodem(Stream& port, ProgressFn progress = noop_progress, void* user = nullptr);

  Xmodem(const Xmodem&) = delete;
  Xmodem& operator=(const Xmodem&) = delete;

  /**
   * @brief Receive all packets from port into a sink
   *
   * Sends the opening NAK, then reads packets until the sender ends the
   * transmission. A packet failing its checksum is requested again, up to
   * MAX_PACKET_ATTEMPTS times in a row.
   *
   * The reported count is always a multiple of PACKET_SIZE: the zero
   * padding of the last packet is written to the sink as well.
   *
   * @param port     Transport
   * @param into     Destination of the payload bytes
   * @param received Receives the number of payload bytes written to into
   * @param progress Progress callback
   * @param user     User context pointer passed to progress
   * @return OK, BROKEN_PIPE when a packet exhausted its attempts, or the
   *         first non-retryable error of the transport, protocol or sink
   */
  static ErrorCode receive(Stream& port, Writable& into, size_t& received,
                           ProgressFn progress = noop_progress, void* user = nullptr);

  /**
   * @brief Send everything a source yields over port
   *
   * Waits for the receiver's NAK, then sends the data in zero-padded
   * 128-byte packets and ends the transmission. A NAKed packet is sent
   * again, up to MAX_PACKET_ATTEMPTS times in a row.
   *
   * @param data     Data source, read until it returns 0 bytes
   * @param port     Transport
   * @param written  Receives the number of data bytes sent, padding excluded
   * @param progress Progress callback
   * @param user     User context pointer passed to progress
   * @return OK, BROKEN_PIPE when a packet exhausted its attempts, or the
   *         first non-retryable error
   */
  static ErrorCode transmit(Readable& data, Stream& port, size_t& written,
                            ProgressFn progress = noop_progress, void* user = nullptr);

  /**
   * @brief Receive a single packet
   *
   * The first call of a transfer writes the opening NAK before anything
   * else, including the buffer size check.
   *
   * @param buf   Destination, at least PACKET_SIZE bytes
   * @param len   Length of buf
   * @param count Receives PACKET_SIZE for a data packet, 0 at end of
   *              transmission
   * @return OK on success
   * @return UNEXPECTED_EOF if len < PACKET_SIZE
   * @return INTERRUPTED on checksum mismatch (NAK sent, retry the call)
   * @return INVALID_DATA on a framing or sequence mismatch
   * @return CONNECTION_ABORTED if the sender cancelled
   * @return any transport error
   */
  ErrorCode read_packet(uint8_t* buf, size_t len, size_t& count);

  /**
   * @brief Send a single packet
   *
   * An empty buffer sends end of transmission.
   *
   * @param buf   Payload, exactly PACKET_SIZE bytes, or nullptr with len 0
   * @param len   PACKET_SIZE or 0
   * @param count Receives the number of payload bytes acknowledged
   * @return OK on success
   * @return UNEXPECTED_EOF if len is neither PACKET_SIZE nor 0
   * @return INTERRUPTED if the receiver NAKed the packet (retry the call)
   * @return INVALID_DATA on an unexpected response byte
   * @return CONNECTION_ABORTED if the receiver cancelled
   * @return any transport error
   */
  ErrorCode write_packet(const uint8_t* buf, size_t len, size_t& count);

  State state() const
  {
    return state_;
  }

  /**
   * @brief Sequence number the next packet is sent or expected with
   */
  uint8_t packet_sequence() const
  {
    return packet_;
  }

 private:
  /**
   * @brief Read one byte, optionally treating CAN as an abort
   */
  ErrorCode read_byte(uint8_t& byte, bool abort_on_can);

  /**
   * @brief Read one byte and require it to be expected
   *
   * CAN yields CONNECTION_ABORTED, anything else INVALID_DATA.
   */
  ErrorCode expect_byte(uint8_t expected);

  /**
   * @brief Like expect_byte(), but writes CAN to the peer on mismatch
   */
  ErrorCode expect_byte_or_cancel(uint8_t expected);

  void notify(ProgressKind kind, uint8_t packet = 0);

  Stream& port_;          ///< Transport
  ProgressFn progress_;   ///< Progress callback
  void* user_context_;    ///< User context for callback
  State state_;           ///< Session state
  uint8_t packet_;        ///< Current packet sequence number
};

}  // namespace xmboot
