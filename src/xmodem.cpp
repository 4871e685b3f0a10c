/**
 * @file xmodem.cpp
 * @brief XMODEM transfer engine implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "xmboot/xmodem.hpp"

#include <spdlog/spdlog.h>

#include <cstring>

#include "checksum.hpp"

namespace xmboot
{

namespace
{

constexpr uint8_t complement(uint8_t seq)
{
  return static_cast<uint8_t>(0xFF - seq);
}

}  // namespace

Xmodem::Xmodem(Stream& port, ProgressFn progress, void* user)
    : port_(port),
      progress_(progress != nullptr ? progress : noop_progress),
      user_context_(user),
      state_(State::AWAITING_START),
      packet_(FIRST_SEQUENCE)
{
}

/* ========================================================================= */
/* Stream drivers                                                            */
/* ========================================================================= */

ErrorCode Xmodem::receive(Stream& port, Writable& into, size_t& received, ProgressFn progress,
                          void* user)
{
  Xmodem receiver(port, progress, user);
  uint8_t packet[PACKET_SIZE];
  received = 0;

  while (true)
  {
    ErrorCode err = ErrorCode::INTERRUPTED;
    size_t n = 0;

    for (int attempt = 0; attempt < MAX_PACKET_ATTEMPTS && err == ErrorCode::INTERRUPTED;
         ++attempt)
    {
      err = receiver.read_packet(packet, sizeof(packet), n);
    }

    if (err == ErrorCode::INTERRUPTED)
    {
      spdlog::debug("xmodem: packet {} failed {} times, giving up", receiver.packet_sequence(),
                    MAX_PACKET_ATTEMPTS);
      return ErrorCode::BROKEN_PIPE;
    }
    if (err != ErrorCode::OK)
    {
      return err;
    }

    if (n == 0)
    {
      // End of transmission
      return ErrorCode::OK;
    }

    size_t stored = 0;
    err = into.write(packet, n, stored);
    if (err != ErrorCode::OK)
    {
      return err;
    }
    received += n;
  }
}

ErrorCode Xmodem::transmit(Readable& data, Stream& port, size_t& written, ProgressFn progress,
                           void* user)
{
  Xmodem transmitter(port, progress, user);
  uint8_t packet[PACKET_SIZE];
  written = 0;

  while (true)
  {
    size_t n = 0;
    ErrorCode err = read_max(data, packet, sizeof(packet), n);
    if (err != ErrorCode::OK)
    {
      return err;
    }

    if (n == 0)
    {
      size_t sent = 0;
      return transmitter.write_packet(nullptr, 0, sent);
    }

    // Zero-pad the last chunk
    std::memset(packet + n, 0, sizeof(packet) - n);

    err = ErrorCode::INTERRUPTED;
    for (int attempt = 0; attempt < MAX_PACKET_ATTEMPTS && err == ErrorCode::INTERRUPTED;
         ++attempt)
    {
      size_t sent = 0;
      err = transmitter.write_packet(packet, sizeof(packet), sent);
    }

    if (err == ErrorCode::INTERRUPTED)
    {
      spdlog::debug("xmodem: packet {} rejected {} times, giving up",
                    transmitter.packet_sequence(), MAX_PACKET_ATTEMPTS);
      return ErrorCode::BROKEN_PIPE;
    }
    if (err != ErrorCode::OK)
    {
      return err;
    }
    written += n;
  }
}

/* ========================================================================= */
/* Packet level                                                              */
/* ========================================================================= */

ErrorCode Xmodem::read_packet(uint8_t* buf, size_t len, size_t& count)
{
  count = 0;

  // Tell the sender we are ready, once per transfer
  if (state_ != State::IN_TRANSFER)
  {
    const ErrorCode err = port_.write_byte(NAK);
    if (err != ErrorCode::OK)
    {
      return err;
    }
    state_ = State::IN_TRANSFER;
    notify(ProgressKind::STARTED);
  }

  if (len < PACKET_SIZE)
  {
    return ErrorCode::UNEXPECTED_EOF;
  }

  uint8_t byte = 0;
  ErrorCode err = read_byte(byte, true);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  if (byte == EOT)
  {
    err = port_.write_byte(NAK);
    if (err != ErrorCode::OK)
    {
      return err;
    }
    err = expect_byte(EOT);
    if (err != ErrorCode::OK)
    {
      return err;
    }
    err = port_.write_byte(ACK);
    if (err != ErrorCode::OK)
    {
      return err;
    }
    state_ = State::FINISHED;
    return ErrorCode::OK;
  }

  if (byte != SOH)
  {
    spdlog::debug("xmodem: expected SOH or EOT, got {:#04x}", byte);
    return ErrorCode::INVALID_DATA;
  }

  err = expect_byte_or_cancel(packet_);
  if (err != ErrorCode::OK)
  {
    return err;
  }
  err = expect_byte_or_cancel(complement(packet_));
  if (err != ErrorCode::OK)
  {
    return err;
  }

  for (size_t i = 0; i < PACKET_SIZE; ++i)
  {
    err = read_byte(buf[i], false);
    if (err != ErrorCode::OK)
    {
      return err;
    }
  }

  uint8_t checksum = 0;
  err = read_byte(checksum, false);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  const uint8_t expected = internal::calc_checksum(buf, PACKET_SIZE);
  if (checksum != expected)
  {
    spdlog::trace("xmodem: packet {} checksum {:#04x}, expected {:#04x}", packet_, checksum,
                  expected);
    err = port_.write_byte(NAK);
    if (err != ErrorCode::OK)
    {
      return err;
    }
    return ErrorCode::INTERRUPTED;
  }

  err = port_.write_byte(ACK);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  notify(ProgressKind::PACKET, packet_);
  ++packet_;  // wraps 255 -> 0
  count = PACKET_SIZE;
  return ErrorCode::OK;
}

ErrorCode Xmodem::write_packet(const uint8_t* buf, size_t len, size_t& count)
{
  count = 0;

  if (len != PACKET_SIZE && len != 0)
  {
    return ErrorCode::UNEXPECTED_EOF;
  }

  // Wait for the receiver's opening NAK, once per transfer
  ErrorCode err = ErrorCode::OK;
  if (state_ != State::IN_TRANSFER)
  {
    notify(ProgressKind::WAITING);
    err = expect_byte(NAK);
    if (err != ErrorCode::OK)
    {
      return err;
    }
    state_ = State::IN_TRANSFER;
    notify(ProgressKind::STARTED);
  }

  if (len == 0)
  {
    err = port_.write_byte(EOT);
    if (err != ErrorCode::OK)
    {
      return err;
    }
    err = expect_byte(NAK);
    if (err != ErrorCode::OK)
    {
      return err;
    }
    err = port_.write_byte(EOT);
    if (err != ErrorCode::OK)
    {
      return err;
    }
    err = expect_byte(ACK);
    if (err != ErrorCode::OK)
    {
      return err;
    }
    state_ = State::FINISHED;
    return ErrorCode::OK;
  }

  const uint8_t header[3] = {SOH, packet_, complement(packet_)};
  const uint8_t checksum = internal::calc_checksum(buf, PACKET_SIZE);
  size_t n = 0;

  err = port_.write(header, sizeof(header), n);
  if (err != ErrorCode::OK)
  {
    return err;
  }
  err = port_.write(buf, PACKET_SIZE, n);
  if (err != ErrorCode::OK)
  {
    return err;
  }
  err = port_.write_byte(checksum);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  uint8_t response = 0;
  err = read_byte(response, true);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  if (response == ACK)
  {
    notify(ProgressKind::PACKET, packet_);
    ++packet_;  // wraps 255 -> 0
    count = PACKET_SIZE;
    return ErrorCode::OK;
  }

  if (response == NAK)
  {
    spdlog::trace("xmodem: packet {} NAKed", packet_);
    return ErrorCode::INTERRUPTED;
  }

  spdlog::debug("xmodem: expected ACK or NAK, got {:#04x}", response);
  return ErrorCode::INVALID_DATA;
}

/* ========================================================================= */
/* Byte level                                                                */
/* ========================================================================= */

ErrorCode Xmodem::read_byte(uint8_t& byte, bool abort_on_can)
{
  const ErrorCode err = port_.read_byte(byte);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  if (abort_on_can && byte == CAN)
  {
    return ErrorCode::CONNECTION_ABORTED;
  }

  return ErrorCode::OK;
}

ErrorCode Xmodem::expect_byte(uint8_t expected)
{
  uint8_t byte = 0;
  const ErrorCode err = read_byte(byte, false);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  if (byte == expected)
  {
    return ErrorCode::OK;
  }

  return byte == CAN ? ErrorCode::CONNECTION_ABORTED : ErrorCode::INVALID_DATA;
}

ErrorCode Xmodem::expect_byte_or_cancel(uint8_t expected)
{
  uint8_t byte = 0;
  ErrorCode err = read_byte(byte, false);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  if (byte == expected)
  {
    return ErrorCode::OK;
  }

  err = port_.write_byte(CAN);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  spdlog::debug("xmodem: expected {:#04x}, got {:#04x}, cancelled", expected, byte);
  return byte == CAN ? ErrorCode::CONNECTION_ABORTED : ErrorCode::INVALID_DATA;
}

void Xmodem::notify(ProgressKind kind, uint8_t packet)
{
  progress_(user_context_, Progress{kind, packet});
}

}  // namespace xmboot
