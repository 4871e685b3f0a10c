/**
 * @file xmboot_c_api.cpp
 * @brief xmboot C API implementation
 *
 * C wrapper for the C++ transfer engine.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "xmboot/xmboot.h"

#include "xmboot/io.hpp"
#include "xmboot/mem_writer.hpp"
#include "xmboot/xmodem.hpp"

using namespace xmboot;

static_assert(XMBOOT_PACKET_SIZE == PACKET_SIZE, "packet size mismatch");
static_assert(XMBOOT_MAX_PACKET_ATTEMPTS == MAX_PACKET_ATTEMPTS, "attempt limit mismatch");
static_assert(XMBOOT_PROGRESS_PACKET == static_cast<int>(ProgressKind::PACKET),
              "progress kind mismatch");

namespace
{

/* ========================================================================= */
/* Internal wrapper structures                                               */
/* ========================================================================= */

/**
 * @brief Stream backed by the C transport callbacks
 */
class CallbackStream : public Stream
{
 public:
  CallbackStream(xmboot_read_fn read, xmboot_write_fn write, void* user)
      : read_(read), write_(write), user_(user)
  {
  }

  ErrorCode read_byte(uint8_t& byte) override
  {
    return static_cast<ErrorCode>(read_(user_, &byte));
  }

  ErrorCode write_byte(uint8_t byte) override
  {
    return static_cast<ErrorCode>(write_(user_, byte));
  }

 private:
  xmboot_read_fn read_;
  xmboot_write_fn write_;
  void* user_;
};

/**
 * @brief Forwards C++ progress events to the C callback
 */
struct ProgressBridge
{
  xmboot_progress_fn fn;
  void* user;

  static void forward(void* self, const Progress& progress)
  {
    const ProgressBridge* bridge = static_cast<const ProgressBridge*>(self);
    if (bridge->fn)
    {
      bridge->fn(bridge->user, static_cast<xmboot_progress_t>(progress.kind), progress.packet);
    }
  }
};

xmboot_error_t to_c(ErrorCode err)
{
  return static_cast<xmboot_error_t>(err);
}

}  // namespace

/* ========================================================================= */
/* Error message strings                                                     */
/* ========================================================================= */

const char* xmboot_strerror(xmboot_error_t err)
{
  switch (err)
  {
#define ERR(name, val, msg) \
  case XMBOOT_ERR_##name:   \
    return msg;
#include "xmboot/errors.def"
#undef ERR
    default:
      return "unknown error";
  }
}

/* ========================================================================= */
/* Transfer functions                                                        */
/* ========================================================================= */

xmboot_error_t xmboot_receive_to_memory(xmboot_read_fn read, xmboot_write_fn write, void* user,
                                        uintptr_t start, uintptr_t end,
                                        xmboot_progress_fn progress, void* progress_user,
                                        size_t* received)
{
  if (read == nullptr || write == nullptr)
  {
    return XMBOOT_ERR_INVALID_ARGUMENT;
  }

  CallbackStream port(read, write, user);
  MemoryWriter image(start, end);
  ProgressBridge bridge{progress, progress_user};

  size_t count = 0;
  const ErrorCode err = Xmodem::receive(port, image, count, ProgressBridge::forward, &bridge);
  if (received)
  {
    *received = count;
  }
  return to_c(err);
}

xmboot_error_t xmboot_receive_to_buffer(xmboot_read_fn read, xmboot_write_fn write, void* user,
                                        uint8_t* buf, size_t capacity,
                                        xmboot_progress_fn progress, void* progress_user,
                                        size_t* received)
{
  if (read == nullptr || write == nullptr || (buf == nullptr && capacity > 0))
  {
    return XMBOOT_ERR_INVALID_ARGUMENT;
  }

  CallbackStream port(read, write, user);
  BufferWriter into(buf, capacity);
  ProgressBridge bridge{progress, progress_user};

  size_t count = 0;
  const ErrorCode err = Xmodem::receive(port, into, count, ProgressBridge::forward, &bridge);
  if (received)
  {
    *received = count;
  }
  return to_c(err);
}

xmboot_error_t xmboot_transmit_buffer(xmboot_read_fn read, xmboot_write_fn write, void* user,
                                      const uint8_t* data, size_t len,
                                      xmboot_progress_fn progress, void* progress_user,
                                      size_t* written)
{
  if (read == nullptr || write == nullptr || (data == nullptr && len > 0))
  {
    return XMBOOT_ERR_INVALID_ARGUMENT;
  }

  CallbackStream port(read, write, user);
  BufferReader source(data, len);
  ProgressBridge bridge{progress, progress_user};

  size_t count = 0;
  const ErrorCode err = Xmodem::transmit(source, port, count, ProgressBridge::forward, &bridge);
  if (written)
  {
    *written = count;
  }
  return to_c(err);
}
