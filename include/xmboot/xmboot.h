/**
 * @file xmboot.h
 * @brief xmboot C API
 *
 * C-compatible interface for the XMODEM transfer engine.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C"
{
#endif

  /* ========================================================================= */
  /* Protocol constants                                                        */
  /* ========================================================================= */

  /** @brief Payload size of a data packet */
#define XMBOOT_PACKET_SIZE 128

  /** @brief Consecutive attempts per packet */
#define XMBOOT_MAX_PACKET_ATTEMPTS 10

  /* ========================================================================= */
  /* Error codes                                                               */
  /* ========================================================================= */

  typedef enum
  {
#define ERR(name, val, msg) XMBOOT_ERR_##name = val,
#include "xmboot/errors.def"
#undef ERR
  } xmboot_error_t;

  /**
   * @brief Get error message string
   * @param err Error code
   * @return Error message (static string)
   */
  const char* xmboot_strerror(xmboot_error_t err);

  /* ========================================================================= */
  /* Callbacks                                                                 */
  /* ========================================================================= */

  /**
   * @brief Transport read callback
   *
   * Blocks until a byte is available or the transport gives up.
   *
   * @param user User-defined context pointer
   * @param byte Receives the byte
   * @return XMBOOT_ERR_OK or a transport error (e.g. XMBOOT_ERR_TIMED_OUT)
   */
  typedef xmboot_error_t (*xmboot_read_fn)(void* user, uint8_t* byte);

  /**
   * @brief Transport write callback
   *
   * @param user User-defined context pointer
   * @param byte Byte to send
   * @return XMBOOT_ERR_OK or a transport error
   */
  typedef xmboot_error_t (*xmboot_write_fn)(void* user, uint8_t byte);

  /** @brief Progress event kinds */
  typedef enum
  {
    XMBOOT_PROGRESS_WAITING = 0,
    XMBOOT_PROGRESS_STARTED = 1,
    XMBOOT_PROGRESS_PACKET = 2,
  } xmboot_progress_t;

  /**
   * @brief Progress callback
   *
   * @param user   User-defined context pointer
   * @param kind   Event kind
   * @param packet Packet sequence number (XMBOOT_PROGRESS_PACKET only)
   */
  typedef void (*xmboot_progress_fn)(void* user, xmboot_progress_t kind, uint8_t packet);

  /* ========================================================================= */
  /* Transfer functions                                                        */
  /* ========================================================================= */

  /**
   * @brief Receive an image straight into memory
   *
   * @param read          Transport read callback
   * @param write         Transport write callback
   * @param user          User context pointer (passed to read/write)
   * @param start         First address to write
   * @param end           One past the last writable address
   * @param progress      Progress callback (NULL for none)
   * @param progress_user User context pointer passed to progress
   * @param received      Receives the number of bytes written (may be NULL)
   * @return XMBOOT_ERR_OK when the whole image arrived
   */
  xmboot_error_t xmboot_receive_to_memory(xmboot_read_fn read, xmboot_write_fn write,
                                          void* user, uintptr_t start, uintptr_t end,
                                          xmboot_progress_fn progress, void* progress_user,
                                          size_t* received);

  /**
   * @brief Receive into a caller-owned buffer
   *
   * Fails with XMBOOT_ERR_UNEXPECTED_EOF if the data does not fit.
   */
  xmboot_error_t xmboot_receive_to_buffer(xmboot_read_fn read, xmboot_write_fn write,
                                          void* user, uint8_t* buf, size_t capacity,
                                          xmboot_progress_fn progress, void* progress_user,
                                          size_t* received);

  /**
   * @brief Send a buffer
   *
   * @param written Receives the number of data bytes sent, padding excluded
   *                (may be NULL)
   */
  xmboot_error_t xmboot_transmit_buffer(xmboot_read_fn read, xmboot_write_fn write,
                                        void* user, const uint8_t* data, size_t len,
                                        xmboot_progress_fn progress, void* progress_user,
                                        size_t* written);

#ifdef __cplusplus
} /* extern "C" */
#endif
