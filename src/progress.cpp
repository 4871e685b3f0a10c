/**
 * @file progress.cpp
 * @brief Stock progress callbacks
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "xmboot/progress.hpp"

#include <spdlog/spdlog.h>

namespace xmboot
{

void noop_progress(void* user, const Progress& progress)
{
  (void)user;
  (void)progress;
}

void log_progress(void* user, const Progress& progress)
{
  (void)user;

  switch (progress.kind)
  {
    case ProgressKind::WAITING:
      spdlog::debug("xmodem: waiting for receiver");
      break;

    case ProgressKind::STARTED:
      spdlog::debug("xmodem: transfer started");
      break;

    case ProgressKind::PACKET:
      spdlog::debug("xmodem: packet {} done", progress.packet);
      break;
  }
}

const char* to_string(ProgressKind kind)
{
  switch (kind)
  {
    case ProgressKind::WAITING:
      return "waiting";
    case ProgressKind::STARTED:
      return "started";
    case ProgressKind::PACKET:
      return "packet";
    default:
      return "unknown";
  }
}

}  // namespace xmboot
