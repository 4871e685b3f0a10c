/**
 * @file errors.cpp
 * @brief Error code messages
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "xmboot/protocol.hpp"

namespace xmboot
{

const char* to_string(ErrorCode code)
{
  switch (code)
  {
#define ERR(name, val, msg) \
  case ErrorCode::name:     \
    return msg;
#include "xmboot/errors.def"
#undef ERR
    default:
      return "unknown error";
  }
}

}  // namespace xmboot
