/**
 * @file fd_stream.cpp
 * @brief POSIX file descriptor stream implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "xmboot/fd_stream.hpp"

#include <errno.h>
#include <poll.h>
#include <termios.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <limits>

namespace xmboot
{

FdStream::FdStream(int fd, uint32_t read_timeout_ms) : fd_(fd), read_timeout_ms_(read_timeout_ms)
{
}

namespace
{

int to_poll_timeout(std::chrono::steady_clock::duration left)
{
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(left).count();
  if (ms <= 0)
  {
    return 0;
  }
  return static_cast<int>(std::min<long long>(ms, std::numeric_limits<int>::max()));
}

}  // namespace

ErrorCode FdStream::wait_readable()
{
  if (read_timeout_ms_ == 0)
  {
    return ErrorCode::OK;
  }

  const auto deadline =
      std::chrono::steady_clock::now() + std::chrono::milliseconds(read_timeout_ms_);

  struct pollfd pfd;
  pfd.fd = fd_;
  pfd.events = POLLIN;

  while (true)
  {
    pfd.revents = 0;
    const int ret = ::poll(&pfd, 1, to_poll_timeout(deadline - std::chrono::steady_clock::now()));
    if (ret > 0)
    {
      return ErrorCode::OK;
    }
    if (ret == 0)
    {
      return ErrorCode::TIMED_OUT;
    }
    // poll() is not restarted by SA_RESTART; wait out the rest of the timeout
    if (errno != EINTR)
    {
      spdlog::error("fd {} poll: {}", fd_, std::strerror(errno));
      return ErrorCode::UNEXPECTED_EOF;
    }
  }
}

ErrorCode FdStream::read_byte(uint8_t& byte)
{
  const ErrorCode err = wait_readable();
  if (err != ErrorCode::OK)
  {
    return err;
  }

  ssize_t ret = 0;
  do
  {
    ret = ::read(fd_, &byte, 1);
  } while (ret < 0 && errno == EINTR);

  if (ret == 1)
  {
    return ErrorCode::OK;
  }
  if (ret < 0)
  {
    spdlog::error("fd {} read: {}", fd_, std::strerror(errno));
  }
  // 0 means the other end hung up
  return ErrorCode::UNEXPECTED_EOF;
}

ErrorCode FdStream::read(uint8_t* buf, size_t len, size_t& count)
{
  count = 0;
  if (len == 0)
  {
    return ErrorCode::OK;
  }

  ErrorCode err = read_byte(buf[0]);
  if (err != ErrorCode::OK)
  {
    return err;
  }
  count = 1;

  // Drain what is already buffered without blocking again
  while (count < len)
  {
    struct pollfd pfd;
    pfd.fd = fd_;
    pfd.events = POLLIN;
    pfd.revents = 0;
    if (::poll(&pfd, 1, 0) <= 0 || (pfd.revents & POLLIN) == 0)
    {
      break;
    }

    const ssize_t ret = ::read(fd_, buf + count, len - count);
    if (ret <= 0)
    {
      break;
    }
    count += static_cast<size_t>(ret);
  }

  return ErrorCode::OK;
}

ErrorCode FdStream::write_byte(uint8_t byte)
{
  size_t n = 0;
  return write(&byte, 1, n);
}

ErrorCode FdStream::write(const uint8_t* buf, size_t len, size_t& count)
{
  count = 0;
  while (count < len)
  {
    const ssize_t ret = ::write(fd_, buf + count, len - count);
    if (ret < 0)
    {
      if (errno == EINTR)
      {
        continue;
      }
      spdlog::error("fd {} write: {}", fd_, std::strerror(errno));
      return ErrorCode::BROKEN_PIPE;
    }
    count += static_cast<size_t>(ret);
  }
  return ErrorCode::OK;
}

bool FdStream::configure_tty(int fd)
{
  if (!::isatty(fd))
  {
    return false;
  }

  // Raw mode, otherwise the line discipline echoes and translates bytes
  struct termios settings;
  if (::tcflush(fd, TCIOFLUSH) != 0 || ::tcgetattr(fd, &settings) != 0)
  {
    spdlog::error("fd {} tcgetattr: {}", fd, std::strerror(errno));
    return false;
  }
  ::cfmakeraw(&settings);
  ::cfsetspeed(&settings, B115200);
  if (::tcsetattr(fd, TCSANOW, &settings) != 0)
  {
    spdlog::error("fd {} tcsetattr: {}", fd, std::strerror(errno));
    return false;
  }
  return true;
}

}  // namespace xmboot
