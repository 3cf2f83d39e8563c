// SPDX-FileCopyrightText: 2022-2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "zspawn/utils/file_describer.h"

#include "zspawn/utils/log.h"

#include <array>
#include <cstring>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <unistd.h>

zspawn::utils::file_descriptor::file_descriptor(int fd, bool auto_close)
    : auto_close_(auto_close)
    , fd_(fd)
{
    if (fd < 0) {
        throw std::invalid_argument("invalid file descriptor");
    }

    auto flag = ::fcntl(fd_, F_GETFL);
    if (flag == -1) {
        throw std::system_error(errno, std::system_category(), "fcntl");
    }

    if ((flag & O_NONBLOCK) != 0) {
        nonblock_ = true;
    }
}

zspawn::utils::file_descriptor::~file_descriptor()
{
    if (fd_ < 0 || !auto_close_) {
        return;
    }

    if (close(fd_) != 0) {
        ZSPAWN_ERR() << "close " << fd_ << " failed:" << ::strerror(errno);
    }
}

zspawn::utils::file_descriptor::file_descriptor(file_descriptor &&other) noexcept
    : nonblock_(other.nonblock_)
    , auto_close_(other.auto_close_)
    , fd_(other.fd_)
{
    other.fd_ = -1;
}

auto zspawn::utils::file_descriptor::operator=(file_descriptor &&other) noexcept
        -> zspawn::utils::file_descriptor &
{
    if (this == &other) {
        return *this;
    }

    std::swap(this->fd_, other.fd_);
    std::swap(this->auto_close_, other.auto_close_);
    std::swap(this->nonblock_, other.nonblock_);
    return *this;
}

auto zspawn::utils::file_descriptor::release() -> void
{
    int tmp = -1;
    std::swap(tmp, fd_);

    if (tmp >= 0 && ::close(tmp) < 0) {
        throw std::system_error(errno,
                                std::system_category(),
                                "failed to close file descriptor " + std::to_string(tmp));
    }
}

auto zspawn::utils::file_descriptor::get() const noexcept -> int
{
    return fd_;
}

auto zspawn::utils::file_descriptor::set_nonblock(bool nonblock) -> void
{
    auto flags = ::fcntl(fd_, F_GETFL, 0);
    if (flags == -1) {
        throw std::system_error(errno, std::system_category(), "fcntl");
    }

    flags = nonblock ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    if (::fcntl(fd_, F_SETFL, flags) == -1) {
        throw std::system_error(errno, std::system_category(), "fcntl");
    }

    nonblock_ = nonblock;
}

auto zspawn::utils::file_descriptor::read_available(std::string &out) const -> IOStatus
{
    std::array<char, 4096> buf{};
    bool got_data{ false };

    while (true) {
        const auto ret = ::read(fd_, buf.data(), buf.size());

        if (ret > 0) {
            out.append(buf.data(), static_cast<size_t>(ret));
            got_data = true;
            if (!nonblock_) {
                return IOStatus::Success;
            }
            continue;
        }

        if (ret == 0) {
            return got_data ? IOStatus::Success : IOStatus::Eof;
        }

        if (errno == EINTR) {
            continue;
        }

        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return got_data ? IOStatus::Success : IOStatus::TryAgain;
        }

        if (errno == EIO || errno == ECONNRESET) {
            return got_data ? IOStatus::Success : IOStatus::Closed;
        }

        throw std::system_error(errno, std::system_category(), "failed to read from fd");
    }
}

auto zspawn::utils::file_descriptor::write_all(const std::string &data) const -> IOStatus
{
    std::size_t bytes_written{ 0 };
    while (bytes_written < data.size()) {
        const auto ret = ::write(fd_, data.data() + bytes_written, data.size() - bytes_written);

        if (ret > 0) {
            bytes_written += static_cast<size_t>(ret);
            continue;
        }

        if (ret == 0 || errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
            continue;
        }

        if (errno == EPIPE || errno == ECONNRESET || errno == EIO) {
            return IOStatus::Closed;
        }

        throw std::system_error(errno, std::system_category(), "failed to write to fd");
    }

    return IOStatus::Success;
}
