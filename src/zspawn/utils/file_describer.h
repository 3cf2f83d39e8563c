// SPDX-FileCopyrightText: 2022-2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include <cstdint>
#include <string>

namespace zspawn::utils {

class file_descriptor
{
public:
    enum class IOStatus : uint8_t { Success, TryAgain, Eof, Closed };

    file_descriptor() = default;
    explicit file_descriptor(int fd, bool auto_close = true);

    virtual ~file_descriptor();

    file_descriptor(const file_descriptor &) = delete;
    auto operator=(const file_descriptor &) -> file_descriptor & = delete;

    file_descriptor(file_descriptor &&other) noexcept;
    auto operator=(file_descriptor &&other) noexcept -> file_descriptor &;

    [[nodiscard]] auto get() const noexcept -> int;

    // Closes the descriptor now.
    auto release() -> void;

    auto set_nonblock(bool nonblock) -> void;

    // Appends whatever is currently readable to out.
    auto read_available(std::string &out) const -> IOStatus;

    auto write_all(const std::string &data) const -> IOStatus;

private:
    // keep this layout, for padding optimization
    bool nonblock_{ false };
    bool auto_close_{ false };
    int fd_{ -1 };
};

} // namespace zspawn::utils
