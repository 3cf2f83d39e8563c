// SPDX-FileCopyrightText: 2022-2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "zspawn/utils/pipe.h"

#include <array>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

namespace zspawn::utils {

auto pipe() -> std::pair<file_descriptor, file_descriptor>
{
    std::array<int, 2> fds{};
    if (::pipe2(fds.data(), O_CLOEXEC) == -1) {
        throw std::system_error(errno, std::system_category(), "pipe2");
    }

    return std::make_pair(file_descriptor(fds[0]), file_descriptor(fds[1]));
}

} // namespace zspawn::utils
