// SPDX-FileCopyrightText: 2022-2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include <sys/types.h>

namespace zspawn::utils {

struct file_owner_t
{
    uid_t uid{ 0 };
    gid_t gid{ 0 };
};

// The mode is applied with fchmod right after creation, the umask does not apply.
void atomic_write(const std::filesystem::path &path,
                  const std::string &content,
                  mode_t mode = 0644,
                  const std::optional<file_owner_t> &owner = std::nullopt);

} // namespace zspawn::utils
