// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include "zspawn/interface.h"
#include "zspawn/utils/atomic_write.h"

#include <filesystem>
#include <optional>
#include <string>

#include <sys/types.h>

namespace zspawn {

using utils::file_owner_t;

class host_filesystem : public virtual interface
{
public:
    [[nodiscard]] virtual auto exists(const std::filesystem::path &path) const -> bool = 0;

    // std::nullopt when the file does not exist
    [[nodiscard]] virtual auto read(const std::filesystem::path &path) const
            -> std::optional<std::string> = 0;

    virtual void write(const std::filesystem::path &path,
                       const std::string &content,
                       mode_t mode,
                       const std::optional<file_owner_t> &owner) = 0;

    // Creates a single directory if it is missing, then applies mode and owner.
    virtual void make_directory(const std::filesystem::path &path,
                                mode_t mode,
                                const std::optional<file_owner_t> &owner) = 0;

    // Missing paths are ignored.
    virtual void remove(const std::filesystem::path &path) = 0;
    virtual void rename(const std::filesystem::path &from, const std::filesystem::path &to) = 0;
    virtual void symlink(const std::filesystem::path &target, const std::filesystem::path &link) = 0;

    [[nodiscard]] virtual auto owner_of(const std::filesystem::path &path) const
            -> file_owner_t = 0;
};

} // namespace zspawn
