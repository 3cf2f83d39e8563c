// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include "zspawn/host_filesystem.h"

namespace zspawn::impl {

class local_filesystem final : public virtual zspawn::host_filesystem
{
public:
    [[nodiscard]] auto exists(const std::filesystem::path &path) const -> bool final;
    [[nodiscard]] auto read(const std::filesystem::path &path) const
            -> std::optional<std::string> final;
    void write(const std::filesystem::path &path,
               const std::string &content,
               mode_t mode,
               const std::optional<file_owner_t> &owner) final;
    void make_directory(const std::filesystem::path &path,
                        mode_t mode,
                        const std::optional<file_owner_t> &owner) final;
    void remove(const std::filesystem::path &path) final;
    void rename(const std::filesystem::path &from, const std::filesystem::path &to) final;
    void symlink(const std::filesystem::path &target, const std::filesystem::path &link) final;
    [[nodiscard]] auto owner_of(const std::filesystem::path &path) const -> file_owner_t final;
};

static_assert(!std::is_abstract_v<local_filesystem>);

} // namespace zspawn::impl
