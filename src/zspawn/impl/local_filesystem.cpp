// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "zspawn/impl/local_filesystem.h"

#include "zspawn/utils/log.h"

#include <fstream>
#include <sstream>
#include <system_error>

#include <sys/stat.h>
#include <unistd.h>

auto zspawn::impl::local_filesystem::exists(const std::filesystem::path &path) const -> bool
{
    // a dangling enable link still counts
    std::error_code ec;
    auto status = std::filesystem::symlink_status(path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        throw std::filesystem::filesystem_error("failed to stat", path, ec);
    }

    return std::filesystem::exists(status);
}

auto zspawn::impl::local_filesystem::read(const std::filesystem::path &path) const
        -> std::optional<std::string>
{
    if (!std::filesystem::exists(path)) {
        return std::nullopt;
    }

    std::ifstream istrm(path);
    if (istrm.fail()) {
        throw std::runtime_error("failed to open " + path.string());
    }

    std::stringstream ss;
    ss << istrm.rdbuf();
    return std::move(ss).str();
}

void zspawn::impl::local_filesystem::write(const std::filesystem::path &path,
                                           const std::string &content,
                                           mode_t mode,
                                           const std::optional<file_owner_t> &owner)
{
    utils::atomic_write(path, content, mode, owner);
}

void zspawn::impl::local_filesystem::make_directory(const std::filesystem::path &path,
                                                    mode_t mode,
                                                    const std::optional<file_owner_t> &owner)
{
    ZSPAWN_DEBUG() << "mkdir " << path << " mode=0" << std::oct << mode;

    if (::mkdir(path.c_str(), mode) != 0 && errno != EEXIST) {
        throw std::system_error(errno,
                                std::generic_category(),
                                "mkdir: failed to create " + path.string());
    }

    if (owner && ::lchown(path.c_str(), owner->uid, owner->gid) != 0) {
        throw std::system_error(errno, std::generic_category(), "lchown " + path.string());
    }

    if (::chmod(path.c_str(), mode) != 0) {
        throw std::system_error(errno, std::generic_category(), "chmod " + path.string());
    }
}

void zspawn::impl::local_filesystem::remove(const std::filesystem::path &path)
{
    ZSPAWN_DEBUG() << "remove " << path;
    std::filesystem::remove(path);
}

void zspawn::impl::local_filesystem::rename(const std::filesystem::path &from,
                                            const std::filesystem::path &to)
{
    ZSPAWN_DEBUG() << "rename " << from << " to " << to;
    std::filesystem::rename(from, to);
}

void zspawn::impl::local_filesystem::symlink(const std::filesystem::path &target,
                                             const std::filesystem::path &link)
{
    ZSPAWN_DEBUG() << "symlink " << link << " -> " << target;
    std::filesystem::create_symlink(target, link);
}

auto zspawn::impl::local_filesystem::owner_of(const std::filesystem::path &path) const
        -> file_owner_t
{
    struct stat statbuf{};
    if (::stat(path.c_str(), &statbuf) == -1) {
        throw std::system_error(errno, std::system_category(), "stat " + path.string());
    }

    return { statbuf.st_uid, statbuf.st_gid };
}
