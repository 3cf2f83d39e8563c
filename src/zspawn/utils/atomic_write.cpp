// SPDX-FileCopyrightText: 2022-2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "zspawn/utils/atomic_write.h"

#include "zspawn/utils/file_describer.h"
#include "zspawn/utils/log.h"

#include <stdexcept>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

void zspawn::utils::atomic_write(const std::filesystem::path &path,
                                 const std::string &content,
                                 mode_t mode,
                                 const std::optional<file_owner_t> &owner)
{
    ZSPAWN_DEBUG() << "write " << path << " mode=0" << std::oct << mode;

    std::filesystem::path temp_path = path;
    temp_path += ".tmp";

    auto fd = ::open(temp_path.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, 0600);
    if (fd == -1) {
        throw std::system_error(errno,
                                std::system_category(),
                                "open: failed to create " + temp_path.string());
    }

    try {
        file_descriptor temp_file{ fd };
        if (owner && ::fchown(temp_file.get(), owner->uid, owner->gid) == -1) {
            throw std::system_error(errno, std::system_category(), "fchown " + temp_path.string());
        }

        if (::fchmod(temp_file.get(), mode) == -1) {
            throw std::system_error(errno, std::system_category(), "fchmod " + temp_path.string());
        }

        if (temp_file.write_all(content) != file_descriptor::IOStatus::Success) {
            throw std::runtime_error("failed to write temporary file " + temp_path.string());
        }

        temp_file.release();
        std::filesystem::rename(temp_path, path);
    } catch (...) {
        std::error_code ec;
        std::filesystem::remove(temp_path, ec);
        if (ec) {
            ZSPAWN_WARNING() << "failed to remove " << temp_path << ": " << ec.message();
        }
        throw;
    }
}
