// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "zspawn/utils/process.h"

#include "zspawn/errors.h"
#include "zspawn/utils/log.h"

#include <system_error>

#include <sys/wait.h>
#include <unistd.h>

namespace zspawn::utils {

auto waitpid(pid_t pid, int options) -> WaitResult
{
    int status{ 0 };
    while (true) {
        auto ret = ::waitpid(pid, &status, options);
        if (ret > 0) {
            return { WaitStatus::Reaped, ret, status };
        }

        if (ret == 0) { // fow WNOHANG
            return { WaitStatus::None };
        }

        if (errno == EINTR || errno == EAGAIN) {
            continue;
        }

        if (errno == ECHILD) {
            return { WaitStatus::NoChild };
        }

        throw std::system_error(errno, std::system_category(), "waitpid");
    }
}

auto exit_code_of(int wait_status) noexcept -> int
{
    if (WIFEXITED(wait_status)) {
        return WEXITSTATUS(wait_status);
    }

    if (WIFSIGNALED(wait_status)) {
        return 128 + WTERMSIG(wait_status);
    }

    return -1;
}

void execvp(const std::vector<std::string> &args)
{
    if (args.empty()) {
        throw std::invalid_argument("execvp: empty command");
    }

    std::vector<const char *> c_args;
    c_args.reserve(args.size() + 1);
    for (const auto &arg : args) {
        c_args.push_back(arg.c_str());
    }
    c_args.push_back(nullptr);

    ZSPAWN_DEBUG() << "execvp " << join_args(args);

    ::execvp(c_args[0], const_cast<char *const *>(c_args.data()));

    throw std::system_error(errno, std::generic_category(), "execvp " + join_args(args));
}

} // namespace zspawn::utils
