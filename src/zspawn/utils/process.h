// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <sys/types.h>

namespace zspawn::utils {

enum class WaitStatus : uint8_t { Reaped, None, NoChild };

struct WaitResult
{
    WaitStatus status{ WaitStatus::None };
    pid_t pid{ -1 };
    int exit_code{ -1 };
};

auto waitpid(pid_t pid, int options) -> WaitResult;

// Translates a raw wait status into a shell-like exit code.
auto exit_code_of(int wait_status) noexcept -> int;

[[noreturn]] void execvp(const std::vector<std::string> &args);

} // namespace zspawn::utils
