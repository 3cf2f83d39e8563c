// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include "zspawn/interface.h"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace zspawn {

// An instruction to replace the current process image, see app.cpp.
struct exec_image_t
{
    std::vector<std::string> args;
};

struct run_options_t
{
    // a non-zero exit is returned instead of thrown
    bool may_fail{ false };
    // stderr is redirected into stdout
    bool merge_output{ false };
    std::optional<std::chrono::seconds> timeout;
};

struct process_result_t
{
    int exit_code{ 0 };
    std::string out;
    std::string err;
    bool timed_out{ false };

    [[nodiscard]] auto success() const noexcept -> bool { return exit_code == 0 && !timed_out; }
};

class process_runner : public virtual interface
{
public:
    // Throws command_error when the command fails, unless options.may_fail is set.
    auto run(const std::vector<std::string> &args, const run_options_t &options = {})
            -> process_result_t;

protected:
    virtual auto execute(const std::vector<std::string> &args, const run_options_t &options)
            -> process_result_t = 0;
};

auto shell_quote(const std::string &word) -> std::string;

// Wraps a pipeline so that the failure of any stage fails the whole command.
auto shell_command(const std::string &script) -> std::vector<std::string>;

} // namespace zspawn
