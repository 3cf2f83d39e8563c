// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "zspawn/errors.h"

#include <sstream>
#include <utility>

namespace {

auto describe(const std::vector<std::string> &args,
              int exit_code,
              const std::string &out,
              const std::string &err,
              bool timed_out) -> std::string
{
    std::stringstream ss;
    ss << "command `" << zspawn::join_args(args) << "` ";
    if (timed_out) {
        ss << "timed out";
    } else {
        ss << "exited with " << exit_code;
    }

    if (!out.empty()) {
        ss << "\nstdout:\n" << out;
    }

    if (!err.empty()) {
        ss << "\nstderr:\n" << err;
    }

    return std::move(ss).str();
}

} // namespace

zspawn::consistency_error::consistency_error(const std::string &message)
    : std::logic_error(message)
{
}

zspawn::consistency_error::~consistency_error() noexcept = default;

zspawn::precondition_error::precondition_error(const std::string &message)
    : std::invalid_argument(message)
{
}

zspawn::precondition_error::~precondition_error() noexcept = default;

zspawn::command_error::command_error(
        std::vector<std::string> args, int exit_code, std::string out, std::string err, bool timed_out)
    : std::runtime_error(describe(args, exit_code, out, err, timed_out))
    , args_(std::move(args))
    , exit_code_(exit_code)
    , out_(std::move(out))
    , err_(std::move(err))
{
}

zspawn::command_error::~command_error() noexcept = default;

auto zspawn::join_args(const std::vector<std::string> &args) -> std::string
{
    std::string result;
    for (const auto &arg : args) {
        if (!result.empty()) {
            result.push_back(' ');
        }
        result += arg;
    }

    return result;
}
