// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "zspawn/process_runner.h"

#include "zspawn/errors.h"
#include "zspawn/utils/log.h"

auto zspawn::process_runner::run(const std::vector<std::string> &args,
                                 const run_options_t &options) -> process_result_t
{
    if (args.empty()) {
        throw std::invalid_argument("empty command");
    }

    ZSPAWN_DEBUG() << "run " << join_args(args);

    auto result = this->execute(args, options);

    ZSPAWN_DEBUG() << "`" << args.front() << "` exited with " << result.exit_code;

    if (result.success() || options.may_fail) {
        return result;
    }

    throw command_error(args,
                        result.exit_code,
                        std::move(result.out),
                        std::move(result.err),
                        result.timed_out);
}

auto zspawn::shell_quote(const std::string &word) -> std::string
{
    std::string result{ "'" };
    for (const auto c : word) {
        if (c == '\'') {
            result += "'\\''";
        } else {
            result.push_back(c);
        }
    }
    result.push_back('\'');

    return result;
}

auto zspawn::shell_command(const std::string &script) -> std::vector<std::string>
{
    return { "/bin/bash", "-o", "pipefail", "-c", script };
}
