// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "zspawn/impl/machinectl_supervisor.h"

#include "zspawn/readers.h"
#include "zspawn/utils/log.h"

zspawn::impl::machinectl_supervisor::machinectl_supervisor(process_runner &runner)
    : runner_(runner)
{
}

auto zspawn::impl::machinectl_supervisor::running() const -> std::vector<std::string>
{
    auto result = runner_.run({ "machinectl", "list", "--no-pager" });
    return parse_running_list(result.out);
}

void zspawn::impl::machinectl_supervisor::start(const std::string &id)
{
    runner_.run({ "machinectl", "start", id });
}

void zspawn::impl::machinectl_supervisor::stop(const std::string &id)
{
    run_options_t options;
    options.may_fail = true;

    auto result = runner_.run({ "machinectl", "stop", id }, options);
    if (!result.success()) {
        ZSPAWN_INFO() << "machinectl stop " << id << " exited with " << result.exit_code << ": "
                      << trim(result.err);
    }
}

void zspawn::impl::machinectl_supervisor::enable(const std::string &id)
{
    runner_.run({ "machinectl", "enable", id });
}

void zspawn::impl::machinectl_supervisor::disable(const std::string &id)
{
    runner_.run({ "machinectl", "disable", id });
}

auto zspawn::impl::machinectl_supervisor::run(const std::string &id,
                                              const std::vector<std::string> &command,
                                              std::optional<std::chrono::seconds> timeout)
        -> process_result_t
{
    std::vector<std::string> args{
        "systemd-run", "--machine=" + id, "--wait", "--pipe", "--quiet", "--",
    };
    args.insert(args.end(), command.cbegin(), command.cend());

    run_options_t options;
    options.may_fail = true;
    options.merge_output = true;
    options.timeout = timeout;

    return runner_.run(args, options);
}

auto zspawn::impl::machinectl_supervisor::shell(const std::string &id) const -> exec_image_t
{
    return { { "machinectl", "shell", id } };
}

auto zspawn::impl::machinectl_supervisor::inspect(const std::string &verb,
                                                  const std::vector<std::string> &args) const
        -> exec_image_t
{
    exec_image_t image{ { "machinectl", verb } };
    image.args.insert(image.args.end(), args.cbegin(), args.cend());
    return image;
}
