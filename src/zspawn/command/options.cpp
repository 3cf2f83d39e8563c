// SPDX-FileCopyrightText: 2022-2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "zspawn/command/options.h"

#include "CLI/CLI.hpp"

#include <string_view>
#include <unordered_map>

namespace {

// Everything after the fixed positionals of a prefix command, followed by
// the words after "--".
auto rest_of(const CLI::App *app, const std::vector<std::string> &trailing)
        -> std::vector<std::string>
{
    auto rest = app->remaining();
    rest.insert(rest.end(), trailing.cbegin(), trailing.cend());
    return rest;
}

} // namespace

zspawn::command::options zspawn::command::parse(int argc, char *argv[]) // NOLINT
{
    CLI::App app{ "Manage systemd-nspawn containers living on ZFS.", "zspawn" };
    argv = app.ensure_utf8(argv);

    // CLI11 hands "--" back to the parent once a subcommand has no
    // positional left, so the command words are split off beforehand.
    std::vector<std::string> trailing;
    for (int i = 1; i < argc; ++i) {
        if (std::string_view{ argv[i] } == "--") {
            trailing.assign(argv + i + 1, argv + argc);
            argc = i;
            break;
        }
    }

    zspawn::command::options options;

    std::string config_file;
    app.add_option("--config", config_file, "Configuration file")
            ->type_name("FILE");

    shell_options shell;
    app.add_option("CONTAINER", shell.ID, "Open a shell in this container");

    app.require_subcommand(0, 1);

    list_options list;
    auto *cmd_list = app.add_subcommand("list", "List containers (the default)");
    cmd_list->add_option("-f,--format", list.output_format, "Specify the output format")
            ->type_name("FORMAT")
            ->transform(CLI::CheckedTransformer(
                    std::unordered_map<std::string_view, list_options::output_format_t>{
                            { "json", list_options::output_format_t::json },
                            { "table", list_options::output_format_t::table },
                    }))
            ->default_val(list_options::output_format_t::table);

    create_options create;
    auto *cmd_create = app.add_subcommand("create", "Create, bootstrap and start a container");
    cmd_create->add_option("ID", create.ID, "Identifier between 1 and 253")->required();

    destroy_options destroy;
    auto *cmd_destroy = app.add_subcommand("destroy", "Destroy a stopped, disabled container");
    cmd_destroy->add_option("CONTAINER", destroy.ID, "Identifier or alias")->required();

    rename_options rename;
    auto *cmd_rename = app.add_subcommand("rename", "Give a stopped container a new identifier");
    cmd_rename->add_option("CONTAINER", rename.from, "Identifier or alias")->required();
    cmd_rename->add_option("ID", rename.to, "New identifier")->required();

    clone_options clone;
    auto *cmd_clone = app.add_subcommand("clone", "Copy a stopped container");
    cmd_clone->add_option("CONTAINER", clone.from, "Identifier or alias")->required();
    cmd_clone->add_option("ID", clone.to, "Identifier of the copy")->required();

    state_options state;
    const std::unordered_map<std::string_view, std::pair<state_options::action_t, const char *>>
            state_commands{
                { "start", { state_options::action_t::start, "Start containers" } },
                { "stop", { state_options::action_t::stop, "Stop containers" } },
                { "restart", { state_options::action_t::restart, "Restart containers" } },
                { "enable", { state_options::action_t::enable, "Start containers at boot" } },
                { "disable", { state_options::action_t::disable, "Do not start at boot" } },
            };
    std::vector<std::pair<CLI::App *, state_options::action_t>> cmd_states;
    for (const auto *name : { "start", "stop", "restart", "enable", "disable" }) {
        const auto &[action, description] = state_commands.at(name);
        auto *cmd = app.add_subcommand(name, description);
        cmd->add_option("CONTAINER", state.IDs, "Identifiers or aliases")->required();
        cmd_states.emplace_back(cmd, action);
    }

    auto *cmd_status = app.add_subcommand("status", "Show machinectl status");
    cmd_status->prefix_command();
    auto *cmd_show = app.add_subcommand("show", "Show machinectl properties");
    cmd_show->prefix_command();

    manage_options manage;
    auto *cmd_manage = app.add_subcommand("manage", "Change the alias, hostname or ssh keys");
    cmd_manage->alias("m");
    cmd_manage->add_option("CONTAINER", manage.ID, "Identifier or alias")->required();
    cmd_manage->add_option("FIELD", manage.field, "What to change")
            ->required()
            ->transform(CLI::CheckedTransformer(
                    std::unordered_map<std::string_view, manage_options::field_t>{
                            { "alias", manage_options::field_t::alias },
                            { "hostname", manage_options::field_t::hostname },
                            { "authorized_keys", manage_options::field_t::authorized_keys },
                    }));
    cmd_manage->add_option("VALUE", manage.value, "New value, a key file for authorized_keys")
            ->required();

    exec_options exec;
    int timeout{ 0 };
    auto *cmd_exec = app.add_subcommand("exec", "Run a command in one or all running containers");
    cmd_exec->add_option("--timeout", timeout, "Kill the command after this many seconds")
            ->type_name("SECONDS")
            ->check(CLI::PositiveNumber);
    cmd_exec->add_option("CONTAINER", exec.target, "Identifier, alias or \"all\"")->required();
    cmd_exec->prefix_command();

    try {
        app.parse(argc, argv);

        if (!trailing.empty() && !cmd_exec->parsed() && !cmd_status->parsed()
            && !cmd_show->parsed()) {
            throw CLI::ExtrasError(trailing);
        }
    } catch (const CLI::ParseError &e) {
        options.global.return_code = app.exit(e);
        return options;
    }

    if (!config_file.empty()) {
        options.global.config = config_file;
    }

    if (cmd_list->parsed()) {
        options.subcommand_opt = list;
    } else if (cmd_create->parsed()) {
        options.subcommand_opt = create;
    } else if (cmd_destroy->parsed()) {
        options.subcommand_opt = destroy;
    } else if (cmd_rename->parsed()) {
        options.subcommand_opt = rename;
    } else if (cmd_clone->parsed()) {
        options.subcommand_opt = clone;
    } else if (cmd_status->parsed() || cmd_show->parsed()) {
        auto *cmd = cmd_status->parsed() ? cmd_status : cmd_show;
        options.subcommand_opt = inspect_options{ cmd->get_name(), rest_of(cmd, trailing) };
    } else if (cmd_manage->parsed()) {
        options.subcommand_opt = manage;
    } else if (cmd_exec->parsed()) {
        exec.command = rest_of(cmd_exec, trailing);
        if (exec.command.empty()) {
            options.global.return_code = app.exit(CLI::RequiredError("COMMAND"));
            return options;
        }
        if (timeout > 0) {
            exec.timeout = std::chrono::seconds{ timeout };
        }
        options.subcommand_opt = exec;
    } else if (!shell.ID.empty()) {
        options.subcommand_opt = shell;
    } else {
        options.subcommand_opt = list;
    }

    for (const auto &[cmd, action] : cmd_states) {
        if (cmd->parsed()) {
            state.action = action;
            options.subcommand_opt = state;
        }
    }

    return options;
}
