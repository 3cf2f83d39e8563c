// SPDX-FileCopyrightText: 2022-2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace zspawn::command {

struct global_options
{
    std::optional<std::filesystem::path> config;
    int return_code{ 0 };
};

struct list_options
{
    // FIXME: if the underlying type of enum class is std::uint8_t,
    //  the mapping message of CLI11 transformer is incorrect
    //  use std::uint16_t for now
    enum class output_format_t : std::uint16_t { table, json };

    output_format_t output_format{ output_format_t::table };
};

struct shell_options
{
    std::string ID;
};

struct create_options
{
    std::string ID;
};

struct destroy_options
{
    std::string ID;
};

struct rename_options
{
    std::string from;
    std::string to;
};

struct clone_options
{
    std::string from;
    std::string to;
};

struct state_options
{
    enum class action_t : std::uint16_t { start, stop, restart, enable, disable };

    action_t action{ action_t::start };
    std::vector<std::string> IDs;
};

struct inspect_options
{
    // machinectl verb, "status" or "show"
    std::string verb;
    std::vector<std::string> args;
};

struct manage_options
{
    enum class field_t : std::uint16_t { alias, hostname, authorized_keys };

    std::string ID;
    field_t field{ field_t::alias };
    std::string value;
};

struct exec_options
{
    std::string target;
    std::vector<std::string> command;
    std::optional<std::chrono::seconds> timeout;
};

struct options
{
    using subcommand_opt_t = std::variant<std::monostate,
                                          list_options,
                                          shell_options,
                                          create_options,
                                          destroy_options,
                                          rename_options,
                                          clone_options,
                                          state_options,
                                          inspect_options,
                                          manage_options,
                                          exec_options>;

    global_options global;
    subcommand_opt_t subcommand_opt;
};

// This function parses the command line arguments.
// It might print help or usage to stdout or stderr.
options parse(int argc, char *argv[]); // NOLINT

} // namespace zspawn::command
