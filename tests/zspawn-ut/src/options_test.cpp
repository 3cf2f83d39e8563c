// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "testing.h"
#include "zspawn/command/options.h"

using namespace std::chrono_literals;

namespace {

auto parse(std::vector<std::string> args) -> zspawn::command::options
{
    args.insert(args.begin(), "zspawn");

    std::vector<char *> argv;
    argv.reserve(args.size() + 1);
    for (auto &arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    return zspawn::command::parse(static_cast<int>(args.size()), argv.data());
}

template<typename T>
auto get(const zspawn::command::options &options) -> T
{
    EXPECT_EQ(options.global.return_code, 0);
    if (!std::holds_alternative<T>(options.subcommand_opt)) {
        ADD_FAILURE() << "unexpected subcommand " << options.subcommand_opt.index();
        return {};
    }

    return std::get<T>(options.subcommand_opt);
}

} // namespace

TEST(Options, NoArgumentsLists)
{
    const auto list = get<zspawn::command::list_options>(parse({}));
    EXPECT_EQ(list.output_format, zspawn::command::list_options::output_format_t::table);
}

TEST(Options, ListFormat)
{
    const auto list = get<zspawn::command::list_options>(parse({ "list", "-f", "json" }));
    EXPECT_EQ(list.output_format, zspawn::command::list_options::output_format_t::json);

    EXPECT_NE(parse({ "list", "-f", "yaml" }).global.return_code, 0);
}

TEST(Options, BareNameOpensShell)
{
    auto options = parse({ "--config", "/tmp/zspawn.json", "web" });
    EXPECT_EQ(get<zspawn::command::shell_options>(options).ID, "web");
    ASSERT_TRUE(options.global.config.has_value());
    EXPECT_EQ(options.global.config->string(), "/tmp/zspawn.json");
}

TEST(Options, Lifecycle)
{
    EXPECT_EQ(get<zspawn::command::create_options>(parse({ "create", "7" })).ID, "7");
    EXPECT_EQ(get<zspawn::command::destroy_options>(parse({ "destroy", "web" })).ID, "web");

    const auto rename = get<zspawn::command::rename_options>(parse({ "rename", "web", "9" }));
    EXPECT_EQ(rename.from, "web");
    EXPECT_EQ(rename.to, "9");

    const auto clone = get<zspawn::command::clone_options>(parse({ "clone", "5", "6" }));
    EXPECT_EQ(clone.from, "5");
    EXPECT_EQ(clone.to, "6");

    EXPECT_NE(parse({ "create" }).global.return_code, 0);
}

TEST(Options, StateChanges)
{
    const auto state = get<zspawn::command::state_options>(parse({ "restart", "5", "web" }));
    EXPECT_EQ(state.action, zspawn::command::state_options::action_t::restart);
    EXPECT_EQ(state.IDs, (std::vector<std::string>{ "5", "web" }));

    EXPECT_EQ(get<zspawn::command::state_options>(parse({ "disable", "5" })).action,
              zspawn::command::state_options::action_t::disable);
    EXPECT_NE(parse({ "start" }).global.return_code, 0);
}

TEST(Options, Inspect)
{
    const auto inspect =
            get<zspawn::command::inspect_options>(parse({ "status", "web", "-n", "20" }));
    EXPECT_EQ(inspect.verb, "status");
    EXPECT_EQ(inspect.args, (std::vector<std::string>{ "web", "-n", "20" }));
}

TEST(Options, Manage)
{
    const auto manage = get<zspawn::command::manage_options>(parse({ "m", "5", "alias", "web" }));
    EXPECT_EQ(manage.ID, "5");
    EXPECT_EQ(manage.field, zspawn::command::manage_options::field_t::alias);
    EXPECT_EQ(manage.value, "web");

    EXPECT_EQ(get<zspawn::command::manage_options>(
                      parse({ "manage", "5", "authorized_keys", "/root/admin.pub" }))
                      .field,
              zspawn::command::manage_options::field_t::authorized_keys);

    EXPECT_NE(parse({ "manage", "5", "owner", "root" }).global.return_code, 0);
}

TEST(Options, Exec)
{
    const auto exec = get<zspawn::command::exec_options>(
            parse({ "exec", "--timeout", "600", "all", "--", "uname", "-a" }));
    EXPECT_EQ(exec.target, "all");
    EXPECT_EQ(exec.command, (std::vector<std::string>{ "uname", "-a" }));
    EXPECT_EQ(exec.timeout, std::optional<std::chrono::seconds>{ 600s });

    const auto plain = get<zspawn::command::exec_options>(parse({ "exec", "5", "uptime" }));
    EXPECT_EQ(plain.command, (std::vector<std::string>{ "uptime" }));
    EXPECT_FALSE(plain.timeout.has_value());

    EXPECT_NE(parse({ "exec", "5" }).global.return_code, 0);
}

TEST(Options, CommandAfterSeparator)
{
    const auto exec = get<zspawn::command::exec_options>(parse({ "exec", "5", "--", "ls", "-l" }));
    EXPECT_EQ(exec.target, "5");
    EXPECT_EQ(exec.command, (std::vector<std::string>{ "ls", "-l" }));

    const auto inspect = get<zspawn::command::inspect_options>(parse({ "show", "--", "-a" }));
    EXPECT_EQ(inspect.args, (std::vector<std::string>{ "-a" }));
}

TEST(Options, UnknownInput)
{
    EXPECT_NE(parse({ "5", "6" }).global.return_code, 0);
    EXPECT_NE(parse({ "--bogus" }).global.return_code, 0);
    EXPECT_NE(parse({ "start", "5", "--", "6" }).global.return_code, 0);
}
