// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "testing.h"
#include "zspawn/errors.h"
#include "zspawn/impl/subprocess_runner.h"

using namespace std::chrono_literals;

namespace {

auto sh(const std::string &script) -> std::vector<std::string>
{
    return { "/bin/sh", "-c", script };
}

} // namespace

TEST(SubprocessRunner, CapturesOutput)
{
    zspawn::impl::subprocess_runner runner;

    auto result = runner.run(sh("echo hello; echo oops >&2"));
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.out, "hello\n");
    EXPECT_EQ(result.err, "oops\n");
    EXPECT_FALSE(result.timed_out);
}

TEST(SubprocessRunner, MergesOutput)
{
    zspawn::impl::subprocess_runner runner;
    zspawn::run_options_t options;
    options.merge_output = true;

    auto result = runner.run(sh("echo one; echo two >&2"), options);
    EXPECT_EQ(result.out, "one\ntwo\n");
    EXPECT_TRUE(result.err.empty());
}

TEST(SubprocessRunner, FailureThrowsUnlessAllowed)
{
    zspawn::impl::subprocess_runner runner;

    try {
        runner.run(sh("echo bad >&2; exit 3"));
        FAIL() << "command_error expected";
    } catch (const zspawn::command_error &e) {
        EXPECT_EQ(e.exit_code(), 3);
        EXPECT_EQ(e.err(), "bad\n");
    }

    zspawn::run_options_t options;
    options.may_fail = true;
    EXPECT_EQ(runner.run(sh("exit 3"), options).exit_code, 3);
}

TEST(SubprocessRunner, MissingProgram)
{
    zspawn::impl::subprocess_runner runner;
    zspawn::run_options_t options;
    options.may_fail = true;

    EXPECT_EQ(runner.run({ "/nonexistent/zspawn-test" }, options).exit_code, 127);
}

TEST(SubprocessRunner, StdinIsEmpty)
{
    zspawn::impl::subprocess_runner runner;

    EXPECT_EQ(runner.run({ "/bin/cat" }).out, "");
}

TEST(SubprocessRunner, Timeout)
{
    zspawn::impl::subprocess_runner runner;
    zspawn::run_options_t options;
    options.may_fail = true;
    options.timeout = 1s;

    auto result = runner.run(sh("echo started; exec sleep 30"), options);
    EXPECT_TRUE(result.timed_out);
    EXPECT_FALSE(result.success());
    EXPECT_EQ(result.out, "started\n");

    options.may_fail = false;
    EXPECT_THROW(runner.run(sh("exec sleep 30"), options), zspawn::command_error);
}

TEST(SubprocessRunner, PipelineFailsWhenAnyStageFails)
{
    zspawn::impl::subprocess_runner runner;

    EXPECT_THROW(runner.run(zspawn::shell_command("false | true")), zspawn::command_error);
    EXPECT_EQ(runner.run(zspawn::shell_command("echo ok | cat")).out, "ok\n");
}
