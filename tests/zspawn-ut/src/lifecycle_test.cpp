// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "store_fixture.h"
#include "zspawn/errors.h"
#include "zspawn/lifecycle.h"

#include <memory>
#include <sstream>

using namespace std::chrono_literals;

namespace {

class LifecycleTest : public zspawn::testing::StoreTest
{
protected:
    auto engine() -> zspawn::lifecycle_engine &
    {
        store.reload();
        engine_ = std::make_unique<zspawn::lifecycle_engine>(
                store,
                volumes,
                supervisor,
                installer,
                [this](std::chrono::milliseconds duration) {
                    sleeps.push_back(duration);
                });
        return *engine_;
    }

    [[nodiscard]] auto untouched() const -> bool
    {
        return volumes.calls.empty() && supervisor.calls.empty() && installer.roots.empty()
                && !filesystem.touched();
    }

    zspawn::testing::fake_installer installer;
    std::vector<std::chrono::milliseconds> sleeps;

private:
    std::unique_ptr<zspawn::lifecycle_engine> engine_;
};

} // namespace

TEST_F(LifecycleTest, CreateRejectsOutOfRangeIdentifiers)
{
    add_container("5");
    auto &lifecycle = engine();

    for (const auto *id : { "0", "254", "1000", "007", "web", "" }) {
        EXPECT_THROW(lifecycle.create(id), zspawn::precondition_error) << id;
    }
    EXPECT_THROW(lifecycle.create("5"), zspawn::precondition_error);

    EXPECT_TRUE(untouched());
}

TEST_F(LifecycleTest, CreateRejectsIdentifierUsedAsAlias)
{
    add_container("5", "9");
    auto &lifecycle = engine();

    EXPECT_THROW(lifecycle.create("9"), zspawn::precondition_error);
    EXPECT_TRUE(untouched());
}

TEST_F(LifecycleTest, Create)
{
    supervisor.settle_polls = 2;
    auto &lifecycle = engine();

    lifecycle.create("7");

    EXPECT_EQ(volumes.calls, (std::vector<std::string>{ "create 7" }));
    ASSERT_EQ(installer.roots.size(), 1U);
    EXPECT_EQ(installer.roots.front().string(), cfg.root_of("7").string());

    EXPECT_NE(filesystem.files.at(cfg.network_path("7")).find("Address=172.17.0.7/24"),
              std::string::npos);
    EXPECT_NE(filesystem.files.at(cfg.nspawn_path("7")).find("Bridge=br0"), std::string::npos);
    EXPECT_EQ(filesystem.links.at(cfg.machine_link("7")).string(), cfg.root_of("7").string());

    EXPECT_EQ(supervisor.calls,
              (std::vector<std::string>{ "enable 7",
                                         "start 7",
                                         "run 7 timedatectl set-timezone Etc/UTC",
                                         "run 7 localectl set-locale LANG=C.UTF-8" }));
    EXPECT_TRUE(supervisor.active.count("7") != 0);

    // two polls until running, then the settle delay
    EXPECT_EQ(sleeps, (std::vector<std::chrono::milliseconds>{ 100ms, 100ms, 1000ms }));
}

TEST_F(LifecycleTest, CreateFailsWhenSetupCommandFails)
{
    supervisor.results["7"] = { 1, "Failed to set time zone\n", "", false };
    auto &lifecycle = engine();

    EXPECT_THROW(lifecycle.create("7"), zspawn::command_error);
}

TEST_F(LifecycleTest, DestroyRefusesRunningOrEnabled)
{
    add_container("5", "web", {}, true);
    add_container("6", {}, {}, false, true);
    auto &lifecycle = engine();

    std::istringstream in("DESTROY\nDESTROY\n");
    std::ostringstream out;
    EXPECT_THROW((void)lifecycle.destroy("web", in, out), zspawn::precondition_error);
    EXPECT_THROW((void)lifecycle.destroy("6", in, out), zspawn::precondition_error);
    EXPECT_THROW((void)lifecycle.destroy("8", in, out), zspawn::precondition_error);

    EXPECT_TRUE(untouched());
    EXPECT_TRUE(out.str().empty());
}

TEST_F(LifecycleTest, DestroyNeedsExactConfirmation)
{
    add_container("5");
    auto &lifecycle = engine();

    for (const auto *answers : { "destroy\nDESTROY\n", "DESTROY\nyes\n", "DESTROY \nDESTROY\n", "" }) {
        std::istringstream in(answers);
        std::ostringstream out;
        EXPECT_FALSE(lifecycle.destroy("5", in, out));
        EXPECT_NE(out.str().find("Aborted."), std::string::npos);
    }

    EXPECT_TRUE(untouched());
}

TEST_F(LifecycleTest, Destroy)
{
    add_container("5", "web");
    filesystem.files[cfg.nspawn_path("5")] = "[Exec]\n";
    filesystem.links[cfg.machine_link("5")] = cfg.root_of("5");
    auto &lifecycle = engine();

    std::istringstream in("DESTROY\nDESTROY\n");
    std::ostringstream out;
    EXPECT_TRUE(lifecycle.destroy("web", in, out));

    EXPECT_EQ(volumes.calls, (std::vector<std::string>{ "destroy 5" }));
    EXPECT_EQ(filesystem.links.count(cfg.machine_link("5")), 0U);
    EXPECT_EQ(filesystem.files.count(cfg.nspawn_path("5")), 0U);
    EXPECT_TRUE(supervisor.calls.empty());
}

TEST_F(LifecycleTest, RenameEnabledContainer)
{
    add_container("5", "web", {}, false, true);
    filesystem.files[cfg.nspawn_path("5")] = "[Exec]\n";
    filesystem.links[cfg.machine_link("5")] = cfg.root_of("5");
    auto &lifecycle = engine();

    lifecycle.rename("web", "9");

    EXPECT_EQ(volumes.calls, (std::vector<std::string>{ "rename 5 9" }));
    EXPECT_EQ(supervisor.calls, (std::vector<std::string>{ "disable 5", "enable 9" }));
    EXPECT_EQ(filesystem.files.count(cfg.nspawn_path("9")), 1U);
    EXPECT_EQ(filesystem.files.count(cfg.nspawn_path("5")), 0U);
    EXPECT_EQ(filesystem.links.at(cfg.machine_link("9")).string(), cfg.root_of("9").string());
    EXPECT_EQ(filesystem.links.count(cfg.machine_link("5")), 0U);
    EXPECT_NE(filesystem.files.at(cfg.network_path("9")).find("Address=172.17.0.9/24"),
              std::string::npos);
}

TEST_F(LifecycleTest, RenamePreconditions)
{
    add_container("5", {}, {}, true);
    add_container("6", "db");
    auto &lifecycle = engine();

    EXPECT_THROW(lifecycle.rename("5", "9"), zspawn::precondition_error);
    EXPECT_THROW(lifecycle.rename("6", "5"), zspawn::precondition_error);
    EXPECT_THROW(lifecycle.rename("8", "9"), zspawn::precondition_error);
    for (const auto *to : { "web", "007", "a/b", "" }) {
        EXPECT_THROW(lifecycle.rename("6", to), zspawn::precondition_error) << to;
    }
    EXPECT_TRUE(untouched());
}

TEST_F(LifecycleTest, ClonePrefixesNames)
{
    add_container("5", "web", "web01", false, true);
    auto &lifecycle = engine();

    lifecycle.clone("web", "6");

    ASSERT_EQ(volumes.calls.size(), 4U);
    const auto &snapshot = volumes.calls[0];
    EXPECT_EQ(snapshot.rfind("snapshot 5@clone-", 0), 0U);
    auto label = snapshot.substr(snapshot.find('@') + 1);
    EXPECT_EQ(volumes.calls[1], "transfer 5@" + label + " 6");
    EXPECT_EQ(volumes.calls[2], "destroy 5@" + label);
    EXPECT_EQ(volumes.calls[3], "destroy 6@" + label);

    EXPECT_EQ(filesystem.files.at(cfg.alias_path("6")), "cloned-web\n");
    EXPECT_EQ(filesystem.files.at(cfg.hostname_path("6")), "cloned-web01\n");
    EXPECT_NE(filesystem.files.at(cfg.network_path("6")).find("Address=172.17.0.6/24"),
              std::string::npos);
    EXPECT_EQ(filesystem.files.count(cfg.nspawn_path("6")), 1U);
    EXPECT_EQ(supervisor.calls, (std::vector<std::string>{ "enable 6" }));
}

TEST_F(LifecycleTest, CloneWithoutNames)
{
    add_container("5");
    auto &lifecycle = engine();

    lifecycle.clone("5", "6");

    EXPECT_EQ(filesystem.files.count(cfg.alias_path("6")), 0U);
    EXPECT_EQ(filesystem.files.count(cfg.hostname_path("6")), 0U);
    EXPECT_TRUE(supervisor.calls.empty());
}

TEST_F(LifecycleTest, ClonePreconditions)
{
    add_container("5", "web", {}, true);
    add_container("6", "db");
    add_container("7", "cloned-db");
    auto &lifecycle = engine();

    EXPECT_THROW(lifecycle.clone("web", "8"), zspawn::precondition_error);
    EXPECT_THROW(lifecycle.clone("db", "7"), zspawn::precondition_error);
    EXPECT_THROW(lifecycle.clone("db", "8"), zspawn::precondition_error);
    EXPECT_TRUE(untouched());
}

TEST_F(LifecycleTest, CloneTargetMustBeIdentifier)
{
    add_container("5", "web", "web01");
    auto &lifecycle = engine();

    for (const auto *to : { "web2", "007", "a/b", "" }) {
        EXPECT_THROW(lifecycle.clone("5", to), zspawn::precondition_error) << to;
    }
    EXPECT_TRUE(untouched());
}

TEST_F(LifecycleTest, StartConvergesAfterPolls)
{
    add_container("5", "web");
    supervisor.settle_polls = 3;
    auto &lifecycle = engine();

    lifecycle.start("web");

    EXPECT_EQ(supervisor.calls, (std::vector<std::string>{ "start 5" }));
    EXPECT_EQ(sleeps.size(), 3U);
    EXPECT_TRUE(supervisor.active.count("5") != 0);
}

TEST_F(LifecycleTest, StartRunningContainerOnlyWaits)
{
    add_container("5", {}, {}, true);
    auto &lifecycle = engine();

    lifecycle.start("5");

    EXPECT_TRUE(supervisor.calls.empty());
    EXPECT_TRUE(sleeps.empty());
}

TEST_F(LifecycleTest, StopConvergesAfterPolls)
{
    add_container("5", {}, {}, true);
    supervisor.settle_polls = 2;
    auto &lifecycle = engine();

    lifecycle.stop("5");

    EXPECT_EQ(supervisor.calls, (std::vector<std::string>{ "stop 5" }));
    EXPECT_EQ(sleeps.size(), 2U);
    EXPECT_EQ(supervisor.active.count("5"), 0U);
}

TEST_F(LifecycleTest, StopTimesOut)
{
    add_container("5", {}, {}, true);
    supervisor.settle_polls = 1000;
    cfg.polling.timeout = 300ms;
    auto &lifecycle = engine();

    EXPECT_THROW(lifecycle.stop("5"), std::runtime_error);
    EXPECT_EQ(sleeps.size(), 3U);
}

TEST_F(LifecycleTest, Restart)
{
    add_container("5", {}, {}, true);
    auto &lifecycle = engine();

    lifecycle.restart("5");

    EXPECT_EQ(supervisor.calls, (std::vector<std::string>{ "stop 5", "start 5" }));
}

TEST_F(LifecycleTest, EnableAndDisableTranslateAliases)
{
    add_container("5", "web");
    auto &lifecycle = engine();

    lifecycle.enable("web");
    lifecycle.disable("5");
    lifecycle.enable("xyz");

    EXPECT_EQ(supervisor.calls, (std::vector<std::string>{ "enable 5", "disable 5", "enable xyz" }));
}

TEST_F(LifecycleTest, SetAlias)
{
    add_container("5", "web");
    add_container("6", "db");
    auto &lifecycle = engine();

    EXPECT_THROW(lifecycle.set_alias("5", "all"), zspawn::precondition_error);
    EXPECT_THROW(lifecycle.set_alias("5", " "), zspawn::precondition_error);
    EXPECT_THROW(lifecycle.set_alias("5", "6"), zspawn::precondition_error);
    EXPECT_THROW(lifecycle.set_alias("5", "db"), zspawn::precondition_error);
    EXPECT_THROW(lifecycle.set_alias("9", "cache"), zspawn::precondition_error);
    EXPECT_TRUE(filesystem.writes.empty());

    lifecycle.set_alias("web", " frontend\n");
    EXPECT_EQ(filesystem.files.at(cfg.alias_path("5")), "frontend\n");

    lifecycle.set_alias("db", "db");
    EXPECT_EQ(filesystem.files.at(cfg.alias_path("6")), "db\n");
}

TEST_F(LifecycleTest, SetHostname)
{
    add_container("5");
    add_container("6", {}, {}, true);
    auto &lifecycle = engine();

    lifecycle.set_hostname("5", "web01");
    EXPECT_EQ(filesystem.files.at(cfg.hostname_path("5")), "web01\n");

    lifecycle.set_hostname("6", "db01");
    EXPECT_EQ(supervisor.calls, (std::vector<std::string>{ "run 6 hostnamectl set-hostname db01" }));
    EXPECT_EQ(filesystem.files.count(cfg.hostname_path("6")), 0U);

    EXPECT_THROW(lifecycle.set_hostname("5", ""), zspawn::precondition_error);
}

TEST_F(LifecycleTest, SetAuthorizedKeys)
{
    add_container("5");
    filesystem.files["/root/admin.pub"] = "ssh-ed25519 AAAA admin\n";
    auto &lifecycle = engine();

    lifecycle.set_authorized_keys("5", "/root/admin.pub");
    EXPECT_EQ(filesystem.files.at(cfg.ssh_dir("5") / "authorized_keys"),
              "ssh-ed25519 AAAA admin\n");

    EXPECT_THROW(lifecycle.set_authorized_keys("5", "/root/missing.pub"),
                 zspawn::precondition_error);
}

TEST_F(LifecycleTest, ExecSingle)
{
    add_container("5", "web", {}, true);
    supervisor.results["5"] = { 3, "line one\nline two\n", "", false };
    auto &lifecycle = engine();

    std::ostringstream out;
    EXPECT_EQ(lifecycle.exec("web", { "uname", "-a" }, out, 10s), 3);

    EXPECT_EQ(supervisor.calls, (std::vector<std::string>{ "run 5 uname -a" }));
    EXPECT_EQ(supervisor.last_timeout, std::optional<std::chrono::seconds>{ 10s });
    EXPECT_EQ(out.str(), "5: line one\n5: line two\n5: exit status 3\n");
}

TEST_F(LifecycleTest, ExecAllRunsEveryRunningContainer)
{
    add_container("10", {}, {}, true);
    add_container("5", {}, {}, true);
    add_container("7");
    supervisor.results["5"] = { 2, "oops\n", "", false };
    supervisor.results["10"] = { 0, "fine\n", "", false };
    auto &lifecycle = engine();

    std::ostringstream out;
    EXPECT_EQ(lifecycle.exec("all", { "true" }, out), 2);

    EXPECT_EQ(supervisor.calls, (std::vector<std::string>{ "run 5 true", "run 10 true" }));
    EXPECT_EQ(out.str(), "5: oops\n5: exit status 2\n10: fine\n10: exit status 0\n");
}

TEST_F(LifecycleTest, ExecReportsTimeout)
{
    add_container("5", {}, {}, true);
    supervisor.results["5"] = { 137, "", "", true };
    auto &lifecycle = engine();

    std::ostringstream out;
    EXPECT_EQ(lifecycle.exec("5", { "sleep", "100" }, out, 1s), 137);
    EXPECT_EQ(out.str(), "5: timed out\n");
}

TEST_F(LifecycleTest, ShellAndInspect)
{
    add_container("5", "web");
    auto &lifecycle = engine();

    EXPECT_EQ(lifecycle.shell("web").args, (std::vector<std::string>{ "machinectl", "shell", "5" }));
    EXPECT_THROW((void)lifecycle.shell("xyz"), zspawn::precondition_error);

    EXPECT_EQ(lifecycle.inspect("status", { "web", "-n", "20" }).args,
              (std::vector<std::string>{ "machinectl", "status", "5", "-n", "20" }));
}

TEST_F(LifecycleTest, InconsistentNamesAbortConstruction)
{
    add_container("5", "web");
    add_container("6", "web");

    EXPECT_THROW(engine(), zspawn::consistency_error);
}
