// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "testing.h"
#include "zspawn/config.h"

#include <nlohmann/json.hpp>

#include <sstream>

using namespace std::chrono_literals;

namespace {

auto parse(const std::string &document) -> zspawn::config
{
    std::istringstream stream(document);
    return zspawn::config::parse(stream);
}

} // namespace

TEST(Config, Defaults)
{
    auto cfg = parse("{}");

    EXPECT_EQ(cfg.storage.dataset, "tank/machines");
    EXPECT_EQ(cfg.root_of("5").string(), "/srv/machines/5");
    EXPECT_EQ(cfg.alias_path("5").string(), "/srv/machines/5/.alias");
    EXPECT_EQ(cfg.hostname_path("5").string(), "/srv/machines/5/etc/hostname");
    EXPECT_EQ(cfg.network_path("5").string(),
              "/srv/machines/5/etc/systemd/network/80-container-host0.network");
    EXPECT_EQ(cfg.passwd_path("5").string(), "/srv/machines/5/etc/passwd");
    EXPECT_EQ(cfg.ssh_dir("5").string(), "/srv/machines/5/root/.ssh");
    EXPECT_EQ(cfg.nspawn_path("5").string(), "/etc/systemd/nspawn/5.nspawn");
    EXPECT_EQ(cfg.machine_link("5").string(), "/var/lib/machines/5");
    EXPECT_EQ(cfg.enable_link("5").string(),
              "/etc/systemd/system/machines.target.wants/systemd-nspawn@5.service");

    EXPECT_EQ(cfg.storage.backup_suffix, ".bak");
    EXPECT_EQ(cfg.storage.record_size, "16K");
    EXPECT_EQ(cfg.host_files.bridge, "br0");
    EXPECT_EQ(cfg.bootstrap.suite, "bookworm");
    EXPECT_EQ(cfg.bootstrap.packages,
              (std::vector<std::string>{ "systemd", "dbus", "openssh-server" }));
    EXPECT_EQ(cfg.polling.interval, 100ms);
    EXPECT_FALSE(cfg.polling.timeout.has_value());
}

TEST(Config, Overrides)
{
    auto cfg = parse(R"({
        "dataset": "pool/ct",
        "mountpoint": "/ct",
        "suite": "trixie",
        "packages": ["systemd"],
        "bridge": "lan0",
        "poll_interval_ms": 250,
        "wait_timeout_ms": 60000,
        "unknown": true
    })");

    EXPECT_EQ(cfg.storage.dataset, "pool/ct");
    EXPECT_EQ(cfg.root_of("7").string(), "/ct/7");
    EXPECT_EQ(cfg.bootstrap.suite, "trixie");
    EXPECT_EQ(cfg.bootstrap.packages, (std::vector<std::string>{ "systemd" }));
    EXPECT_EQ(cfg.host_files.bridge, "lan0");
    EXPECT_EQ(cfg.polling.interval, 250ms);
    EXPECT_EQ(cfg.polling.timeout, std::optional<std::chrono::milliseconds>{ 60000ms });
}

TEST(Config, ZeroTimeoutWaitsForever)
{
    EXPECT_FALSE(parse(R"({"wait_timeout_ms": 0})").polling.timeout.has_value());
}

TEST(Config, InvalidDocuments)
{
    EXPECT_THROW(parse("[]"), std::runtime_error);
    EXPECT_THROW(parse(R"({"alias_file": "/etc/alias"})"), std::runtime_error);
    EXPECT_THROW(parse(R"({"poll_interval_ms": 0})"), std::runtime_error);
    EXPECT_THROW(parse(R"({"wait_timeout_ms": -1})"), std::runtime_error);
    EXPECT_THROW(parse(R"({"dataset": 5})"), nlohmann::json::type_error);
    EXPECT_THROW(parse("{"), nlohmann::json::parse_error);
}

TEST(Config, LoadMissingFile)
{
    EXPECT_THROW(zspawn::config::load("/nonexistent/zspawn.json"), std::runtime_error);
}
