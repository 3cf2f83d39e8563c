// SPDX-FileCopyrightText: 2022-2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "zspawn/config.h"

#include "zspawn/utils/log.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <fstream>

namespace {

template<typename T>
void assign_if_present(const nlohmann::json &j, const char *key, T &target)
{
    auto it = j.find(key);
    if (it == j.end()) {
        return;
    }

    target = it->get<T>();
}

void assign_path_if_present(const nlohmann::json &j, const char *key, std::filesystem::path &target)
{
    auto it = j.find(key);
    if (it == j.end()) {
        return;
    }

    target = it->get<std::string>();
}

void assign_duration_if_present(const nlohmann::json &j,
                                const char *key,
                                std::chrono::milliseconds &target)
{
    auto it = j.find(key);
    if (it == j.end()) {
        return;
    }

    auto value = it->get<std::int64_t>();
    if (value <= 0) {
        throw std::runtime_error(std::string{ key } + " must be greater than zero");
    }

    target = std::chrono::milliseconds{ value };
}

auto parse_config(const nlohmann::json &j) -> zspawn::config
{
    if (!j.is_object()) {
        throw std::runtime_error("configuration must be a JSON object");
    }

    zspawn::config cfg;

    assign_if_present(j, "dataset", cfg.storage.dataset);
    assign_path_if_present(j, "mountpoint", cfg.storage.mountpoint);
    assign_if_present(j, "backup_suffix", cfg.storage.backup_suffix);
    assign_if_present(j, "record_size", cfg.storage.record_size);

    assign_path_if_present(j, "alias_file", cfg.container_files.alias);
    assign_path_if_present(j, "hostname_file", cfg.container_files.hostname);
    assign_path_if_present(j, "network_file", cfg.container_files.network);
    assign_path_if_present(j, "passwd_file", cfg.container_files.passwd);

    assign_path_if_present(j, "bridge_network_file", cfg.host_files.bridge_network);
    assign_if_present(j, "bridge", cfg.host_files.bridge);
    assign_path_if_present(j, "nspawn_dir", cfg.host_files.nspawn_dir);
    assign_path_if_present(j, "machines_dir", cfg.host_files.machines_dir);
    assign_path_if_present(j, "wants_dir", cfg.host_files.wants_dir);

    assign_if_present(j, "suite", cfg.bootstrap.suite);
    assign_if_present(j, "mirror", cfg.bootstrap.mirror);
    assign_if_present(j, "packages", cfg.bootstrap.packages);
    assign_if_present(j, "timezone", cfg.bootstrap.timezone);
    assign_if_present(j, "locale", cfg.bootstrap.locale);

    assign_duration_if_present(j, "poll_interval_ms", cfg.polling.interval);

    if (auto it = j.find("wait_timeout_ms"); it != j.end()) {
        auto value = it->get<std::int64_t>();
        if (value < 0) {
            throw std::runtime_error("wait_timeout_ms must not be negative");
        }

        // zero keeps waiting forever
        if (value > 0) {
            cfg.polling.timeout = std::chrono::milliseconds{ value };
        }
    }

    for (const auto *key : { "alias_file", "hostname_file", "network_file", "passwd_file" }) {
        if (j.contains(key) && std::filesystem::path{ j[key].get<std::string>() }.is_absolute()) {
            throw std::runtime_error(std::string{ key } + " must be relative to the container root");
        }
    }

    return cfg;
}

} // namespace

zspawn::config zspawn::config::parse(std::istream &is)
{
    auto j = nlohmann::json::parse(is);
    return parse_config(j);
}

zspawn::config zspawn::config::load(const std::filesystem::path &path)
{
    std::ifstream istrm(path);
    if (istrm.fail()) {
        throw std::runtime_error("failed to open configuration file: " + path.string());
    }

    ZSPAWN_DEBUG() << "load configuration from " << path;
    return parse(istrm);
}

auto zspawn::config::default_path() -> std::filesystem::path
{
    return "/etc/zspawn/config.json";
}

auto zspawn::config::root_of(const std::string &id) const -> std::filesystem::path
{
    return storage.mountpoint / id;
}

auto zspawn::config::alias_path(const std::string &id) const -> std::filesystem::path
{
    return root_of(id) / container_files.alias;
}

auto zspawn::config::hostname_path(const std::string &id) const -> std::filesystem::path
{
    return root_of(id) / container_files.hostname;
}

auto zspawn::config::network_path(const std::string &id) const -> std::filesystem::path
{
    return root_of(id) / container_files.network;
}

auto zspawn::config::passwd_path(const std::string &id) const -> std::filesystem::path
{
    return root_of(id) / container_files.passwd;
}

auto zspawn::config::ssh_dir(const std::string &id) const -> std::filesystem::path
{
    return root_of(id) / container_files.ssh_dir;
}

auto zspawn::config::nspawn_path(const std::string &id) const -> std::filesystem::path
{
    return host_files.nspawn_dir / (id + ".nspawn");
}

auto zspawn::config::machine_link(const std::string &id) const -> std::filesystem::path
{
    return host_files.machines_dir / id;
}

auto zspawn::config::enable_link(const std::string &id) const -> std::filesystem::path
{
    return host_files.wants_dir / ("systemd-nspawn@" + id + ".service");
}
