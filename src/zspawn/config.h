// SPDX-FileCopyrightText: 2022-2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include <chrono>
#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace zspawn {

// Host layout and bootstrap settings. Every field has a usable default, a
// configuration document only needs the keys it overrides.
struct config
{
    static config parse(std::istream &is);
    static config load(const std::filesystem::path &path);
    static auto default_path() -> std::filesystem::path;

    struct storage_t
    {
        std::string dataset{ "tank/machines" };
        std::filesystem::path mountpoint{ "/srv/machines" };
        std::string backup_suffix{ ".bak" };
        std::string record_size{ "16K" };
    };

    // relative to the root of a container
    struct container_files_t
    {
        std::filesystem::path alias{ ".alias" };
        std::filesystem::path hostname{ "etc/hostname" };
        std::filesystem::path network{ "etc/systemd/network/80-container-host0.network" };
        std::filesystem::path passwd{ "etc/passwd" };
        std::filesystem::path ssh_dir{ "root/.ssh" };
    };

    struct host_files_t
    {
        std::filesystem::path bridge_network{ "/etc/systemd/network/br0.network" };
        std::string bridge{ "br0" };
        std::filesystem::path nspawn_dir{ "/etc/systemd/nspawn" };
        std::filesystem::path machines_dir{ "/var/lib/machines" };
        std::filesystem::path wants_dir{ "/etc/systemd/system/machines.target.wants" };
    };

    struct bootstrap_t
    {
        std::string suite{ "bookworm" };
        std::string mirror{ "http://deb.debian.org/debian" };
        std::vector<std::string> packages{ "systemd", "dbus", "openssh-server" };
        std::string timezone{ "Etc/UTC" };
        std::string locale{ "C.UTF-8" };
    };

    struct polling_t
    {
        std::chrono::milliseconds interval{ 100 };
        std::optional<std::chrono::milliseconds> timeout;
    };

    storage_t storage;
    container_files_t container_files;
    host_files_t host_files;
    bootstrap_t bootstrap;
    polling_t polling;

    [[nodiscard]] auto root_of(const std::string &id) const -> std::filesystem::path;
    [[nodiscard]] auto alias_path(const std::string &id) const -> std::filesystem::path;
    [[nodiscard]] auto hostname_path(const std::string &id) const -> std::filesystem::path;
    [[nodiscard]] auto network_path(const std::string &id) const -> std::filesystem::path;
    [[nodiscard]] auto passwd_path(const std::string &id) const -> std::filesystem::path;
    [[nodiscard]] auto ssh_dir(const std::string &id) const -> std::filesystem::path;
    [[nodiscard]] auto nspawn_path(const std::string &id) const -> std::filesystem::path;
    [[nodiscard]] auto machine_link(const std::string &id) const -> std::filesystem::path;
    [[nodiscard]] auto enable_link(const std::string &id) const -> std::filesystem::path;
};

} // namespace zspawn
