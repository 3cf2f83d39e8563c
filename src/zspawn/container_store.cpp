// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "zspawn/container_store.h"

#include "zspawn/name_registry.h"
#include "zspawn/network.h"
#include "zspawn/readers.h"
#include "zspawn/utils/log.h"

#include <algorithm>
#include <set>

zspawn::container_store::container_store(const config &cfg,
                                         const volume_manager &volumes,
                                         const supervisor &supervisor,
                                         host_filesystem &filesystem)
    : cfg_(cfg)
    , volumes_(volumes)
    , supervisor_(supervisor)
    , filesystem_(filesystem)
{
}

void zspawn::container_store::reload()
{
    auto volumes = select_containers(volumes_.list(), cfg_.storage.backup_suffix);

    auto running = supervisor_.running();
    const std::set<std::string> running_set(running.cbegin(), running.cend());

    std::vector<container_record_t> records;
    records.reserve(volumes.size());
    for (auto &volume : volumes) {
        container_record_t record;
        record.ID = std::move(volume.name);
        record.used = std::move(volume.used);
        record.available = std::move(volume.available);
        record.referenced = std::move(volume.referenced);

        record.enabled = filesystem_.exists(cfg_.enable_link(record.ID));
        record.running = running_set.count(record.ID) != 0;

        if (auto alias = read_trimmed(cfg_.alias_path(record.ID)); !alias.empty()) {
            record.alias = std::move(alias);
        }

        if (auto network = filesystem_.read(cfg_.network_path(record.ID)); network) {
            record.addresses = parse_addresses(*network);
        }

        record.hostname = read_trimmed(cfg_.hostname_path(record.ID));

        records.push_back(std::move(record));
    }

    // aborts on shared aliases before anything is listed or changed
    [[maybe_unused]] const name_registry names{ records };

    ZSPAWN_DEBUG() << "loaded " << records.size() << " containers";
    records_ = std::move(records);
}

auto zspawn::container_store::records() const noexcept -> const std::vector<container_record_t> &
{
    return records_;
}

auto zspawn::container_store::find(const std::string &id) const -> const container_record_t *
{
    auto it = std::find_if(records_.cbegin(), records_.cend(), [&id](const auto &record) {
        return record.ID == id;
    });

    return it == records_.cend() ? nullptr : &*it;
}

auto zspawn::container_store::is_running(const std::string &id) const -> bool
{
    auto running = supervisor_.running();
    return std::find(running.cbegin(), running.cend(), id) != running.cend();
}

auto zspawn::container_store::running_ids() const -> std::vector<std::string>
{
    auto running = supervisor_.running();
    std::sort(running.begin(), running.end(), id_less);
    running.erase(std::unique(running.begin(), running.end()), running.end());
    return running;
}

void zspawn::container_store::write_alias(const std::string &id, const std::string &alias)
{
    filesystem_.write(cfg_.alias_path(id), alias + "\n", 0644, root_owner(id));
}

void zspawn::container_store::write_hostname(const std::string &id, const std::string &hostname)
{
    filesystem_.write(cfg_.hostname_path(id), hostname + "\n", 0644, root_owner(id));
}

void zspawn::container_store::write_network_config(const std::string &id)
{
    auto bridge = filesystem_.read(cfg_.host_files.bridge_network);
    if (!bridge) {
        throw std::runtime_error("bridge network file " + cfg_.host_files.bridge_network.string()
                                 + " does not exist");
    }

    auto network = derive_network(parse_bridge_address(*bridge), id);
    ZSPAWN_DEBUG() << "container " << id << " gets " << network.address << " via "
                   << network.gateway;

    auto path = cfg_.network_path(id);
    auto owner = root_owner(id);
    filesystem_.make_directory(path.parent_path(), 0755, owner);
    filesystem_.write(path, render_network_config(network), 0644, owner);
}

void zspawn::container_store::write_supervisor_config(const std::string &id)
{
    filesystem_.write(cfg_.nspawn_path(id),
                      render_nspawn_config(cfg_.host_files.bridge),
                      0644,
                      std::nullopt);
}

void zspawn::container_store::write_authorized_keys(const std::string &id, const std::string &keys)
{
    auto owner = root_owner(id);
    auto ssh_dir = cfg_.ssh_dir(id);
    filesystem_.make_directory(ssh_dir, 0700, owner);
    filesystem_.write(ssh_dir / "authorized_keys", keys, 0600, owner);
}

void zspawn::container_store::remove_supervisor_config(const std::string &id)
{
    filesystem_.remove(cfg_.nspawn_path(id));
}

void zspawn::container_store::move_supervisor_config(const std::string &from, const std::string &to)
{
    filesystem_.rename(cfg_.nspawn_path(from), cfg_.nspawn_path(to));
}

void zspawn::container_store::link(const std::string &id)
{
    filesystem_.symlink(cfg_.root_of(id), cfg_.machine_link(id));
}

void zspawn::container_store::unlink(const std::string &id)
{
    filesystem_.remove(cfg_.machine_link(id));
}

auto zspawn::container_store::read_host_file(const std::filesystem::path &path) const
        -> std::optional<std::string>
{
    return filesystem_.read(path);
}

auto zspawn::container_store::root_owner(const std::string &id) const -> file_owner_t
{
    return filesystem_.owner_of(cfg_.passwd_path(id));
}

auto zspawn::container_store::read_trimmed(const std::filesystem::path &path) const -> std::string
{
    auto content = filesystem_.read(path);
    if (!content) {
        return {};
    }

    return trim(*content);
}
