// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include "zspawn/config.h"
#include "zspawn/container_record.h"
#include "zspawn/host_filesystem.h"
#include "zspawn/supervisor.h"
#include "zspawn/volume_manager.h"

#include <string>
#include <vector>

namespace zspawn {

// The host is the only database. This repository reads every attribute source
// on reload() and funnels each durable write through one writer per field.
class container_store
{
public:
    container_store(const config &cfg,
                    const volume_manager &volumes,
                    const supervisor &supervisor,
                    host_filesystem &filesystem);

    // Throws consistency_error when the names on the host collide.
    void reload();

    [[nodiscard]] auto records() const noexcept -> const std::vector<container_record_t> &;
    // nullptr when id is not a container
    [[nodiscard]] auto find(const std::string &id) const -> const container_record_t *;

    // These ask the supervisor again instead of using the loaded records.
    [[nodiscard]] auto is_running(const std::string &id) const -> bool;
    [[nodiscard]] auto running_ids() const -> std::vector<std::string>;

    void write_alias(const std::string &id, const std::string &alias);
    void write_hostname(const std::string &id, const std::string &hostname);
    void write_network_config(const std::string &id);
    void write_supervisor_config(const std::string &id);
    void write_authorized_keys(const std::string &id, const std::string &keys);

    void remove_supervisor_config(const std::string &id);
    void move_supervisor_config(const std::string &from, const std::string &to);
    void link(const std::string &id);
    void unlink(const std::string &id);

    [[nodiscard]] auto read_host_file(const std::filesystem::path &path) const
            -> std::optional<std::string>;

    [[nodiscard]] auto get_config() const noexcept -> const config & { return cfg_; }

private:
    [[nodiscard]] auto root_owner(const std::string &id) const -> file_owner_t;
    [[nodiscard]] auto read_trimmed(const std::filesystem::path &path) const -> std::string;

    const config &cfg_;
    const volume_manager &volumes_;
    const supervisor &supervisor_;
    host_filesystem &filesystem_;
    std::vector<container_record_t> records_;
};

} // namespace zspawn
