// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "zspawn/impl/zfs_volume_manager.h"

#include "zspawn/readers.h"

zspawn::impl::zfs_volume_manager::zfs_volume_manager(process_runner &runner,
                                                     std::string dataset,
                                                     std::string record_size)
    : runner_(runner)
    , dataset_(std::move(dataset))
    , record_size_(std::move(record_size))
{
}

auto zspawn::impl::zfs_volume_manager::list() const -> std::vector<volume_usage_t>
{
    auto result = runner_.run(
            { "zfs", "list", "-H", "-o", "name,used,avail,refer", "-d", "1", dataset_ });
    return parse_volume_list(result.out, dataset_);
}

void zspawn::impl::zfs_volume_manager::create(const std::string &name)
{
    runner_.run({ "zfs", "create", "-o", "recordsize=" + record_size_, child(name) });
}

void zspawn::impl::zfs_volume_manager::destroy(const std::string &name)
{
    runner_.run({ "zfs", "destroy", "-r", child(name) });
}

void zspawn::impl::zfs_volume_manager::rename(const std::string &from, const std::string &to)
{
    runner_.run({ "zfs", "rename", child(from), child(to) });
}

void zspawn::impl::zfs_volume_manager::snapshot(const std::string &name, const std::string &label)
{
    runner_.run({ "zfs", "snapshot", child(name) + "@" + label });
}

void zspawn::impl::zfs_volume_manager::transfer(const std::string &from,
                                                const std::string &label,
                                                const std::string &to)
{
    runner_.run(shell_command("zfs send -R -w " + shell_quote(child(from) + "@" + label)
                              + " | zfs receive " + shell_quote(child(to))));
}

void zspawn::impl::zfs_volume_manager::destroy_snapshot(const std::string &name,
                                                        const std::string &label)
{
    runner_.run({ "zfs", "destroy", child(name) + "@" + label });
}

auto zspawn::impl::zfs_volume_manager::child(const std::string &name) const -> std::string
{
    return dataset_ + "/" + name;
}
