// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include "zspawn/process_runner.h"
#include "zspawn/volume_manager.h"

namespace zspawn::impl {

class zfs_volume_manager final : public virtual zspawn::volume_manager
{
public:
    zfs_volume_manager(process_runner &runner, std::string dataset, std::string record_size);

    [[nodiscard]] auto list() const -> std::vector<volume_usage_t> final;
    void create(const std::string &name) final;
    void destroy(const std::string &name) final;
    void rename(const std::string &from, const std::string &to) final;
    void snapshot(const std::string &name, const std::string &label) final;
    void transfer(const std::string &from, const std::string &label, const std::string &to) final;
    void destroy_snapshot(const std::string &name, const std::string &label) final;

private:
    [[nodiscard]] auto child(const std::string &name) const -> std::string;

    process_runner &runner_;
    std::string dataset_;
    std::string record_size_;
};

static_assert(!std::is_abstract_v<zfs_volume_manager>);

} // namespace zspawn::impl
