// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "zspawn/runtime.h"

#include "zspawn/impl/debootstrap_installer.h"
#include "zspawn/impl/local_filesystem.h"
#include "zspawn/impl/machinectl_supervisor.h"
#include "zspawn/impl/subprocess_runner.h"
#include "zspawn/impl/zfs_volume_manager.h"
#include "zspawn/utils/log.h"

#include <cstdlib>

namespace {

auto load_config(const std::optional<std::filesystem::path> &config_file) -> zspawn::config
{
    if (config_file) {
        return zspawn::config::load(*config_file);
    }

    const auto *env = std::getenv("ZSPAWN_CONFIG");
    if (env != nullptr && *env != '\0') {
        return zspawn::config::load(env);
    }

    auto path = zspawn::config::default_path();
    if (!std::filesystem::exists(path)) {
        ZSPAWN_DEBUG() << path << " not found, using built-in defaults";
        return {};
    }

    return zspawn::config::load(path);
}

} // namespace

zspawn::runtime_t::runtime_t(const std::optional<std::filesystem::path> &config_file)
    : config_(load_config(config_file))
    , runner_(std::make_unique<impl::subprocess_runner>())
    , volumes_(std::make_unique<impl::zfs_volume_manager>(
              *runner_, config_.storage.dataset, config_.storage.record_size))
    , supervisor_(std::make_unique<impl::machinectl_supervisor>(*runner_))
    , installer_(std::make_unique<impl::debootstrap_installer>(*runner_, config_.bootstrap))
    , filesystem_(std::make_unique<impl::local_filesystem>())
{
}

auto zspawn::runtime_t::store() -> container_store &
{
    if (!store_) {
        store_ = std::make_unique<container_store>(config_, *volumes_, *supervisor_, *filesystem_);
        store_->reload();
    }

    return *store_;
}

auto zspawn::runtime_t::engine() -> lifecycle_engine &
{
    if (!engine_) {
        engine_ = std::make_unique<lifecycle_engine>(store(), *volumes_, *supervisor_, *installer_);
    }

    return *engine_;
}
