// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include "zspawn/config.h"
#include "zspawn/container_store.h"
#include "zspawn/host_filesystem.h"
#include "zspawn/lifecycle.h"
#include "zspawn/package_installer.h"
#include "zspawn/process_runner.h"
#include "zspawn/supervisor.h"
#include "zspawn/volume_manager.h"

#include <filesystem>
#include <memory>
#include <optional>

namespace zspawn {

// Wires the host backed collaborators together for one invocation.
class runtime_t
{
public:
    explicit runtime_t(const std::optional<std::filesystem::path> &config_file);

    [[nodiscard]] auto get_config() const noexcept -> const config & { return config_; }

    // Loads the store on first use.
    auto store() -> container_store &;
    auto engine() -> lifecycle_engine &;

private:
    config config_;
    std::unique_ptr<process_runner> runner_;
    std::unique_ptr<volume_manager> volumes_;
    std::unique_ptr<supervisor> supervisor_;
    std::unique_ptr<package_installer> installer_;
    std::unique_ptr<host_filesystem> filesystem_;
    std::unique_ptr<container_store> store_;
    std::unique_ptr<lifecycle_engine> engine_;
};

} // namespace zspawn
