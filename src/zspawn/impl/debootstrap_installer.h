// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include "zspawn/config.h"
#include "zspawn/package_installer.h"
#include "zspawn/process_runner.h"

namespace zspawn::impl {

class debootstrap_installer final : public virtual zspawn::package_installer
{
public:
    debootstrap_installer(process_runner &runner, config::bootstrap_t settings);

    void bootstrap(const std::filesystem::path &root) final;

private:
    process_runner &runner_;
    config::bootstrap_t settings_;
};

static_assert(!std::is_abstract_v<debootstrap_installer>);

} // namespace zspawn::impl
