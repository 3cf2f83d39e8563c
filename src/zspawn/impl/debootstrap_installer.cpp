// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "zspawn/impl/debootstrap_installer.h"

#include "zspawn/utils/log.h"

zspawn::impl::debootstrap_installer::debootstrap_installer(process_runner &runner,
                                                           config::bootstrap_t settings)
    : runner_(runner)
    , settings_(std::move(settings))
{
}

void zspawn::impl::debootstrap_installer::bootstrap(const std::filesystem::path &root)
{
    std::vector<std::string> args{ "debootstrap" };

    if (!settings_.packages.empty()) {
        std::string include{ "--include=" };
        for (std::size_t i = 0; i < settings_.packages.size(); ++i) {
            if (i != 0) {
                include.push_back(',');
            }
            include += settings_.packages[i];
        }
        args.push_back(std::move(include));
    }

    args.push_back(settings_.suite);
    args.push_back(root.string());
    args.push_back(settings_.mirror);

    ZSPAWN_INFO() << "bootstrapping " << settings_.suite << " into " << root;
    runner_.run(args);
}
