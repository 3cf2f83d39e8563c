// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include "zspawn/interface.h"

#include <filesystem>

namespace zspawn {

class package_installer : public virtual interface
{
public:
    // Populates an empty directory with a bootable root filesystem.
    virtual void bootstrap(const std::filesystem::path &root) = 0;
};

} // namespace zspawn
