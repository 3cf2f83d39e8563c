// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include "zspawn/interface.h"

#include <string>
#include <vector>

namespace zspawn {

struct volume_usage_t
{
    // leaf name below the containers dataset
    std::string name;
    std::string used;
    std::string available;
    std::string referenced;
};

// Storage subtrees of containers, addressed by their leaf name.
class volume_manager : public virtual interface
{
public:
    // Immediate children of the containers dataset, unfiltered and unsorted.
    [[nodiscard]] virtual auto list() const -> std::vector<volume_usage_t> = 0;
    virtual void create(const std::string &name) = 0;
    virtual void destroy(const std::string &name) = 0;
    virtual void rename(const std::string &from, const std::string &to) = 0;
    virtual void snapshot(const std::string &name, const std::string &label) = 0;
    // Replicates name@label into a new subtree called to.
    virtual void transfer(const std::string &from, const std::string &label, const std::string &to) = 0;
    virtual void destroy_snapshot(const std::string &name, const std::string &label) = 0;
};

} // namespace zspawn
