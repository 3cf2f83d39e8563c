// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include "zspawn/container_record.h"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace zspawn {

// Every identifier and every alias, each mapped to its container identifier.
class name_registry
{
public:
    // Throws consistency_error when an alias equals an identifier or is
    // claimed by two containers.
    explicit name_registry(const std::vector<container_record_t> &records);

    // Known names become identifiers, anything else is kept as is.
    [[nodiscard]] auto translate(const std::vector<std::string> &names) const
            -> std::vector<std::string>;

    [[nodiscard]] auto resolve(const std::string &name) const -> std::optional<std::string>;

    [[nodiscard]] auto contains(const std::string &name) const -> bool;

private:
    std::unordered_map<std::string, std::string> names_;
};

} // namespace zspawn
