// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace zspawn {

// Everything known about one container, rebuilt from the host on every reload.
struct container_record_t
{
    std::string ID;
    std::optional<std::string> alias;
    std::string hostname;
    std::vector<std::string> addresses;
    bool enabled{ false };
    bool running{ false };
    std::string used;
    std::string available;
    std::string referenced;
};

auto operator==(const container_record_t &lhs, const container_record_t &rhs) -> bool;
auto operator!=(const container_record_t &lhs, const container_record_t &rhs) -> bool;

auto record_to_json(const container_record_t &record) -> nlohmann::json;

} // namespace zspawn
