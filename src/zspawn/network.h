// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include <string>

namespace zspawn {

struct container_network_t
{
    // with prefix length, e.g. 172.17.0.105/24
    std::string address;
    std::string gateway;
};

// First Address= value of the bridge's network file, prefix length kept.
auto parse_bridge_address(const std::string &bridge_network_config) -> std::string;

// The container takes the bridge's /24 with its identifier as last octet and
// the bridge as gateway.
auto derive_network(const std::string &bridge_address, const std::string &id)
        -> container_network_t;

auto render_network_config(const container_network_t &network) -> std::string;

// systemd-nspawn settings shared by every container.
auto render_nspawn_config(const std::string &bridge) -> std::string;

} // namespace zspawn
