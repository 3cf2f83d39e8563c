// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "zspawn/network.h"

#include "zspawn/readers.h"

#include <sstream>
#include <stdexcept>
#include <vector>

namespace {

auto split_octets(const std::string &address) -> std::vector<std::string>
{
    std::vector<std::string> octets;
    std::string octet;
    std::istringstream stream(address);
    while (std::getline(stream, octet, '.')) {
        octets.push_back(octet);
    }

    if (octets.size() != 4) {
        throw std::runtime_error("not an IPv4 address: " + address);
    }

    for (const auto &part : octets) {
        if (part.empty() || part.size() > 3
            || part.find_first_not_of("0123456789") != std::string::npos) {
            throw std::runtime_error("not an IPv4 address: " + address);
        }
    }

    return octets;
}

} // namespace

auto zspawn::parse_bridge_address(const std::string &bridge_network_config) -> std::string
{
    constexpr std::string_view key{ "Address=" };

    std::istringstream stream(bridge_network_config);
    std::string line;
    while (std::getline(stream, line)) {
        if (line.rfind(key, 0) == 0) {
            return trim(std::string_view{ line }.substr(key.size()));
        }
    }

    throw std::runtime_error("bridge network configuration has no Address= line");
}

auto zspawn::derive_network(const std::string &bridge_address, const std::string &id)
        -> container_network_t
{
    auto gateway = bridge_address.substr(0, bridge_address.find('/'));
    auto octets = split_octets(gateway);

    container_network_t network;
    network.address = octets[0] + "." + octets[1] + "." + octets[2] + "." + id + "/24";
    network.gateway = std::move(gateway);
    return network;
}

auto zspawn::render_network_config(const container_network_t &network) -> std::string
{
    std::stringstream ss;
    ss << "[Match]\n"
       << "Name=host0\n"
       << "\n"
       << "[Network]\n"
       << "Address=" << network.address << "\n"
       << "Gateway=" << network.gateway << "\n";
    return std::move(ss).str();
}

auto zspawn::render_nspawn_config(const std::string &bridge) -> std::string
{
    std::stringstream ss;
    ss << "[Exec]\n"
       << "Boot=yes\n"
       << "PrivateUsers=pick\n"
       << "LimitNOFILE=65536\n"
       << "\n"
       << "[Files]\n"
       << "PrivateUsersOwnership=auto\n"
       << "\n"
       << "[Network]\n"
       << "Bridge=" << bridge << "\n";
    return std::move(ss).str();
}
