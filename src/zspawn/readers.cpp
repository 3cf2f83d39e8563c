// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "zspawn/readers.h"

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace {

auto split(const std::string &line, char delimiter) -> std::vector<std::string>
{
    std::vector<std::string> fields;
    std::string field;
    std::istringstream stream(line);
    while (std::getline(stream, field, delimiter)) {
        fields.push_back(field);
    }

    return fields;
}

auto ends_with(std::string_view str, std::string_view suffix) noexcept -> bool
{
    return str.size() >= suffix.size() && str.substr(str.size() - suffix.size()) == suffix;
}

constexpr std::string_view whitespace{ " \t\r\n\v\f" };

} // namespace

auto zspawn::trim(std::string_view str) -> std::string
{
    auto begin = str.find_first_not_of(whitespace);
    if (begin == std::string_view::npos) {
        return {};
    }

    auto end = str.find_last_not_of(whitespace);
    return std::string{ str.substr(begin, end - begin + 1) };
}

auto zspawn::is_canonical_id(std::string_view id) noexcept -> bool
{
    if (id.empty() || id.front() == '0') {
        return false;
    }

    return std::all_of(id.cbegin(), id.cend(), [](char c) {
        return c >= '0' && c <= '9';
    });
}

auto zspawn::id_less(const std::string &lhs, const std::string &rhs) -> bool
{
    auto lhs_numeric = is_canonical_id(lhs);
    auto rhs_numeric = is_canonical_id(rhs);
    if (lhs_numeric != rhs_numeric) {
        return lhs_numeric;
    }

    if (!lhs_numeric) {
        return lhs < rhs;
    }

    // canonical decimals compare by length first
    if (lhs.size() != rhs.size()) {
        return lhs.size() < rhs.size();
    }

    return lhs < rhs;
}

auto zspawn::parse_volume_list(const std::string &output, const std::string &dataset)
        -> std::vector<volume_usage_t>
{
    std::vector<volume_usage_t> volumes;
    const auto prefix = dataset + "/";

    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        if (trim(line).empty()) {
            continue;
        }

        auto fields = split(line, '\t');
        if (fields.size() != 4) {
            throw std::runtime_error("unexpected volume list line: " + line);
        }

        const auto &name = fields[0];
        if (name == dataset) {
            continue;
        }

        if (name.rfind(prefix, 0) != 0) {
            throw std::runtime_error("volume " + name + " is not below " + dataset);
        }

        auto leaf = name.substr(prefix.size());
        if (leaf.empty() || leaf.find('/') != std::string::npos) {
            continue;
        }

        volumes.push_back({ std::move(leaf), fields[1], fields[2], fields[3] });
    }

    return volumes;
}

auto zspawn::select_containers(std::vector<volume_usage_t> volumes,
                               const std::string &backup_suffix) -> std::vector<volume_usage_t>
{
    if (!backup_suffix.empty()) {
        volumes.erase(std::remove_if(volumes.begin(),
                                     volumes.end(),
                                     [&backup_suffix](const volume_usage_t &volume) {
                                         return ends_with(volume.name, backup_suffix);
                                     }),
                      volumes.end());
    }

    std::stable_sort(volumes.begin(),
                     volumes.end(),
                     [](const volume_usage_t &lhs, const volume_usage_t &rhs) {
                         return id_less(lhs.name, rhs.name);
                     });

    return volumes;
}

auto zspawn::parse_running_list(const std::string &output) -> std::vector<std::string>
{
    std::vector<std::string> ids;

    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        auto trimmed = trim(line);
        if (trimmed.empty()) {
            continue;
        }

        // footer: "3 machines listed." or "No machines."
        if (ends_with(trimmed, "listed.") || trimmed == "No machines.") {
            continue;
        }

        std::istringstream tokens(trimmed);
        std::string first;
        tokens >> first;
        if (first == "MACHINE") {
            continue;
        }

        ids.push_back(first);
    }

    return ids;
}

auto zspawn::parse_addresses(const std::string &network_config) -> std::vector<std::string>
{
    constexpr std::string_view key{ "Address=" };
    std::vector<std::string> addresses;

    std::istringstream stream(network_config);
    std::string line;
    while (std::getline(stream, line)) {
        if (line.rfind(key, 0) != 0) {
            continue;
        }

        auto value = trim(std::string_view{ line }.substr(key.size()));
        auto slash = value.find('/');
        if (slash != std::string::npos) {
            value.erase(slash);
        }

        if (!value.empty()) {
            addresses.push_back(std::move(value));
        }
    }

    return addresses;
}
