// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include "zspawn/volume_manager.h"

#include <string>
#include <string_view>
#include <vector>

// Parsers for the text the attribute sources produce. None of them touches
// the host, container_store feeds them.
namespace zspawn {

auto trim(std::string_view str) -> std::string;

// Canonical decimal: digits only, no leading zero.
auto is_canonical_id(std::string_view id) noexcept -> bool;

// Numeric order for decimal names, other names after them in lexical order.
auto id_less(const std::string &lhs, const std::string &rhs) -> bool;

// `zfs list -H -o name,used,avail,refer -d 1 <dataset>` output, the dataset
// itself is skipped.
auto parse_volume_list(const std::string &output, const std::string &dataset)
        -> std::vector<volume_usage_t>;

// Drops backup subtrees and sorts the rest with id_less.
auto select_containers(std::vector<volume_usage_t> volumes, const std::string &backup_suffix)
        -> std::vector<volume_usage_t>;

// `machinectl list` output, first token of every machine line.
auto parse_running_list(const std::string &output) -> std::vector<std::string>;

// Values of `Address=` lines without their prefix length.
auto parse_addresses(const std::string &network_config) -> std::vector<std::string>;

} // namespace zspawn
