// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "zspawn/name_registry.h"

#include "zspawn/errors.h"

zspawn::name_registry::name_registry(const std::vector<container_record_t> &records)
{
    for (const auto &record : records) {
        names_.emplace(record.ID, record.ID);
    }

    for (const auto &record : records) {
        if (!record.alias) {
            continue;
        }

        const auto &alias = *record.alias;
        auto [it, inserted] = names_.emplace(alias, record.ID);
        if (inserted) {
            continue;
        }

        if (it->first == it->second) {
            throw consistency_error("alias \"" + alias + "\" of container " + record.ID
                                    + " is the identifier of a container");
        }

        throw consistency_error("alias \"" + alias + "\" is used by containers " + it->second
                                + " and " + record.ID);
    }
}

auto zspawn::name_registry::translate(const std::vector<std::string> &names) const
        -> std::vector<std::string>
{
    std::vector<std::string> result;
    result.reserve(names.size());
    for (const auto &name : names) {
        auto it = names_.find(name);
        result.push_back(it == names_.end() ? name : it->second);
    }

    return result;
}

auto zspawn::name_registry::resolve(const std::string &name) const -> std::optional<std::string>
{
    auto it = names_.find(name);
    if (it == names_.end()) {
        return std::nullopt;
    }

    return it->second;
}

auto zspawn::name_registry::contains(const std::string &name) const -> bool
{
    return names_.count(name) != 0;
}
