// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "zspawn/container_record.h"

#include <tuple>

namespace zspawn {

auto operator==(const container_record_t &lhs, const container_record_t &rhs) -> bool
{
    auto tie = [](const container_record_t &record) {
        return std::tie(record.ID,
                        record.alias,
                        record.hostname,
                        record.addresses,
                        record.enabled,
                        record.running,
                        record.used,
                        record.available,
                        record.referenced);
    };

    return tie(lhs) == tie(rhs);
}

auto operator!=(const container_record_t &lhs, const container_record_t &rhs) -> bool
{
    return !(lhs == rhs);
}

auto record_to_json(const container_record_t &record) -> nlohmann::json
{
    return nlohmann::json::object({ { "id", record.ID },
                                    { "alias", record.alias ? nlohmann::json(*record.alias)
                                                            : nlohmann::json(nullptr) },
                                    { "hostname", record.hostname },
                                    { "addresses", record.addresses },
                                    { "enabled", record.enabled },
                                    { "running", record.running },
                                    { "used", record.used },
                                    { "available", record.available },
                                    { "referenced", record.referenced } });
}

} // namespace zspawn
