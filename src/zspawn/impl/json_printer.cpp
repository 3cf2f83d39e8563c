// SPDX-FileCopyrightText: 2022-2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "zspawn/impl/json_printer.h"

#include <nlohmann/json.hpp>

void zspawn::impl::json_printer::print_records(const std::vector<container_record_t> &records)
{
    auto j = nlohmann::json::array();
    for (const auto &record : records) {
        j += record_to_json(record);
    }

    out() << j.dump(4) << std::endl;
}
