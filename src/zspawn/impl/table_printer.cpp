// SPDX-FileCopyrightText: 2022-2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "zspawn/impl/table_printer.h"

#include <algorithm>
#include <array>
#include <iomanip>
#include <iterator>

namespace {

constexpr std::size_t column_count = 9;
using row_t = std::array<std::string, column_count>;

auto or_dash(const std::string &value) -> std::string
{
    return value.empty() ? "-" : value;
}

auto yes_no(bool value) -> std::string
{
    return value ? "yes" : "no";
}

auto to_row(const zspawn::container_record_t &record) -> row_t
{
    return { record.ID,
             record.alias.value_or("-"),
             or_dash(record.hostname),
             record.addresses.empty() ? "-" : record.addresses.front(),
             yes_no(record.enabled),
             yes_no(record.running),
             or_dash(record.used),
             or_dash(record.available),
             or_dash(record.referenced) };
}

} // namespace

void zspawn::impl::table_printer::print_records(const std::vector<container_record_t> &records)
{
    std::vector<row_t> rows{
        { "ID", "ALIAS", "HOSTNAME", "ADDRESS", "ENABLED", "RUNNING", "USED", "AVAIL", "REFER" }
    };
    std::transform(records.cbegin(), records.cend(), std::back_inserter(rows), to_row);

    std::array<std::size_t, column_count> widths{};
    for (const auto &row : rows) {
        for (std::size_t i = 0; i < column_count; ++i) {
            widths[i] = std::max(widths[i], row[i].size());
        }
    }

    auto &os = out();
    for (const auto &row : rows) {
        for (std::size_t i = 0; i < column_count; ++i) {
            if (i + 1 == column_count) {
                os << row[i];
                break;
            }

            os << std::left << std::setw(static_cast<int>(widths[i] + 2)) << row[i];
        }
        os << '\n';
    }

    os.flush();
}
