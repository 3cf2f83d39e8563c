// SPDX-FileCopyrightText: 2022-2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include "zspawn/printer.h"

namespace zspawn::impl {

class table_printer final : public virtual zspawn::printer
{
public:
    explicit table_printer(std::ostream &out)
        : zspawn::printer(out)
    {
    }

    void print_records(const std::vector<container_record_t> &records) final;
};

static_assert(!std::is_abstract_v<table_printer>);

} // namespace zspawn::impl
