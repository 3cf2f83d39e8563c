// SPDX-FileCopyrightText: 2022-2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "zspawn/command/list.h"

#include "zspawn/impl/json_printer.h"
#include "zspawn/impl/table_printer.h"
#include "zspawn/runtime.h"

#include <iostream>
#include <memory>

int zspawn::command::list(const global_options &global, const list_options &options)
{
    runtime_t runtime(global.config);

    std::unique_ptr<printer> printer;
    if (options.output_format == list_options::output_format_t::json) {
        printer = std::make_unique<impl::json_printer>(std::cout);
    } else {
        printer = std::make_unique<impl::table_printer>(std::cout);
    }

    printer->print_records(runtime.store().records());
    return 0;
}
