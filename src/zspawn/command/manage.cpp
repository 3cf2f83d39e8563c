// SPDX-FileCopyrightText: 2022-2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "zspawn/command/manage.h"

#include "zspawn/runtime.h"

void zspawn::command::manage(const global_options &global, const manage_options &options)
{
    runtime_t runtime(global.config);
    auto &engine = runtime.engine();

    switch (options.field) {
    case manage_options::field_t::alias:
        engine.set_alias(options.ID, options.value);
        break;
    case manage_options::field_t::hostname:
        engine.set_hostname(options.ID, options.value);
        break;
    case manage_options::field_t::authorized_keys:
        engine.set_authorized_keys(options.ID, options.value);
        break;
    }
}
