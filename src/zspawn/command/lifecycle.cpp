// SPDX-FileCopyrightText: 2022-2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "zspawn/command/lifecycle.h"

#include "zspawn/runtime.h"
#include "zspawn/utils/log.h"

#include <iostream>

void zspawn::command::create(const global_options &global, const create_options &options)
{
    runtime_t runtime(global.config);
    runtime.engine().create(options.ID);
    ZSPAWN_INFO() << "container " << options.ID << " created";
}

int zspawn::command::destroy(const global_options &global, const destroy_options &options)
{
    runtime_t runtime(global.config);
    if (!runtime.engine().destroy(options.ID, std::cin, std::cout)) {
        return 1;
    }

    return 0;
}

void zspawn::command::rename(const global_options &global, const rename_options &options)
{
    runtime_t runtime(global.config);
    runtime.engine().rename(options.from, options.to);
}

void zspawn::command::clone(const global_options &global, const clone_options &options)
{
    runtime_t runtime(global.config);
    runtime.engine().clone(options.from, options.to);
}

void zspawn::command::change_state(const global_options &global, const state_options &options)
{
    runtime_t runtime(global.config);
    auto &engine = runtime.engine();

    for (const auto &name : options.IDs) {
        switch (options.action) {
        case state_options::action_t::start:
            engine.start(name);
            break;
        case state_options::action_t::stop:
            engine.stop(name);
            break;
        case state_options::action_t::restart:
            engine.restart(name);
            break;
        case state_options::action_t::enable:
            engine.enable(name);
            break;
        case state_options::action_t::disable:
            engine.disable(name);
            break;
        }
    }
}
