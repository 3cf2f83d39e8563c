// SPDX-FileCopyrightText: 2022-2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "zspawn/command/exec.h"

#include "zspawn/runtime.h"

#include <iostream>

int zspawn::command::exec(const global_options &global, const exec_options &options)
{
    runtime_t runtime(global.config);
    return runtime.engine().exec(options.target, options.command, std::cout, options.timeout);
}
