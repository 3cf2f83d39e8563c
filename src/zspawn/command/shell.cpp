// SPDX-FileCopyrightText: 2022-2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "zspawn/command/shell.h"

#include "zspawn/runtime.h"

auto zspawn::command::shell(const global_options &global, const shell_options &options)
        -> exec_image_t
{
    runtime_t runtime(global.config);
    return runtime.engine().shell(options.ID);
}

auto zspawn::command::inspect(const global_options &global, const inspect_options &options)
        -> exec_image_t
{
    runtime_t runtime(global.config);
    return runtime.engine().inspect(options.verb, options.args);
}
