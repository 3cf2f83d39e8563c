// SPDX-FileCopyrightText: 2022-2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include "zspawn/command/options.h"
#include "zspawn/process_runner.h"

namespace zspawn::command {

// Both return the command line the caller should replace itself with.
[[nodiscard]] auto shell(const global_options &global, const shell_options &options)
        -> exec_image_t;
[[nodiscard]] auto inspect(const global_options &global, const inspect_options &options)
        -> exec_image_t;

} // namespace zspawn::command
