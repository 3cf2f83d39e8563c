// SPDX-FileCopyrightText: 2022-2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include "zspawn/command/options.h"

namespace zspawn::command {

// Returns the first non-zero exit code of the command.
[[nodiscard]] int exec(const global_options &global, const exec_options &options);

} // namespace zspawn::command
