// SPDX-FileCopyrightText: 2022-2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include "zspawn/command/options.h"

namespace zspawn::command {

[[nodiscard]] int list(const global_options &global, const list_options &options);

} // namespace zspawn::command
