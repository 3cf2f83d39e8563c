// SPDX-FileCopyrightText: 2022-2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include "zspawn/command/options.h"

namespace zspawn::command {

void create(const global_options &global, const create_options &options);
// Returns non-zero when the operator did not confirm.
[[nodiscard]] int destroy(const global_options &global, const destroy_options &options);
void rename(const global_options &global, const rename_options &options);
void clone(const global_options &global, const clone_options &options);
void change_state(const global_options &global, const state_options &options);

} // namespace zspawn::command
