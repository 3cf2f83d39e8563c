// SPDX-FileCopyrightText: 2022-2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include "zspawn/utils/file_describer.h"

#include <utility>

namespace zspawn::utils {

// Returns {read end, write end}, both close-on-exec.
auto pipe() -> std::pair<file_descriptor, file_descriptor>;

} // namespace zspawn::utils
