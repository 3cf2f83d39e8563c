// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "zspawn/interface.h"

namespace zspawn {

// ensure vtable only here
interface::~interface() = default;

} // namespace zspawn
