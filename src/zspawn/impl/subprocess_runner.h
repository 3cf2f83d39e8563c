// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include "zspawn/process_runner.h"

namespace zspawn::impl {

// Runs commands with fork and execvp, collecting stdout and stderr.
class subprocess_runner final : public virtual zspawn::process_runner
{
protected:
    auto execute(const std::vector<std::string> &args, const run_options_t &options)
            -> process_result_t final;
};

static_assert(!std::is_abstract_v<subprocess_runner>);

} // namespace zspawn::impl
