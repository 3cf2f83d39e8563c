// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include <chrono>
#include <functional>
#include <optional>

namespace zspawn::utils {

using sleeper_t = std::function<void(std::chrono::milliseconds)>;

struct wait_policy_t
{
    std::chrono::milliseconds interval{ 100 };
    // no deadline means wait forever
    std::optional<std::chrono::milliseconds> deadline;
};

auto real_sleeper() -> sleeper_t;

// Polls predicate until it holds. Returns false once the accumulated sleep time
// reaches the deadline of the policy.
auto wait_until(const std::function<bool()> &predicate,
                const wait_policy_t &policy,
                const sleeper_t &sleep) -> bool;

} // namespace zspawn::utils
