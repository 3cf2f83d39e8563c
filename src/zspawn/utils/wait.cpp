// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "zspawn/utils/wait.h"

#include <stdexcept>
#include <thread>

namespace zspawn::utils {

auto real_sleeper() -> sleeper_t
{
    return [](std::chrono::milliseconds duration) {
        std::this_thread::sleep_for(duration);
    };
}

auto wait_until(const std::function<bool()> &predicate,
                const wait_policy_t &policy,
                const sleeper_t &sleep) -> bool
{
    if (policy.interval.count() <= 0) {
        throw std::invalid_argument("poll interval must be positive");
    }

    std::chrono::milliseconds waited{ 0 };
    while (!predicate()) {
        if (policy.deadline && waited >= *policy.deadline) {
            return false;
        }

        sleep(policy.interval);
        waited += policy.interval;
    }

    return true;
}

} // namespace zspawn::utils
