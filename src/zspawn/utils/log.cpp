// SPDX-FileCopyrightText: 2022-2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "zspawn/utils/log.h"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <iostream>

#include <unistd.h>

#ifndef ZSPAWN_LOG_DEFAULT_LEVEL
#define ZSPAWN_LOG_DEFAULT_LEVEL LOG_NOTICE
#endif

namespace zspawn::utils {

template<unsigned int level>
Logger<level>::~Logger() noexcept
{
    if (level > get_current_log_level()) {
        return;
    }

    ss.flush();
    auto str = ss.str();

    syslog(level, "%s", str.c_str());

    // errors are meant for the operator, even when stderr is redirected
    if (level > LOG_ERR && !stderr_is_a_tty() && !force_log_to_stderr()) {
        return;
    }

    if (!stderr_is_a_tty()) {
        std::cerr << "zspawn: " << str << '\n';
        std::cerr.flush();
        return;
    }

    if constexpr (level <= LOG_ERR) {
        std::cerr << "\033[31m\033[1m";
    } else if constexpr (level <= LOG_WARNING) {
        std::cerr << "\033[33m\033[1m";
    } else if constexpr (level <= LOG_INFO) {
        std::cerr << "\033[34m";
    } else {
        std::cerr << "\033[0m";
    }

    if (get_current_log_level() >= LOG_DEBUG) {
        auto now = std::chrono::duration_cast<std::chrono::nanoseconds>(
                std::chrono::steady_clock::now().time_since_epoch());
        std::cerr << "TIME=" << now.count() << " ";
    }

    std::cerr << str << "\033[0m" << '\n';
    std::cerr.flush();
}

template class Logger<LOG_ERR>;
template class Logger<LOG_WARNING>;
template class Logger<LOG_NOTICE>;
template class Logger<LOG_INFO>;
template class Logger<LOG_DEBUG>;

auto force_log_to_stderr() -> bool
{
    static const auto *result = getenv("ZSPAWN_LOG_FORCE_STDERR");
    return result != nullptr;
}

auto stderr_is_a_tty() -> bool
{
    static const bool result = isatty(fileno(stderr)) != 0;
    return result;
}

namespace {
auto get_current_log_level_from_env() -> unsigned int
{
    auto *env = getenv("ZSPAWN_LOG_LEVEL");
    if (env == nullptr) {
        return ZSPAWN_LOG_DEFAULT_LEVEL;
    }

    int ret{ 0 };
    try {
        ret = std::stoi(env);
    } catch (const std::exception &) {
        return ZSPAWN_LOG_DEFAULT_LEVEL;
    }

    if (ret < 0) {
        return LOG_ERR;
    }

    auto level = static_cast<unsigned int>(ret);
    if (level > LOG_DEBUG) {
        return LOG_DEBUG;
    }

    return level;
}
} // namespace

auto get_current_log_level() -> unsigned int
{
    static const unsigned int level = get_current_log_level_from_env();
    return level;
}

} // namespace zspawn::utils
