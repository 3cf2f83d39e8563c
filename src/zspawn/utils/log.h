// SPDX-FileCopyrightText: 2022-2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include <sstream>

#include <syslog.h>

namespace zspawn::utils {

auto force_log_to_stderr() -> bool;
auto stderr_is_a_tty() -> bool;
auto get_current_log_level() -> unsigned int;

template<unsigned int level>
class Logger
{
public:
    Logger() = default;
    Logger(const Logger &) = delete;
    auto operator=(const Logger &) -> Logger & = delete;
    Logger(Logger &&) noexcept(std::is_nothrow_move_constructible_v<std::ostringstream>) = // NOLINT
            default;
    Logger &
    operator=(Logger &&) noexcept(std::is_nothrow_move_assignable_v<std::ostringstream>) = // NOLINT
            default;
    ~Logger() noexcept;

    template<typename T>
    auto operator<<(const T &value) -> Logger &
    {
        ss << value;
        return *this;
    }

    auto operator<<(std::ostream &(*manipulator)(std::ostream &)) -> Logger &
    {
        manipulator(ss);
        return *this;
    }

private:
    std::ostringstream ss;
};

extern template class Logger<LOG_ERR>;
extern template class Logger<LOG_WARNING>;
extern template class Logger<LOG_NOTICE>;
extern template class Logger<LOG_INFO>;
extern template class Logger<LOG_DEBUG>;
} // namespace zspawn::utils

#ifndef ZSPAWN_LOG_ENABLE_SOURCE_LOCATION
#define ZSPAWN_LOG_ENABLE_SOURCE_LOCATION 0
#endif

#define ZSPAWN_STRINGIZE_DETAIL(x) #x
#define ZSPAWN_STRINGIZE(x) ZSPAWN_STRINGIZE_DETAIL(x)

#if ZSPAWN_LOG_ENABLE_SOURCE_LOCATION
#define ZSPAWN_LOG_SOURCE_LOCATION \
    << "SOURCE=" __FILE__ ":" ZSPAWN_STRINGIZE(__LINE__) << ' ' << __PRETTY_FUNCTION__ << ' '
#else
#define ZSPAWN_LOG_SOURCE_LOCATION
#endif

#define ZSPAWN_LOG(level)                                                           \
    if (__builtin_expect(level <= ::zspawn::utils::get_current_log_level(), false)) \
    ::zspawn::utils::Logger<level>() ZSPAWN_LOG_SOURCE_LOCATION

#ifndef ZSPAWN_ACTIVE_LOG_LEVEL
#define ZSPAWN_ACTIVE_LOG_LEVEL LOG_DEBUG
#endif

#if ZSPAWN_ACTIVE_LOG_LEVEL >= LOG_ERR
#define ZSPAWN_ERR() ZSPAWN_LOG(LOG_ERR)
#else
#define ZSPAWN_ERR()     \
    if constexpr (false) \
        std::stringstream { }
#endif

#if ZSPAWN_ACTIVE_LOG_LEVEL >= LOG_WARNING
#define ZSPAWN_WARNING() ZSPAWN_LOG(LOG_WARNING)
#else
#define ZSPAWN_WARNING() \
    if constexpr (false) \
        std::stringstream { }
#endif

#if ZSPAWN_ACTIVE_LOG_LEVEL >= LOG_NOTICE
#define ZSPAWN_NOTICE() ZSPAWN_LOG(LOG_NOTICE)
#else
#define ZSPAWN_NOTICE()  \
    if constexpr (false) \
        std::stringstream { }
#endif

#if ZSPAWN_ACTIVE_LOG_LEVEL >= LOG_INFO
#define ZSPAWN_INFO() ZSPAWN_LOG(LOG_INFO)
#else
#define ZSPAWN_INFO()    \
    if constexpr (false) \
        std::stringstream { }
#endif

#if ZSPAWN_ACTIVE_LOG_LEVEL >= LOG_DEBUG
#define ZSPAWN_DEBUG() ZSPAWN_LOG(LOG_DEBUG)
#else
#define ZSPAWN_DEBUG()   \
    if constexpr (false) \
        std::stringstream { }
#endif
