// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include "zspawn/interface.h"
#include "zspawn/process_runner.h"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace zspawn {

class supervisor : public virtual interface
{
public:
    [[nodiscard]] virtual auto running() const -> std::vector<std::string> = 0;
    virtual void start(const std::string &id) = 0;
    // Stopping an instance that is already gone is not an error.
    virtual void stop(const std::string &id) = 0;
    virtual void enable(const std::string &id) = 0;
    virtual void disable(const std::string &id) = 0;

    // Runs a command inside a running instance and waits for it. Output is
    // combined in process_result_t::out, a non-zero exit is not thrown.
    virtual auto run(const std::string &id,
                     const std::vector<std::string> &command,
                     std::optional<std::chrono::seconds> timeout = std::nullopt)
            -> process_result_t = 0;

    [[nodiscard]] virtual auto shell(const std::string &id) const -> exec_image_t = 0;

    // status, show and friends, arguments are forwarded verbatim
    [[nodiscard]] virtual auto inspect(const std::string &verb,
                                       const std::vector<std::string> &args) const
            -> exec_image_t = 0;
};

} // namespace zspawn
