// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include "zspawn/process_runner.h"
#include "zspawn/supervisor.h"

namespace zspawn::impl {

// systemd-machined front end: machinectl for the lifecycle and
// systemd-run --machine for commands inside an instance.
class machinectl_supervisor final : public virtual zspawn::supervisor
{
public:
    explicit machinectl_supervisor(process_runner &runner);

    [[nodiscard]] auto running() const -> std::vector<std::string> final;
    void start(const std::string &id) final;
    void stop(const std::string &id) final;
    void enable(const std::string &id) final;
    void disable(const std::string &id) final;
    auto run(const std::string &id,
             const std::vector<std::string> &command,
             std::optional<std::chrono::seconds> timeout) -> process_result_t final;
    [[nodiscard]] auto shell(const std::string &id) const -> exec_image_t final;
    [[nodiscard]] auto inspect(const std::string &verb, const std::vector<std::string> &args) const
            -> exec_image_t final;

private:
    process_runner &runner_;
};

static_assert(!std::is_abstract_v<machinectl_supervisor>);

} // namespace zspawn::impl
