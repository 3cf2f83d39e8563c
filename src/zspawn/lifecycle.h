// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include "zspawn/container_store.h"
#include "zspawn/name_registry.h"
#include "zspawn/package_installer.h"
#include "zspawn/supervisor.h"
#include "zspawn/utils/wait.h"
#include "zspawn/volume_manager.h"

#include <chrono>
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace zspawn {

constexpr int min_container_id = 1;
constexpr int max_container_id = 253;

// The state changing operations. Each one validates its preconditions against
// the loaded store before calling any collaborator, then runs its steps in
// order without rollback.
class lifecycle_engine
{
public:
    // The store must already be loaded.
    lifecycle_engine(container_store &store,
                     volume_manager &volumes,
                     supervisor &supervisor,
                     package_installer &installer,
                     utils::sleeper_t sleeper = utils::real_sleeper());

    [[nodiscard]] auto registry() const noexcept -> const name_registry & { return registry_; }

    void create(const std::string &id);

    // Returns false when the operator did not confirm, nothing is touched then.
    [[nodiscard]] auto destroy(const std::string &name, std::istream &in, std::ostream &out)
            -> bool;

    void rename(const std::string &name, const std::string &to);
    void clone(const std::string &name, const std::string &to);

    void start(const std::string &name);
    void stop(const std::string &name);
    void restart(const std::string &name);
    void enable(const std::string &name);
    void disable(const std::string &name);

    void set_alias(const std::string &name, const std::string &alias);
    void set_hostname(const std::string &name, const std::string &hostname);
    void set_authorized_keys(const std::string &name, const std::filesystem::path &keys_file);

    // Runs command in one container, or in every running one for "all".
    // Output lines are prefixed with the container identifier. Returns the
    // first non-zero exit code.
    auto exec(const std::string &target,
              const std::vector<std::string> &command,
              std::ostream &out,
              std::optional<std::chrono::seconds> timeout = std::nullopt) -> int;

    [[nodiscard]] auto shell(const std::string &name) const -> exec_image_t;
    [[nodiscard]] auto inspect(const std::string &verb, const std::vector<std::string> &args) const
            -> exec_image_t;

private:
    [[nodiscard]] auto require_existing(const std::string &name) const -> const container_record_t &;
    static void require_identifier(const std::string &id);
    void require_free(const std::string &id) const;
    [[nodiscard]] auto translate(const std::string &name) const -> std::string;
    void wait_for(const std::string &id, bool running);
    void run_inside(const std::string &id, const std::vector<std::string> &command);

    container_store &store_;
    volume_manager &volumes_;
    supervisor &supervisor_;
    package_installer &installer_;
    utils::sleeper_t sleeper_;
    name_registry registry_;
};

} // namespace zspawn
