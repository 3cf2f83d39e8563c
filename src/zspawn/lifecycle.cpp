// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "zspawn/lifecycle.h"

#include "zspawn/errors.h"
#include "zspawn/readers.h"
#include "zspawn/utils/log.h"

#include <array>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <istream>
#include <ostream>
#include <random>
#include <sstream>

namespace {

constexpr std::string_view destroy_keyword{ "DESTROY" };
constexpr std::string_view reserved_alias{ "all" };
constexpr std::string_view clone_prefix{ "cloned-" };

auto random_uuid() -> std::string
{
    std::random_device device;
    std::mt19937_64 engine(
            (static_cast<std::uint64_t>(device()) << 32U) ^ static_cast<std::uint64_t>(device()));
    std::uniform_int_distribution<int> byte(0, 255);

    std::array<int, 16> bytes{};
    for (auto &b : bytes) {
        b = byte(engine);
    }

    // RFC 4122 version 4, variant 1
    bytes[6] = (bytes[6] & 0x0f) | 0x40;
    bytes[8] = (bytes[8] & 0x3f) | 0x80;

    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            ss << '-';
        }
        ss << std::setw(2) << bytes[i];
    }

    return std::move(ss).str();
}

auto snapshot_label() -> std::string
{
    auto now = std::time(nullptr);
    std::tm utc{};
    gmtime_r(&now, &utc);

    std::stringstream ss;
    ss << "clone-" << std::put_time(&utc, "%Y%m%dT%H%M%SZ") << "-" << random_uuid();
    return std::move(ss).str();
}

auto describe(const zspawn::container_record_t &record) -> std::string
{
    if (!record.alias) {
        return record.ID;
    }

    return record.ID + " (" + *record.alias + ")";
}

auto ask(std::istream &in, std::ostream &out, const std::string &question) -> bool
{
    out << question << " Type " << destroy_keyword << " to continue: " << std::flush;

    std::string answer;
    if (!std::getline(in, answer)) {
        out << '\n';
        return false;
    }

    return answer == destroy_keyword;
}

void prefix_lines(std::ostream &out, const std::string &id, const std::string &text)
{
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        out << id << ": " << line << '\n';
    }
}

} // namespace

zspawn::lifecycle_engine::lifecycle_engine(container_store &store,
                                           volume_manager &volumes,
                                           supervisor &supervisor,
                                           package_installer &installer,
                                           utils::sleeper_t sleeper)
    : store_(store)
    , volumes_(volumes)
    , supervisor_(supervisor)
    , installer_(installer)
    , sleeper_(std::move(sleeper))
    , registry_(store.records())
{
}

void zspawn::lifecycle_engine::create(const std::string &id)
{
    if (!is_canonical_id(id) || id.size() > 3 || std::stoi(id) < min_container_id
        || std::stoi(id) > max_container_id) {
        throw precondition_error("container identifier must be a number between "
                                 + std::to_string(min_container_id) + " and "
                                 + std::to_string(max_container_id) + ", got \"" + id + "\"");
    }

    require_free(id);

    const auto &cfg = store_.get_config();
    ZSPAWN_NOTICE() << "creating container " << id;

    volumes_.create(id);
    installer_.bootstrap(cfg.root_of(id));
    store_.write_network_config(id);
    store_.write_supervisor_config(id);
    store_.link(id);
    supervisor_.enable(id);

    if (!store_.is_running(id)) {
        supervisor_.start(id);
    }
    wait_for(id, true);

    // let the init system come up before talking to it
    sleeper_(std::chrono::seconds{ 1 });

    run_inside(id, { "timedatectl", "set-timezone", cfg.bootstrap.timezone });
    run_inside(id, { "localectl", "set-locale", "LANG=" + cfg.bootstrap.locale });

    ZSPAWN_NOTICE() << "container " << id << " created";
}

auto zspawn::lifecycle_engine::destroy(const std::string &name, std::istream &in, std::ostream &out)
        -> bool
{
    const auto &record = require_existing(name);
    if (record.running) {
        throw precondition_error("container " + describe(record) + " is running, stop it first");
    }

    if (record.enabled) {
        throw precondition_error("container " + describe(record)
                                 + " is enabled, disable it first");
    }

    if (!ask(in, out, "Container " + describe(record) + " and all its data will be destroyed.")
        || !ask(in, out, "This cannot be undone.")) {
        out << "Aborted." << std::endl;
        return false;
    }

    const auto id = record.ID;
    ZSPAWN_NOTICE() << "destroying container " << id;

    store_.unlink(id);
    store_.remove_supervisor_config(id);
    volumes_.destroy(id);

    ZSPAWN_NOTICE() << "container " << id << " destroyed";
    return true;
}

void zspawn::lifecycle_engine::rename(const std::string &name, const std::string &to)
{
    require_identifier(to);
    const auto &record = require_existing(name);
    require_free(to);
    if (record.running) {
        throw precondition_error("container " + describe(record) + " is running, stop it first");
    }

    const auto from = record.ID;
    const auto was_enabled = record.enabled;
    ZSPAWN_NOTICE() << "renaming container " << from << " to " << to;

    if (was_enabled) {
        supervisor_.disable(from);
    }

    volumes_.rename(from, to);
    store_.move_supervisor_config(from, to);
    store_.unlink(from);
    store_.link(to);
    store_.write_network_config(to);

    if (was_enabled) {
        supervisor_.enable(to);
    }
}

void zspawn::lifecycle_engine::clone(const std::string &name, const std::string &to)
{
    require_identifier(to);
    const auto &record = require_existing(name);
    require_free(to);
    if (record.running) {
        throw precondition_error("container " + describe(record) + " is running, stop it first");
    }

    std::optional<std::string> alias;
    if (record.alias) {
        alias = std::string{ clone_prefix } + *record.alias;
        if (registry_.contains(*alias)) {
            throw precondition_error("alias \"" + *alias + "\" is already taken");
        }
    }

    std::optional<std::string> hostname;
    if (!record.hostname.empty()) {
        hostname = std::string{ clone_prefix } + record.hostname;
    }

    const auto from = record.ID;
    const auto enabled = record.enabled;
    const auto label = snapshot_label();
    ZSPAWN_NOTICE() << "cloning container " << from << " to " << to << " via @" << label;

    volumes_.snapshot(from, label);
    volumes_.transfer(from, label, to);
    volumes_.destroy_snapshot(from, label);
    volumes_.destroy_snapshot(to, label);

    store_.write_network_config(to);
    store_.write_supervisor_config(to);
    store_.link(to);

    if (alias) {
        store_.write_alias(to, *alias);
    }

    if (hostname) {
        store_.write_hostname(to, *hostname);
    }

    if (enabled) {
        supervisor_.enable(to);
    }
}

void zspawn::lifecycle_engine::start(const std::string &name)
{
    auto id = translate(name);
    if (!store_.is_running(id)) {
        supervisor_.start(id);
    }

    wait_for(id, true);
}

void zspawn::lifecycle_engine::stop(const std::string &name)
{
    auto id = translate(name);
    if (store_.is_running(id)) {
        supervisor_.stop(id);
    }

    wait_for(id, false);
}

void zspawn::lifecycle_engine::restart(const std::string &name)
{
    stop(name);
    start(name);
}

void zspawn::lifecycle_engine::enable(const std::string &name)
{
    supervisor_.enable(translate(name));
}

void zspawn::lifecycle_engine::disable(const std::string &name)
{
    supervisor_.disable(translate(name));
}

void zspawn::lifecycle_engine::set_alias(const std::string &name, const std::string &alias)
{
    const auto &record = require_existing(name);
    auto value = trim(alias);

    if (value == reserved_alias) {
        throw precondition_error("\"" + value + "\" is reserved and cannot be an alias");
    }

    if (value.empty()) {
        throw precondition_error("alias must not be empty");
    }

    if (store_.find(value) != nullptr) {
        throw precondition_error("alias \"" + value + "\" is the identifier of a container");
    }

    if (auto owner = registry_.resolve(value); owner && *owner != record.ID) {
        throw precondition_error("alias \"" + value + "\" is already used by container " + *owner);
    }

    ZSPAWN_INFO() << "container " << record.ID << " alias " << value;
    store_.write_alias(record.ID, value);
}

void zspawn::lifecycle_engine::set_hostname(const std::string &name, const std::string &hostname)
{
    const auto &record = require_existing(name);
    auto value = trim(hostname);
    if (value.empty()) {
        throw precondition_error("hostname must not be empty");
    }

    if (record.running) {
        run_inside(record.ID, { "hostnamectl", "set-hostname", value });
        return;
    }

    store_.write_hostname(record.ID, value);
}

void zspawn::lifecycle_engine::set_authorized_keys(const std::string &name,
                                                   const std::filesystem::path &keys_file)
{
    const auto &record = require_existing(name);

    auto keys = store_.read_host_file(keys_file);
    if (!keys) {
        throw precondition_error("cannot read " + keys_file.string());
    }

    store_.write_authorized_keys(record.ID, *keys);
}

auto zspawn::lifecycle_engine::exec(const std::string &target,
                                    const std::vector<std::string> &command,
                                    std::ostream &out,
                                    std::optional<std::chrono::seconds> timeout) -> int
{
    if (command.empty()) {
        throw precondition_error("no command given");
    }

    const bool every = target == reserved_alias;

    std::vector<std::string> targets;
    if (every) {
        targets = store_.running_ids();
    } else {
        targets.push_back(require_existing(target).ID);
    }

    int code{ 0 };
    for (const auto &id : targets) {
        auto result = supervisor_.run(id, command, timeout);
        prefix_lines(out, id, result.out);

        if (result.timed_out) {
            out << id << ": timed out" << std::endl;
        } else if (every || result.exit_code != 0) {
            out << id << ": exit status " << result.exit_code << std::endl;
        }

        if (code == 0 && !result.success()) {
            code = result.exit_code != 0 ? result.exit_code : 1;
        }
    }

    return code;
}

auto zspawn::lifecycle_engine::shell(const std::string &name) const -> exec_image_t
{
    return supervisor_.shell(require_existing(name).ID);
}

auto zspawn::lifecycle_engine::inspect(const std::string &verb,
                                       const std::vector<std::string> &args) const -> exec_image_t
{
    return supervisor_.inspect(verb, registry_.translate(args));
}

auto zspawn::lifecycle_engine::require_existing(const std::string &name) const
        -> const container_record_t &
{
    auto id = registry_.resolve(name);
    const auto *record = id ? store_.find(*id) : nullptr;
    if (record == nullptr) {
        throw precondition_error("no such container: " + name);
    }

    return *record;
}

void zspawn::lifecycle_engine::require_identifier(const std::string &id)
{
    if (!is_canonical_id(id)) {
        throw precondition_error("container identifier must be a decimal number without leading "
                                 "zeros, got \"" + id + "\"");
    }
}

void zspawn::lifecycle_engine::require_free(const std::string &id) const
{
    if (store_.find(id) != nullptr) {
        throw precondition_error("container " + id + " already exists");
    }

    if (auto owner = registry_.resolve(id); owner) {
        throw precondition_error("\"" + id + "\" is already an alias of container " + *owner);
    }
}

auto zspawn::lifecycle_engine::translate(const std::string &name) const -> std::string
{
    return registry_.translate({ name }).front();
}

void zspawn::lifecycle_engine::wait_for(const std::string &id, bool running)
{
    const auto &polling = store_.get_config().polling;
    utils::wait_policy_t policy{ polling.interval, polling.timeout };

    ZSPAWN_DEBUG() << "waiting for " << id << " to " << (running ? "start" : "stop");
    auto reached = utils::wait_until(
            [this, &id, running]() {
                return store_.is_running(id) == running;
            },
            policy,
            sleeper_);

    if (!reached) {
        throw std::runtime_error("container " + id + " did not " + (running ? "start" : "stop")
                                 + " in time");
    }
}

void zspawn::lifecycle_engine::run_inside(const std::string &id,
                                          const std::vector<std::string> &command)
{
    auto result = supervisor_.run(id, command);
    if (result.success()) {
        return;
    }

    throw command_error(command, result.exit_code, result.out, result.err, result.timed_out);
}
