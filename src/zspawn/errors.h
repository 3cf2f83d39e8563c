// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace zspawn {

// The registry cannot be built because two names collide.
class consistency_error : public std::logic_error
{
public:
    explicit consistency_error(const std::string &message);
    consistency_error(const consistency_error &) = default;
    consistency_error(consistency_error &&) noexcept = default;
    auto operator=(const consistency_error &) -> consistency_error & = default;
    auto operator=(consistency_error &&) noexcept -> consistency_error & = default;
    ~consistency_error() noexcept override;
};

// A lifecycle operation was refused before touching the host.
class precondition_error : public std::invalid_argument
{
public:
    explicit precondition_error(const std::string &message);
    precondition_error(const precondition_error &) = default;
    precondition_error(precondition_error &&) noexcept = default;
    auto operator=(const precondition_error &) -> precondition_error & = default;
    auto operator=(precondition_error &&) noexcept -> precondition_error & = default;
    ~precondition_error() noexcept override;
};

// A required external command exited abnormally.
class command_error : public std::runtime_error
{
public:
    command_error(std::vector<std::string> args,
                  int exit_code,
                  std::string out,
                  std::string err,
                  bool timed_out = false);
    command_error(const command_error &) = default;
    command_error(command_error &&) noexcept = default;
    auto operator=(const command_error &) -> command_error & = default;
    auto operator=(command_error &&) noexcept -> command_error & = default;
    ~command_error() noexcept override;

    [[nodiscard]] auto args() const noexcept -> const std::vector<std::string> & { return args_; }

    [[nodiscard]] auto exit_code() const noexcept -> int { return exit_code_; }

    [[nodiscard]] auto out() const noexcept -> const std::string & { return out_; }

    [[nodiscard]] auto err() const noexcept -> const std::string & { return err_; }

private:
    std::vector<std::string> args_;
    int exit_code_;
    std::string out_;
    std::string err_;
};

auto join_args(const std::vector<std::string> &args) -> std::string;

} // namespace zspawn
