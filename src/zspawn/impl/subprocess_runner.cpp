// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "zspawn/impl/subprocess_runner.h"

#include "zspawn/utils/log.h"
#include "zspawn/utils/pipe.h"
#include "zspawn/utils/process.h"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <system_error>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace {

[[noreturn]] void exec_child(const std::vector<std::string> &args,
                             const zspawn::utils::file_descriptor &out,
                             const zspawn::utils::file_descriptor &err,
                             bool merge_output) noexcept
{
    auto null_fd = ::open("/dev/null", O_RDONLY);
    if (null_fd >= 0) {
        ::dup2(null_fd, STDIN_FILENO);
        ::close(null_fd);
    }

    ::dup2(out.get(), STDOUT_FILENO);
    ::dup2(merge_output ? out.get() : err.get(), STDERR_FILENO);

    std::vector<const char *> c_args;
    c_args.reserve(args.size() + 1);
    for (const auto &arg : args) {
        c_args.push_back(arg.c_str());
    }
    c_args.push_back(nullptr);

    ::execvp(c_args[0], const_cast<char *const *>(c_args.data()));

    // stderr already points at the pipe
    auto message = std::string{ "execvp " } + args[0] + ": " + ::strerror(errno) + "\n";
    [[maybe_unused]] auto ret = ::write(STDERR_FILENO, message.data(), message.size());
    ::_exit(127);
}

} // namespace

auto zspawn::impl::subprocess_runner::execute(const std::vector<std::string> &args,
                                              const run_options_t &options) -> process_result_t
{
    auto [out_read, out_write] = utils::pipe();
    auto [err_read, err_write] = utils::pipe();

    auto pid = fork();
    if (pid < 0) {
        throw std::system_error(errno, std::generic_category(), "fork");
    }

    if (pid == 0) {
        exec_child(args, out_write, err_write, options.merge_output);
    }

    out_write.release();
    err_write.release();
    out_read.set_nonblock(true);
    err_read.set_nonblock(true);

    process_result_t result;

    std::optional<std::chrono::steady_clock::time_point> deadline;
    if (options.timeout) {
        deadline = std::chrono::steady_clock::now() + *options.timeout;
    }

    std::array<struct pollfd, 2> fds{ { { out_read.get(), POLLIN, 0 },
                                        { err_read.get(), POLLIN, 0 } } };
    std::array<std::string *, 2> sinks{ &result.out, &result.err };
    std::array<const utils::file_descriptor *, 2> readers{ &out_read, &err_read };
    std::size_t open_fds{ fds.size() };

    while (open_fds > 0) {
        int timeout_ms{ -1 };
        if (deadline) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                    *deadline - std::chrono::steady_clock::now());
            if (left.count() <= 0) {
                ZSPAWN_WARNING() << "`" << args.front() << "` timed out, killing " << pid;
                ::kill(pid, SIGKILL);
                result.timed_out = true;
                break;
            }
            timeout_ms = static_cast<int>(left.count());
        }

        auto ret = ::poll(fds.data(), fds.size(), timeout_ms);
        if (ret < 0) {
            if (errno == EINTR) {
                continue;
            }

            ::kill(pid, SIGKILL);
            utils::waitpid(pid, 0);
            throw std::system_error(errno, std::system_category(), "poll");
        }

        for (std::size_t i = 0; i < fds.size(); ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) {
                continue;
            }

            auto status = readers[i]->read_available(*sinks[i]);
            if (status == utils::file_descriptor::IOStatus::Eof
                || status == utils::file_descriptor::IOStatus::Closed) {
                fds[i].fd = -1;
                --open_fds;
            }
        }
    }

    auto waited = utils::waitpid(pid, 0);
    if (waited.status != utils::WaitStatus::Reaped) {
        throw std::runtime_error("child process " + std::to_string(pid) + " vanished");
    }

    result.exit_code = utils::exit_code_of(waited.exit_code);
    return result;
}
