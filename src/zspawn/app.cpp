// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "zspawn/app.h"

#include "zspawn/command/exec.h"
#include "zspawn/command/lifecycle.h"
#include "zspawn/command/list.h"
#include "zspawn/command/manage.h"
#include "zspawn/command/shell.h"
#include "zspawn/errors.h"
#include "zspawn/utils/log.h"
#include "zspawn/utils/process.h"

#include <optional>
#include <sstream>

namespace {

template<typename... T>
struct subCommand : T...
{
    using T::operator()...;
};

template<typename... T>
subCommand(T...) -> subCommand<T...>;

} // namespace

namespace zspawn {

// The main function of zspawn, it is the entry point.
// Commands that hand the terminal over to machinectl return the image to
// exec instead of running it, so every object is destroyed before the
// process is replaced.
int main(int argc, char **argv) noexcept
try {
    ZSPAWN_DEBUG() << "zspawn called with" << [=]() -> std::string {
        std::stringstream result;
        for (int i = 0; i < argc; ++i) {
            result << " \"" << argv[i] << "\"";
        }
        return result.str();
    }();

    command::options options = command::parse(argc, argv);
    if (options.global.return_code != 0) {
        return options.global.return_code;
    }

    std::optional<exec_image_t> image;
    const auto &global = options.global;
    auto code = std::visit(
            subCommand{ [&global](const command::list_options &options) {
                           return command::list(global, options);
                       },
                        [&global, &image](const command::shell_options &options) {
                            image = command::shell(global, options);
                            return 0;
                        },
                        [&global, &image](const command::inspect_options &options) {
                            image = command::inspect(global, options);
                            return 0;
                        },
                        [&global](const command::create_options &options) {
                            command::create(global, options);
                            return 0;
                        },
                        [&global](const command::destroy_options &options) {
                            return command::destroy(global, options);
                        },
                        [&global](const command::rename_options &options) {
                            command::rename(global, options);
                            return 0;
                        },
                        [&global](const command::clone_options &options) {
                            command::clone(global, options);
                            return 0;
                        },
                        [&global](const command::state_options &options) {
                            command::change_state(global, options);
                            return 0;
                        },
                        [&global](const command::manage_options &options) {
                            command::manage(global, options);
                            return 0;
                        },
                        [&global](const command::exec_options &options) {
                            return command::exec(global, options);
                        },
                        [code = global.return_code](const std::monostate &) {
                            return code;
                        } },
            options.subcommand_opt);

    if (image) {
        utils::execvp(image->args);
    }

    return code;
} catch (const command_error &e) {
    ZSPAWN_ERR() << "Error: " << e.what();
    if (!e.err().empty()) {
        ZSPAWN_ERR() << e.err();
    }
    return 1;
} catch (const std::exception &e) {
    ZSPAWN_ERR() << "Error: " << e.what();
    return 1;
} catch (...) {
    ZSPAWN_ERR() << "unknown error";
    return 1;
}

} // namespace zspawn
