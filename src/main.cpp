/**
 * @file main.cpp
 * @brief Entry point of revlines.
 *
 * Parses the command line, picks the command, runs the silent self-test and
 * then the command itself. "revlines FILE ..." is a shortcut for
 * "revlines tail FILE ...".
 */

#include <algorithm>
#include <iostream>

#include <argparse/argparse.hpp>

#include "utils/common.hpp"
#include "dist/version.h"

#include "commands/TailCommand.hpp"
#include "commands/TestCommand.hpp"

extern argparse::ArgumentParser program;

/**
 * @brief Main entry point.
 *
 * @return EXIT_SUCCESS (0) on success, EXIT_FAILURE (1) on error.
 */
int main(int argc, char*argv[]) {
    signal(SIGSEGV, signal_handler);
    signal(SIGABRT, signal_handler);

    register_program_args(program);

    for (const auto& [name, cmd] : Command::registry()) {
        program.add_subparser(cmd->parser());
    }

    try {
        std::vector<std::string> unknown_args = program.parse_known_args(argc, argv); // doesnt raise error on unknown args
        const bool no_subcommand_used = std::none_of(Command::registry().begin(), Command::registry().end(),
                [&](const auto& cmd) { return program.is_subcommand_used(cmd.first); } );
        if( unknown_args.size() > 0 ){
            if( no_subcommand_used && std::filesystem::exists(unknown_args[0]) ){
                // implicit "tail" command
                // options given before the filename were consumed by the main parser, pass them through
                std::vector<std::string> args(argv, argv + argc);
                args.insert(args.begin() + 1, TAIL_CMD_NAME);
                verbosity = 0;
                program.parse_args(args); // raises error on unknown args
            } else {
                std::cerr << "[?] Unknown arguments: ";
                for (const auto& arg : unknown_args) {
                    std::cerr << "\"" << arg << "\" ";
                }
                std::cerr << std::endl;
                return 1;
            }
        }
    } catch (const std::exception& err) {
        std::cerr << err.what() << std::endl;
        std::cerr << program;
        return 1;
    }

    logger->set_arguments(argc, argv);
    logger->set_banner(APP_NAME " " APP_VERSION);
    apply_log_args(program);

    Command* selfTestCmd = Command::find(TEST_CMD_NAME);
    for (const auto& [name, cmd] : Command::registry()) {
        if (!program.is_subcommand_used(name)) {
            continue;
        }

        apply_log_args(cmd->parser());
        if( cmd == selfTestCmd ){
            // explicit self-test, make it visible
            logger->set_verbosity(9);
        } else if( selfTestCmd ){
            // implicit self-test, only failures are shown
            Logger::ConsoleLevelGuard guard(*logger, Logger::level::critical);
            if( selfTestCmd->run() != 0 ){
                logger->critical("self-test failed, exiting");
                return 1;
            }
        }

        return cmd->run();
    }

    std::cout << program;
    return 0;
}
