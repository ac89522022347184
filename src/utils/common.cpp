/**
 * @file common.cpp
 * @brief Global logger, command line options shared by all commands, crash handler.
 */

#include "common.hpp"
#include "dist/version.h"

#include <spdlog/sinks/stdout_color_sinks.h>

int verbosity = 0;

// stdout belongs to command output, the console log goes to stderr
std::shared_ptr<Logger> logger = std::make_shared<Logger>(spdlog::stderr_color_mt(APP_NAME));
argparse::ArgumentParser program(APP_NAME, APP_VERSION, argparse::default_arguments::help);

// begin stack trace generation on error
#include <backtrace.h>

static void backtrace_error_cb(void *, const char *msg, int errnum) {
    logger->critical("Error: {} (Error number: {})", msg, errnum);
}

static int backtrace_full_cb(void *, uintptr_t pc, const char *filename, int lineno, const char *function) {
    logger->critical("     {} {}:{} ({})", (void *)pc, filename ? filename : "??", lineno, function ? function : "??");
    return 0;
}

/**
 * @brief SIGSEGV/SIGABRT handler: logs a symbolized stack trace and exits with 1.
 */
void signal_handler(int sig) {
    logger->critical("Signal {} received, printing backtrace...", sig);

    backtrace_state *state = backtrace_create_state(NULL, 0, backtrace_error_cb, NULL);
    backtrace_full(state, 0, backtrace_full_cb, backtrace_error_cb, NULL);

    exit(1);
}
// end stack trace generation on error

/**
 * @brief Adds the log file given by -L.
 *
 * An explicitly requested log is mandatory: if it can't be opened the program
 * exits instead of running without it.
 */
void init_log(const fs::path& log_fname){
    if( !logger->file().empty() ){
        return;
    }

    if( !logger->add_file(log_fname) ){
        logger->critical("explicit log pathname is set, refusing to continue without log");
        exit(1);
    }
    logger->start();
}

void register_common_args(argparse::ArgumentParser &parser) {
    parser.add_argument("-v", "--verbose")
        .help("increase verbosity")
        .action([&](const auto &) { ++verbosity; })
        .append()
        .implicit_value(true)
        .nargs(0);

    parser.add_argument("-q", "--quiet")
        .help("decrease verbosity")
        .action([&](const auto &) { --verbosity; })
        .append()
        .implicit_value(true)
        .nargs(0);

    parser.add_argument("-L", "--log")
        .help("log pathname [default: console only]");
    parser.add_argument("--log-dedup-limit")
        .default_value(100)
        .scan<'i', int>()
        .help("limit duplicate log messages, 0 = no limit");
}

void register_program_args(argparse::ArgumentParser &parser) {
    register_common_args(parser);

    parser.add_argument("--version")
        .action([&](const auto & /*unused*/) {
            fmt::print("{} {}\n", APP_NAME, APP_VERSION);
            exit(0);
        })
        .default_value(false)
        .help("print version information and exit")
        .implicit_value(true)
        .nargs(0);
}

void apply_log_args(const argparse::ArgumentParser &parser) {
    logger->set_verbosity(verbosity); // before add_file(), the file sink inherits it
    if( parser.is_used("--log-dedup-limit") ){
        logger->set_dedup_limit(parser.get<int>("--log-dedup-limit"));
    }
    if( parser.is_used("--log") ){
        init_log(parser.get<std::string>("--log"));
    }
}
