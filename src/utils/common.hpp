#pragma once
#include "io/Logger.hpp"
#include "units.hpp"
#include "core/buf_t.hpp"

#include <string>
#include <filesystem>
#include <vector>
#include <signal.h>

namespace fs = std::filesystem;

#include <argparse/argparse.hpp>

#define APP_NAME "revlines"

extern std::shared_ptr<Logger> logger;
extern int verbosity;

// adds a file sink, exits if the explicitly requested log can't be opened
void init_log(const fs::path& log_fname);

void register_program_args(argparse::ArgumentParser &parser);
void register_common_args(argparse::ArgumentParser &parser);

// applies -v/-q/-L/--log-dedup-limit of a parsed (sub)command parser
void apply_log_args(const argparse::ArgumentParser &parser);

void signal_handler(int sig);
