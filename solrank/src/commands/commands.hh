#pragma once

#include <solrank/config.hh>
#include <solranklib/argv_parser.hh>

namespace commands {

// execute <input_file> <output_file>
void execute(const solrank::Config& config, ArgvParser args);

// combine <task_file> <runs_dir> <output_dir>
void combine(const solrank::Config& config, ArgvParser args);

// filter <input_file> <output_file>
void filter(const solrank::Config& config, ArgvParser args);

// Displays help
void help(const char* program_name);

// Displays version
void version() noexcept;

} // namespace commands
