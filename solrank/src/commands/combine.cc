#include "commands.hh"

#include <solrank/aggregation/aggregator.hh>
#include <solrank/errors.hh>
#include <solranklib/file_manip.hh>
#include <string>

namespace commands {

void combine(const solrank::Config& config, ArgvParser args) {
    if (args.size() != 3) {
        throw solrank::UsageError(
            "combine: expected arguments: <task_file> <runs_dir> <output_dir>"
        );
    }
    std::string task_file{args.extract_next()};
    std::string runs_dir{args.extract_next()};
    std::string output_dir{args.extract_next()};
    if (not is_directory(runs_dir)) {
        throw solrank::UsageError("combine: ", runs_dir, " is not a directory");
    }
    if (not is_directory(output_dir)) {
        throw solrank::UsageError("combine: ", output_dir, " is not a directory");
    }

    (void)solrank::combine_files(config, task_file, runs_dir, output_dir);
}

} // namespace commands
