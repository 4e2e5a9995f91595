#include "commands.hh"

#include <solrank/errors.hh>
#include <solrank/execution/orchestrator.hh>
#include <string>

namespace commands {

void execute(const solrank::Config& config, ArgvParser args) {
    if (args.size() != 2) {
        throw solrank::UsageError("execute: expected arguments: <input_file> <output_file>");
    }
    std::string input_file{args.extract_next()};
    std::string output_file{args.extract_next()};

    stdlog(
        "Executing ",
        input_file,
        " as ",
        solrank::to_str(config.dataset),
        " with ",
        config.workers,
        " workers"
    );
    (void)solrank::execute_file(config, input_file, output_file);
}

} // namespace commands
