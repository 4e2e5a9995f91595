#include "commands.hh"

#include <solrank/aggregation/selector.hh>
#include <solrank/errors.hh>
#include <string>

namespace commands {

void filter(const solrank::Config& config, ArgvParser args) {
    if (args.size() != 2) {
        throw solrank::UsageError("filter: expected arguments: <input_file> <output_file>");
    }
    std::string input_file{args.extract_next()};
    std::string output_file{args.extract_next()};
    solrank::filter_file(config, input_file, output_file);
}

} // namespace commands
