#include "commands.hh"

#include <cstdio>

namespace commands {

void help(const char* program_name) {
    if (program_name == nullptr) {
        program_name = "solrank";
    }

    printf("Usage: %s [options] <command> [<command args>]\n", program_name);
    puts(R"==(Solrank executes candidate solutions of coding tasks against their tests and
ranks them

Commands:
  combine <task_file> <runs_dir> <output_dir>
                        Join the executed task file with the executed run files
                          from <runs_dir> (matching run_file_pattern, joined by
                          line number), drop degenerate candidates, rank them
                          and write <dataset>_unranked.jsonl,
                          <dataset>_ranked.jsonl, <dataset>_base_ranked.jsonl
                          and <dataset>_plus_ranked.jsonl to <output_dir>
  execute <input_file> <output_file>
                        Run every record of <input_file> against its base and
                          plus tests and write the records with
                          base_execution_result and plus_execution_result to
                          <output_file> (in the input order)
  filter <input_file> <output_file>
                        Deduplicate and down-sample the solutions of every
                          record of a tier-specific ranked file
  help                  Display this information
  version               Display version

Options:
  -c, --config <file>   Load configuration from <file> (by default solrank.conf
                          from the current directory, if it exists)
  --dataset=<type>      Dataset type: HE, HE_plus, MBPP or MBPP_plus
                          (default: HE_plus)
  --timeout=<seconds>   Time limit of a single test (at least 0.1; default: 10
                          for HE and MBPP, 30 for HE_plus and MBPP_plus)
  --timeouts-from-record
                        Time limit of a test is max(0.1, 4 * its previous
                          time_taken) read from the record
  --no-prompt           Do not prepend the prompt to the canonical solution
  --workers=<n>         Number of records executed in parallel (default: 8)
  --python=<path>       Python interpreter (default: python3)
  --memory-limit=<MiB>  Address space limit of a test, 0 means none (default: 0)
  --time-ratio-threshold=<x>
                        Candidates with tied scores and the ratio of their times
                          below <x> are duplicates, the slower one is dropped
                          (at least 1.0; default: 1.0)
  --target-pool-size=<n>
                        Number of solutions kept by filter (default: 5)
  --soft-floor=<x>      The lowest score in (0, <x>) is the bottom anchor of the
                          down-sampling (default: 0.1)
  --run-file-pattern=<glob>
                        Run files used by combine (default: exec_*.jsonl)
  -h, --help            Display this information
  -q, --quiet           Quiet mode
  -v, --verbose         Verbose mode
  -V, --version         Display version

Config file options (name: value): dataset, timeout, timeouts_from_record,
  timeout_min, timeout_multiple, add_prompt, workers, python_executable,
  memory_limit_mib, output_limit_mib, sandbox_root, run_file_pattern,
  time_ratio_threshold, target_pool_size, soft_floor_upper_bound)==");
}

void version() noexcept { printf("solrank %s\nBuilt on %s at %s\n", SOLRANK_VERSION, __DATE__, __TIME__); }

} // namespace commands
