#pragma once

#include <cstdint>
#include <optional>
#include <solrank/dataset_type.hh>
#include <string>
#include <string_view>

namespace solrank {

// Smallest accepted per-test timeout [s]
constexpr double MIN_TIMEOUT = 0.1;

struct Config {
    DatasetType dataset = DatasetType::HE_PLUS;

    // Execution
    std::optional<double> timeout; // per-test timeout [s], unset - dataset default
    bool timeouts_from_record = false; // derive per-test timeouts from previous timings
    double timeout_min = MIN_TIMEOUT; // lower bound of a derived timeout [s]
    double timeout_multiple = 4.0; // derived timeout = previous time * timeout_multiple
    bool add_prompt = true; // prepend the stripped prompt to the solution
    unsigned workers = 8;
    std::string python_executable = "python3";
    uint64_t memory_limit_mib = 0; // 0 - no limit
    uint64_t output_limit_mib = 64; // limit of a single output file of a test, 0 - no limit
    std::string sandbox_root = "/tmp"; // where disposable sandbox directories are created

    // Aggregation
    std::string run_file_pattern = "exec_*.jsonl";
    double time_ratio_threshold = 1.0;

    // Selection
    unsigned target_pool_size = 5;
    double soft_floor_upper_bound = 0.1;

    [[nodiscard]] double effective_timeout() const noexcept {
        return timeout.value_or(default_timeout(dataset));
    }

    /**
     * @brief Sets option @p name (as named in the config file) to @p value
     *
     * @errors Throws UsageError if @p name is unknown or @p value is invalid
     */
    void set_option(std::string_view name, std::string_view value);

    /**
     * @brief Loads options from config file @p path (format of ConfigFile)
     *
     * @errors Throws UsageError if the file cannot be read or parsed or it
     *   contains an unknown option or an invalid value
     */
    void load_from_file(const std::string& path);
};

} // namespace solrank
