#include <limits>
#include <solrank/config.hh>
#include <solrank/errors.hh>
#include <solranklib/config_file.hh>
#include <solranklib/string_transform.hh>

namespace solrank {

namespace {

bool parse_bool(std::string_view name, std::string_view value) {
    if (value == "1" or lower_equal(value, "true") or lower_equal(value, "on")) {
        return true;
    }
    if (value == "0" or lower_equal(value, "false") or lower_equal(value, "off")) {
        return false;
    }
    throw UsageError("invalid value of `", name, "`: expected a boolean, got `", value, '`');
}

template <class T>
T parse_number(std::string_view name, std::string_view value) {
    auto res = str2num<T>(value);
    if (not res) {
        throw UsageError("invalid value of `", name, "`: expected a number, got `", value, '`');
    }
    return *res;
}

double parse_positive_double(std::string_view name, std::string_view value, double min) {
    auto res = parse_number<double>(name, value);
    if (not(res >= min) or res == std::numeric_limits<double>::infinity()) {
        throw UsageError("invalid value of `", name, "`: `", value, "` is out of range");
    }
    return res;
}

} // namespace

void Config::set_option(std::string_view name, std::string_view value) {
    if (name == "dataset") {
        auto type = parse_dataset_type(value);
        if (not type) {
            throw UsageError(
                "invalid dataset type `", value, "` (expected one of: HE, HE_plus, MBPP, MBPP_plus)"
            );
        }
        dataset = *type;
    } else if (name == "timeout") {
        auto t = parse_number<double>(name, value);
        if (not(t >= MIN_TIMEOUT)) {
            throw UsageError("timeout has to be at least ", "0.1", " seconds, got `", value, '`');
        }
        timeout = t;
    } else if (name == "timeouts_from_record") {
        timeouts_from_record = parse_bool(name, value);
    } else if (name == "timeout_min") {
        timeout_min = parse_positive_double(name, value, MIN_TIMEOUT);
    } else if (name == "timeout_multiple") {
        timeout_multiple = parse_positive_double(name, value, 1.0);
    } else if (name == "add_prompt") {
        add_prompt = parse_bool(name, value);
    } else if (name == "workers") {
        workers = parse_number<unsigned>(name, value);
        if (workers == 0) {
            throw UsageError("workers has to be positive");
        }
    } else if (name == "python_executable") {
        if (value.empty()) {
            throw UsageError("python_executable cannot be empty");
        }
        python_executable = value;
    } else if (name == "memory_limit_mib") {
        memory_limit_mib = parse_number<uint64_t>(name, value);
    } else if (name == "output_limit_mib") {
        output_limit_mib = parse_number<uint64_t>(name, value);
    } else if (name == "sandbox_root") {
        if (value.empty()) {
            throw UsageError("sandbox_root cannot be empty");
        }
        sandbox_root = value;
    } else if (name == "run_file_pattern") {
        if (value.empty()) {
            throw UsageError("run_file_pattern cannot be empty");
        }
        run_file_pattern = value;
    } else if (name == "time_ratio_threshold") {
        time_ratio_threshold = parse_positive_double(name, value, 1.0);
    } else if (name == "target_pool_size") {
        target_pool_size = parse_number<unsigned>(name, value);
        if (target_pool_size == 0) {
            throw UsageError("target_pool_size has to be positive");
        }
    } else if (name == "soft_floor_upper_bound") {
        soft_floor_upper_bound = parse_number<double>(name, value);
        if (not(soft_floor_upper_bound > 0 and soft_floor_upper_bound <= 1)) {
            throw UsageError("soft_floor_upper_bound has to be in range (0, 1]");
        }
    } else {
        throw UsageError("unknown option: `", name, '`');
    }
}

void Config::load_from_file(const std::string& path) {
    ConfigFile cf;
    try {
        cf.load_config_from_file(path, true);
    } catch (const ConfigFile::ParseError& e) {
        throw UsageError("failed to parse config file ", path, ": ", e.what(), '\n', e.diagnostics());
    } catch (const std::runtime_error& e) {
        throw UsageError("failed to load config file ", path, ": ", e.what());
    }

    for (const auto& [name, var] : cf.get_vars()) {
        if (var.is_array()) {
            throw UsageError(path, ": option `", name, "` cannot be an array");
        }
        set_option(name, var.as_string());
    }
}

} // namespace solrank
