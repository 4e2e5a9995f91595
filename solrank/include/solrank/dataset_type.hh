#pragma once

#include <optional>
#include <string_view>

namespace solrank {

enum class DatasetType {
    HE, // HumanEval: base + plus inputs, print(entry_point(*args))
    HE_PLUS,
    MBPP, // MBPP: assertion statements, no plus tier
    MBPP_PLUS, // MBPP+: like HE_PLUS but inputs need per-task coercion
};

// Accepts "HE", "HE_plus", "HE+", "MBPP", "MBPP_plus", "MBPP+"
std::optional<DatasetType> parse_dataset_type(std::string_view str) noexcept;

// Returns canonical name, used also in output file names
std::string_view to_str(DatasetType type) noexcept;

// Whether records carry the "plus" tier of tests
constexpr bool has_plus_tier(DatasetType type) noexcept { return type != DatasetType::MBPP; }

// Field holding the problem statement
constexpr std::string_view prompt_field(DatasetType type) noexcept {
    return type == DatasetType::MBPP ? "text" : "prompt";
}

// Field holding the solution body
constexpr std::string_view solution_field(DatasetType type) noexcept {
    return type == DatasetType::MBPP ? "code" : "canonical_solution";
}

// Per-test timeout used when none is configured [s]
constexpr double default_timeout(DatasetType type) noexcept {
    switch (type) {
    case DatasetType::HE:
    case DatasetType::MBPP: return 10;
    case DatasetType::HE_PLUS:
    case DatasetType::MBPP_PLUS: return 30;
    }
    return 30;
}

} // namespace solrank
