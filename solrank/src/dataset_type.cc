#include <solrank/dataset_type.hh>

namespace solrank {

std::optional<DatasetType> parse_dataset_type(std::string_view str) noexcept {
    if (str == "HE") {
        return DatasetType::HE;
    }
    if (str == "HE_plus" or str == "HE+") {
        return DatasetType::HE_PLUS;
    }
    if (str == "MBPP") {
        return DatasetType::MBPP;
    }
    if (str == "MBPP_plus" or str == "MBPP+") {
        return DatasetType::MBPP_PLUS;
    }
    return std::nullopt;
}

std::string_view to_str(DatasetType type) noexcept {
    switch (type) {
    case DatasetType::HE: return "HE";
    case DatasetType::HE_PLUS: return "HE_plus";
    case DatasetType::MBPP: return "MBPP";
    case DatasetType::MBPP_PLUS: return "MBPP_plus";
    }
    return "unknown";
}

} // namespace solrank
