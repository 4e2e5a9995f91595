#include <solrank/task_record.hh>
#include <solranklib/concat_tostr.hh>
#include <solranklib/macros/throw.hh>
#include <solranklib/string_transform.hh>

namespace solrank {

namespace {

const Json::Value& required_array(const Json::Value& record, std::string_view field) {
    const auto* value = record.find(field.data(), field.data() + field.size());
    if (value == nullptr or not value->isArray()) {
        THROW("field `", field, "` is missing or is not an array");
    }
    return *value;
}

} // namespace

std::string required_string(const Json::Value& record, std::string_view field) {
    const auto* value = record.find(field.data(), field.data() + field.size());
    if (value == nullptr or not value->isString()) {
        THROW("field `", field, "` is missing or is not a string");
    }
    return value->asString();
}

TaskRecord::TaskRecord(DatasetType dataset, JsonLine line)
: dataset_(dataset)
, line_(std::move(line)) {
    if (not line_.value.isObject()) {
        THROW("record is not an object");
    }

    const auto& rec = line_.value;
    if (dataset_ == DatasetType::MBPP) {
        (void)required_string(rec, "code");
        (void)required_array(rec, "test_list");
    } else {
        (void)required_string(rec, "entry_point");
        (void)required_string(rec, "canonical_solution");
        (void)required_array(rec, "base_input");
        if (has_plus_tier(dataset_)) {
            (void)required_array(rec, "plus_input");
        }
    }
}

std::string TaskRecord::task_id() const {
    const auto& id = line_.value["task_id"];
    if (id.isString()) {
        return id.asString();
    }
    if (id.isIntegral()) {
        return id.isUInt64() ? std::to_string(id.asUInt64()) : std::to_string(id.asInt64());
    }
    return {};
}

std::string TaskRecord::entry_point() const { return required_string(line_.value, "entry_point"); }

const Json::Value& TaskRecord::inputs(bool plus_tier) const {
    return required_array(line_.value, plus_tier ? "plus_input" : "base_input");
}

std::vector<std::string> TaskRecord::assertion_statements() const {
    std::vector<std::string> res;
    auto append_from = [&](std::string_view field, bool required) {
        const auto* list = line_.value.find(field.data(), field.data() + field.size());
        if (list == nullptr or list->isNull()) {
            if (required) {
                THROW("field `", field, "` is missing");
            }
            return;
        }
        if (not list->isArray()) {
            THROW("field `", field, "` is not an array");
        }
        for (const auto& stmt : *list) {
            if (not stmt.isString()) {
                THROW("field `", field, "` contains a non-string");
            }
            res.emplace_back(stmt.asString());
        }
    };
    append_from("test_list", true);
    append_from("challenge_test_list", false);
    return res;
}

std::string TaskRecord::program_text(bool add_prompt) const {
    const auto& rec = line_.value;
    if (dataset_ == DatasetType::MBPP) {
        std::string setup;
        if (rec.isMember("test_setup_code")) {
            setup = required_string(rec, "test_setup_code");
        }
        return concat_tostr(required_string(rec, "code"), '\n', setup, "\n\n");
    }

    auto solution = required_string(rec, "canonical_solution");
    if (not add_prompt) {
        return solution;
    }
    auto prompt = required_string(rec, "prompt");
    return concat_tostr(trim(prompt), '\n', solution);
}

} // namespace solrank
