#include <limits>
#include <solrank/execution_result.hh>
#include <solranklib/macros/throw.hh>

namespace solrank {

void ExecutionResult::add(TestOutcome outcome) {
    correct_tests.emplace_back(outcome.passed);
    unit_test_stdouts.emplace_back(std::move(outcome.stdout_text));
    unit_test_stderrs.emplace_back(std::move(outcome.stderr_text));
    traceback.emplace_back(std::move(outcome.traceback));
    time_taken.emplace_back(outcome.elapsed);
    update_average_test_score();
}

void ExecutionResult::update_average_test_score() noexcept {
    if (correct_tests.empty()) {
        average_test_score = 0;
        return;
    }
    size_t passed = 0;
    for (bool c : correct_tests) {
        passed += c;
    }
    average_test_score = static_cast<double>(passed) / static_cast<double>(correct_tests.size());
}

double ExecutionResult::effective_average_time_taken() const noexcept {
    if (average_time_taken) {
        return *average_time_taken;
    }
    if (time_taken.empty()) {
        return std::numeric_limits<double>::infinity();
    }
    double sum = 0;
    for (double t : time_taken) {
        sum += t;
    }
    return sum / static_cast<double>(time_taken.size());
}

Json::Value ExecutionResult::to_json() const {
    Json::Value res{Json::objectValue};
    auto& correct = res["correct_tests"] = Json::Value{Json::arrayValue};
    for (bool c : correct_tests) {
        correct.append(c);
    }
    res["average_test_score"] = average_test_score;
    auto append_strings = [&](const char* name, const std::vector<std::string>& strs) {
        auto& arr = res[name] = Json::Value{Json::arrayValue};
        for (const auto& s : strs) {
            arr.append(s);
        }
    };
    append_strings("unit_test_stdouts", unit_test_stdouts);
    append_strings("unit_test_stderrs", unit_test_stderrs);
    append_strings("traceback", traceback);
    auto& times = res["time_taken"] = Json::Value{Json::arrayValue};
    for (double t : time_taken) {
        times.append(t);
    }
    if (average_time_taken) {
        res["average_time_taken"] = *average_time_taken;
    }
    return res;
}

ExecutionResult ExecutionResult::from_json(const Json::Value& json) {
    if (not json.isObject()) {
        THROW("execution result is not an object");
    }

    auto array_field = [&](const char* name) -> const Json::Value& {
        static const Json::Value empty{Json::arrayValue};
        const auto& value = json[name];
        if (value.isNull()) {
            return empty;
        }
        if (not value.isArray()) {
            THROW("execution result field `", name, "` is not an array");
        }
        return value;
    };
    auto number = [](const Json::Value& value, const char* name) {
        if (not value.isNumeric()) {
            THROW("execution result field `", name, "` contains a non-number");
        }
        return value.asDouble();
    };

    ExecutionResult res;
    for (const auto& c : array_field("correct_tests")) {
        if (not c.isBool()) {
            THROW("execution result field `correct_tests` contains a non-boolean");
        }
        res.correct_tests.emplace_back(c.asBool());
    }
    auto read_strings = [&](const char* name, std::vector<std::string>& strs) {
        for (const auto& s : array_field(name)) {
            if (not s.isString()) {
                THROW("execution result field `", name, "` contains a non-string");
            }
            strs.emplace_back(s.asString());
        }
    };
    read_strings("unit_test_stdouts", res.unit_test_stdouts);
    read_strings("unit_test_stderrs", res.unit_test_stderrs);
    read_strings("traceback", res.traceback);
    for (const auto& t : array_field("time_taken")) {
        res.time_taken.emplace_back(number(t, "time_taken"));
    }

    if (json.isMember("average_test_score")) {
        res.average_test_score = number(json["average_test_score"], "average_test_score");
    } else {
        res.update_average_test_score();
    }
    if (json.isMember("average_time_taken") and not json["average_time_taken"].isNull()) {
        res.average_time_taken = number(json["average_time_taken"], "average_time_taken");
    }
    return res;
}

} // namespace solrank
