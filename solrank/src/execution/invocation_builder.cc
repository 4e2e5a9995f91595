#include <solrank/execution/invocation_builder.hh>
#include <solrank/normalization/py_value.hh>
#include <solranklib/concat_tostr.hh>
#include <solranklib/macros/throw.hh>

namespace solrank {

namespace {

std::string render_call(const CallDescriptor& call) {
    std::string res = "\n";
    for (const auto& import : call.imports) {
        back_insert(res, import, '\n');
    }
    back_insert(res, "print(");
    if (call.wrap_result_in_bool) {
        back_insert(res, "bool(");
    }
    back_insert(res, call.function_name, '(');
    for (size_t i = 0; i < call.arguments.size(); ++i) {
        if (i > 0) {
            back_insert(res, ", ");
        }
        back_insert(res, call.arguments[i].to_python_literal());
    }
    back_insert(res, ')');
    if (call.wrap_result_in_bool) {
        back_insert(res, ')');
    }
    back_insert(res, ')');
    return res;
}

} // namespace

InvocationQuirks invocation_quirks(DatasetType dataset, std::string_view task_id) {
    InvocationQuirks quirks;
    if (dataset != DatasetType::MBPP_PLUS) {
        return quirks;
    }
    // Expected outputs contain inf
    if (task_id == "Mbpp/404") {
        quirks.imports.emplace_back("from math import inf");
    }
    // Results are compared as truth values
    if (task_id == "Mbpp/737" or task_id == "Mbpp/787" or task_id == "Mbpp/794") {
        quirks.wrap_result_in_bool = true;
    }
    return quirks;
}

std::string render(const Invocation& invocation) {
    if (const auto* call = std::get_if<CallDescriptor>(&invocation)) {
        return render_call(*call);
    }
    return std::get<AssertionStatement>(invocation).statement;
}

std::vector<Invocation> build_invocations(const TaskRecord& task, bool plus_tier) {
    std::vector<Invocation> res;
    if (task.dataset() == DatasetType::MBPP) {
        if (plus_tier) {
            return res;
        }
        for (auto& stmt : task.assertion_statements()) {
            res.emplace_back(AssertionStatement{std::move(stmt)});
        }
        return res;
    }

    auto task_id = task.task_id();
    auto quirks = invocation_quirks(task.dataset(), task_id);
    CoercionStrategy coercion = coercion::Identity{};
    if (task.dataset() == DatasetType::MBPP_PLUS) {
        coercion = coercion_for_mbpp_task(task_id);
    }

    auto entry_point = task.entry_point();
    const auto& inputs = task.inputs(plus_tier);
    for (Json::ArrayIndex i = 0; i < inputs.size(); ++i) {
        const auto& input = inputs[i];
        if (not input.isArray()) {
            THROW(plus_tier ? "plus" : "base", "_input[", i, "] is not a list of arguments");
        }
        Arguments args;
        args.reserve(input.size());
        for (const auto& arg : input) {
            args.emplace_back(PyValue::from_json(arg, task.source_text()));
        }
        res.emplace_back(CallDescriptor{
            .function_name = entry_point,
            .arguments = apply_coercion(coercion, std::move(args)),
            .wrap_result_in_bool = quirks.wrap_result_in_bool,
            .imports = quirks.imports,
        });
    }
    return res;
}

} // namespace solrank
