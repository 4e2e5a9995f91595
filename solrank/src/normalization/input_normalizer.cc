#include <algorithm>
#include <array>
#include <solrank/normalization/input_normalizer.hh>
#include <solranklib/macros/throw.hh>
#include <solranklib/string_transform.hh>

namespace solrank {

namespace {

using namespace coercion; // NOLINT(google-build-using-namespace)

struct TaskCoercion {
    std::vector<unsigned> tasks;
    CoercionStrategy strategy;
};

// Shapes of the inputs of MBPP+ tasks that cannot be expressed in JSON
const std::array<TaskCoercion, 13>& coercion_table() {
    static const std::array<TaskCoercion, 13> table = {{
        {{2,   116, 132, 143, 222, 261, 273, 394, 399, 421, 424,
          429, 470, 560, 579, 596, 616, 630, 726, 740, 744, 809},
         TupleEachArg{}},
        {{63, 64, 70, 94, 120, 237, 272, 299, 400, 409, 417, 438, 473, 614, 780},
         TupleItemsOfEachArg{}},
        {{75, 413, 444, 753}, TupleItemsOfFirstArg{}},
        {{106, 750}, TupleSecondArg{}},
        {{115}, SetItemsOfFirstArg{}},
        {{124}, FloatAndComplexPair{}},
        {{250, 405, 446, 617, 720, 763, 808}, TupleFirstArg{.arity = 2}},
        {{259, 401, 445}, TupleOfTuplesEachArg{}},
        {{278}, TupleFirstArgWithTupleItems{}},
        {{307}, TupleFirstArg{.arity = 3}},
        {{722}, TupleDictValuesOfFirstArg{}},
        {{252}, ComplexFirstArg{}},
        {{580, 615, 791}, DeepTuple{}},
    }};
    return table;
}

const PyValue& arg(const Arguments& args, size_t idx) {
    if (idx >= args.size()) {
        THROW("expected at least ", idx + 1, " arguments, got ", args.size());
    }
    return args[idx];
}

// Applies @p func to every element of iterable @p val, returns a list
template <class Func>
PyValue map_items(const PyValue& val, Func&& func) {
    std::vector<PyValue> items;
    for (auto& item : val.iterate()) {
        items.emplace_back(func(item));
    }
    return PyValue::list(std::move(items));
}

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};

} // namespace

std::optional<unsigned> mbpp_task_number(std::string_view task_id) noexcept {
    auto slash = task_id.rfind('/');
    if (slash != std::string_view::npos) {
        task_id.remove_prefix(slash + 1);
    }
    return str2num<unsigned>(task_id);
}

CoercionStrategy coercion_for_mbpp_task(std::string_view task_id) noexcept {
    auto num = mbpp_task_number(task_id);
    if (not num) {
        return Identity{};
    }
    for (const auto& entry : coercion_table()) {
        if (std::find(entry.tasks.begin(), entry.tasks.end(), *num) != entry.tasks.end()) {
            return entry.strategy;
        }
    }
    return Identity{};
}

PyValue to_tuple(const PyValue& val) { return PyValue::tuple(val.iterate()); }

PyValue to_deep_tuple(const PyValue& val) {
    if (val.kind() != PyValue::Kind::LIST) {
        return val;
    }
    std::vector<PyValue> items;
    items.reserve(val.items().size());
    for (const auto& item : val.items()) {
        items.emplace_back(to_deep_tuple(item));
    }
    return PyValue::tuple(std::move(items));
}

Arguments apply_coercion(const CoercionStrategy& strategy, Arguments args) {
    auto tuple_items = [](const PyValue& val) { return map_items(val, to_tuple); };

    return std::visit(
        overloaded{
            [&](const Identity& /*unused*/) { return std::move(args); },
            [&](const TupleEachArg& /*unused*/) {
                Arguments res;
                for (const auto& a : args) {
                    res.emplace_back(to_tuple(a));
                }
                return res;
            },
            [&](const TupleItemsOfEachArg& /*unused*/) {
                Arguments res;
                for (const auto& a : args) {
                    res.emplace_back(tuple_items(a));
                }
                return res;
            },
            [&](const TupleItemsOfFirstArg& /*unused*/) {
                return Arguments{tuple_items(arg(args, 0)), arg(args, 1)};
            },
            [&](const TupleSecondArg& /*unused*/) {
                return Arguments{arg(args, 0), to_tuple(arg(args, 1))};
            },
            [&](const SetItemsOfFirstArg& /*unused*/) {
                return Arguments{map_items(arg(args, 0), [](const PyValue& item) {
                    if (item.kind() == PyValue::Kind::LIST and item.truthy()) {
                        return PyValue::set(item.iterate());
                    }
                    return PyValue::dict({});
                })};
            },
            [&](const FloatAndComplexPair& /*unused*/) {
                return Arguments{
                    PyValue::call("float", arg(args, 0)), PyValue::call("complex", arg(args, 1))
                };
            },
            [&](const TupleFirstArg& s) {
                Arguments res{to_tuple(arg(args, 0))};
                for (size_t i = 1; i < s.arity; ++i) {
                    res.emplace_back(arg(args, i));
                }
                return res;
            },
            [&](const TupleOfTuplesEachArg& /*unused*/) {
                Arguments res;
                for (const auto& a : args) {
                    res.emplace_back(to_tuple(tuple_items(a)));
                }
                return res;
            },
            [&](const TupleFirstArgWithTupleItems& /*unused*/) {
                return Arguments{to_tuple(map_items(arg(args, 0), [](const PyValue& item) {
                    return item.kind() == PyValue::Kind::LIST ? to_tuple(item) : item;
                }))};
            },
            [&](const TupleDictValuesOfFirstArg& /*unused*/) {
                const auto& dict = arg(args, 0);
                if (dict.kind() != PyValue::Kind::DICT) {
                    THROW("expected a dict as the first argument");
                }
                std::vector<std::pair<PyValue, PyValue>> entries;
                const auto& kv = dict.items();
                for (size_t i = 0; i + 1 < kv.size(); i += 2) {
                    entries.emplace_back(kv[i], to_tuple(kv[i + 1]));
                }
                Arguments res{PyValue::dict(std::move(entries))};
                res.insert(res.end(), args.begin() + 1, args.end());
                return res;
            },
            [&](const ComplexFirstArg& /*unused*/) {
                return Arguments{PyValue::call("complex", arg(args, 0))};
            },
            [&](const DeepTuple& /*unused*/) {
                Arguments res;
                for (const auto& a : args) {
                    res.emplace_back(to_deep_tuple(a));
                }
                return res;
            },
        },
        strategy
    );
}

} // namespace solrank
