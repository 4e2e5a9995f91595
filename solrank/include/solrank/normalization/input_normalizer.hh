#pragma once

#include <optional>
#include <solrank/normalization/py_value.hh>
#include <string_view>
#include <variant>
#include <vector>

namespace solrank {

// Argument list of one function call
using Arguments = std::vector<PyValue>;

namespace coercion {

// Arguments are used as decoded from JSON
struct Identity {};

// Every argument becomes a tuple
struct TupleEachArg {};

// Every argument is a list whose items become tuples
struct TupleItemsOfEachArg {};

// Exactly two arguments: items of the first one become tuples
struct TupleItemsOfFirstArg {};

// Exactly two arguments: the second one becomes a tuple
struct TupleSecondArg {};

// One argument, a list whose non-empty list items become sets and the other
// items empty dicts
struct SetItemsOfFirstArg {};

// (float(args[0]), complex(args[1]))
struct FloatAndComplexPair {};

// The first argument becomes a tuple, the next arity - 1 arguments are kept
struct TupleFirstArg {
    size_t arity = 2;
};

// Every argument becomes a tuple of tuples
struct TupleOfTuplesEachArg {};

// One argument becomes a tuple whose list items become tuples
struct TupleFirstArgWithTupleItems {};

// Values of the dict in the first argument become tuples
struct TupleDictValuesOfFirstArg {};

// One argument: complex(args[0])
struct ComplexFirstArg {};

// Every list at any depth becomes a tuple
struct DeepTuple {};

} // namespace coercion

using CoercionStrategy = std::variant<
    coercion::Identity,
    coercion::TupleEachArg,
    coercion::TupleItemsOfEachArg,
    coercion::TupleItemsOfFirstArg,
    coercion::TupleSecondArg,
    coercion::SetItemsOfFirstArg,
    coercion::FloatAndComplexPair,
    coercion::TupleFirstArg,
    coercion::TupleOfTuplesEachArg,
    coercion::TupleFirstArgWithTupleItems,
    coercion::TupleDictValuesOfFirstArg,
    coercion::ComplexFirstArg,
    coercion::DeepTuple>;

// Extracts n from "Mbpp/<n>"
std::optional<unsigned> mbpp_task_number(std::string_view task_id) noexcept;

// Coercion the MBPP+ task @p task_id needs (Identity for unknown tasks)
CoercionStrategy coercion_for_mbpp_task(std::string_view task_id) noexcept;

/**
 * @brief Applies @p strategy to the argument list @p args
 *
 * @errors Throws std::runtime_error if @p args do not have the shape the
 *   strategy expects (e.g. too few arguments or a non-iterable value)
 */
Arguments apply_coercion(const CoercionStrategy& strategy, Arguments args);

// Python's tuple(@p val)
PyValue to_tuple(const PyValue& val);

// Python's tuple() applied recursively to every list in @p val
PyValue to_deep_tuple(const PyValue& val);

} // namespace solrank
