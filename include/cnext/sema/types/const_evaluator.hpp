// cnext/sema/types/const_evaluator.hpp - Compile-time integer evaluation
//
// Folds integer expressions whose operands are known after name
// resolution: literals, enum members, foreign macro constants, const
// globals with constant initializers and T.MIN / T.MAX.
//
#pragma once

#include <cstdint>
#include <optional>

#include "cnext/ast/ast.hpp"

namespace cnext
{

/**
 * Value of `expr` if it is a compile-time integer constant.
 *
 * Silent: returns std::nullopt for anything that is not constant,
 * including division by zero and shifts past 63 bits.
 */
[[nodiscard]] std::optional<int64_t> evaluate_constant(const Expr * expr);

/// Same, but only accepts integer literals (optionally negated).
[[nodiscard]] std::optional<int64_t> literal_value(const Expr * expr);

}  // namespace cnext
