#pragma once
#include <hnmd/pipe/ExpressionEvaluator.hpp>

namespace HN {

/**
 * PathExpressionEvaluator: a small built-in evaluator for documents that only
 * read values out of the context.
 *
 * Supported forms:
 *   .                      the context itself
 *   .a.b[0]  a.b[-1]       field and index access; the leading dot is optional
 *   lhs // rhs             rhs when lhs is null or false
 *   "text" 12 true null    literals
 *   expr | length          string, array or object size
 *
 * Reading a missing field yields null. Indexing a value of the wrong type is
 * an EvalError, as is any syntax outside the forms above.
 */
class PathExpressionEvaluator : public ExpressionEvaluator {
public:
    auto evaluate(std::string_view expression, Value const& context) -> Expected<Value> override;
};

} // namespace HN
