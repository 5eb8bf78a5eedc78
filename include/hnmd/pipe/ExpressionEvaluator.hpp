#pragma once
#include <hnmd/core/Error.hpp>
#include <hnmd/core/Value.hpp>

#include <string_view>

namespace HN {

/**
 * ExpressionEvaluator: the jq-like expression engine, seen from the runtime.
 *
 * Contract
 * --------
 * - evaluate(...) is pure: the same expression and context always produce the
 *   same result and nothing outside the return value is touched.
 * - Failures are returned as Error::Code::EvalError; implementations must not throw.
 * - Implementations must tolerate concurrent calls; the render thread and pipe
 *   recomputation may evaluate at the same time as filter compilation.
 */
struct ExpressionEvaluator {
    virtual ~ExpressionEvaluator() = default;

    virtual auto evaluate(std::string_view expression, Value const& context) -> Expected<Value> = 0;
};

} // namespace HN
