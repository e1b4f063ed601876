#pragma once

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "State.hpp"
#include "types.hpp"

namespace flowgraph {

enum class ConditionOperator { Exists, NotExists, Equals, NotEquals, Greater, Less, Contains };

const char* ToString(ConditionOperator op) noexcept;

// @throws ValidationError for names other than exists, not_exists, equals,
//         not_equals, greater, less, contains.
ConditionOperator ParseOperator(std::string_view name);

class Condition;
using ConditionPtr = std::shared_ptr<const Condition>;
using StatePredicate = std::function<bool(const State&)>;

/**
 * @brief Immutable boolean predicate tree over a State.
 *
 * @details
 * A Condition is one of:
 * - KeyTest  (key, operator, expected value)
 * - AllOf    short-circuits on the first false child
 * - AnyOf    short-circuits on the first true child
 * - NotOf    negates one child
 * - Constant always true / always false
 * - Native   wraps a caller-supplied predicate
 *
 * Evaluation is side-effect free and may run concurrently against distinct
 * states. Errors (TypeCoercionError, or whatever a Native predicate throws)
 * propagate immediately and stop the evaluation of the enclosing composite.
 *
 * Build instances with the Make* factories below.
 */
class Condition {
public:
    struct KeyTest {
        std::string key;
        ConditionOperator op;
        json::value expected;
    };
    struct AllOf {
        std::vector<ConditionPtr> children;
    };
    struct AnyOf {
        std::vector<ConditionPtr> children;
    };
    struct NotOf {
        ConditionPtr child;
    };
    struct Constant {
        bool value;
    };
    struct Native {
        StatePredicate fn;
    };

    using Variant = std::variant<KeyTest, AllOf, AnyOf, NotOf, Constant, Native>;

    Condition(Variant node, std::string description);

    bool Evaluate(const State& state) const;

    const std::string& description() const noexcept { return description_; }
    const Variant& node() const noexcept { return node_; }

private:
    Variant node_;
    std::string description_;
};

// "key 'k' exists"
ConditionPtr MakeKeyCondition(std::string key);

ConditionPtr MakeValueCondition(std::string key, json::value expected, ConditionOperator op);
ConditionPtr MakeValueCondition(std::string key, json::value expected, std::string_view op);

ConditionPtr MakeAnd(std::vector<ConditionPtr> children);
ConditionPtr MakeOr(std::vector<ConditionPtr> children);
ConditionPtr MakeNot(ConditionPtr child);
ConditionPtr MakeAlways(bool value);
ConditionPtr MakeCustom(std::string description, StatePredicate fn);

}  // namespace flowgraph
