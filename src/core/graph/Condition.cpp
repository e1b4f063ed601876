#include "Condition.hpp"

#include <spdlog/spdlog.h>

#include <charconv>
#include <utility>

#include "Errors.hpp"

namespace flowgraph {

namespace {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

const char* kind_name(const json::value& v) {
    switch (v.kind()) {
        case json::kind::null:
            return "null";
        case json::kind::bool_:
            return "bool";
        case json::kind::int64:
        case json::kind::uint64:
        case json::kind::double_:
            return "number";
        case json::kind::string:
            return "string";
        case json::kind::array:
            return "array";
        case json::kind::object:
            return "object";
    }
    return "unknown";
}

double to_number(const json::value& v) {
    switch (v.kind()) {
        case json::kind::int64:
            return static_cast<double>(v.get_int64());
        case json::kind::uint64:
            return static_cast<double>(v.get_uint64());
        case json::kind::double_:
            return v.get_double();
        case json::kind::string: {
            std::string_view text = v.get_string();
            double out = 0.0;
            auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
            if (ec == std::errc() && ptr == text.data() + text.size() && !text.empty()) {
                return out;
            }
            throw TypeCoercionError("cannot convert string \"" + std::string(text) + "\" to number");
        }
        default:
            throw TypeCoercionError(std::string("cannot convert ") + kind_name(v) + " to number");
    }
}

bool contains(const json::value& container, const json::value& item) {
    switch (container.kind()) {
        case json::kind::string: {
            if (!item.is_string()) {
                throw TypeCoercionError(std::string("cannot check if string contains ") +
                                        kind_name(item));
            }
            std::string_view haystack = container.get_string();
            return haystack.find(std::string_view(item.get_string())) != std::string_view::npos;
        }
        case json::kind::array:
            for (const auto& element : container.get_array()) {
                if (element == item) return true;
            }
            return false;
        case json::kind::object:
            if (!item.is_string()) {
                throw TypeCoercionError(std::string("cannot check if object contains ") +
                                        kind_name(item) + " key");
            }
            return container.get_object().contains(item.get_string());
        default:
            throw TypeCoercionError(std::string("cannot check contains for ") + kind_name(container));
    }
}

bool evaluate_key_test(const Condition::KeyTest& test, const State& state) {
    auto value = state.Get(test.key);

    switch (test.op) {
        case ConditionOperator::Exists:
            return value.has_value();
        case ConditionOperator::NotExists:
            return !value.has_value();
        case ConditionOperator::Equals:
            return value && *value == test.expected;
        case ConditionOperator::NotEquals:
            return !value || *value != test.expected;
        case ConditionOperator::Greater:
            return value && to_number(*value) > to_number(test.expected);
        case ConditionOperator::Less:
            return value && to_number(*value) < to_number(test.expected);
        case ConditionOperator::Contains:
            return value && contains(*value, test.expected);
    }
    throw ValidationError("unknown condition operator");
}

std::string join_descriptions(const std::vector<ConditionPtr>& children, const char* separator) {
    std::string out = "(";
    for (size_t i = 0; i < children.size(); ++i) {
        if (i > 0) out += separator;
        out += children[i]->description();
    }
    out += ")";
    return out;
}

void require_children(const std::vector<ConditionPtr>& children, const char* combinator) {
    for (const auto& child : children) {
        if (!child) {
            throw ValidationError(std::string(combinator) + " condition has a null child");
        }
    }
}

}  // namespace

const char* ToString(ConditionOperator op) noexcept {
    switch (op) {
        case ConditionOperator::Exists:
            return "exists";
        case ConditionOperator::NotExists:
            return "not_exists";
        case ConditionOperator::Equals:
            return "equals";
        case ConditionOperator::NotEquals:
            return "not_equals";
        case ConditionOperator::Greater:
            return "greater";
        case ConditionOperator::Less:
            return "less";
        case ConditionOperator::Contains:
            return "contains";
    }
    return "unknown";
}

ConditionOperator ParseOperator(std::string_view name) {
    if (name == "exists") return ConditionOperator::Exists;
    if (name == "not_exists") return ConditionOperator::NotExists;
    if (name == "equals") return ConditionOperator::Equals;
    if (name == "not_equals") return ConditionOperator::NotEquals;
    if (name == "greater") return ConditionOperator::Greater;
    if (name == "less") return ConditionOperator::Less;
    if (name == "contains") return ConditionOperator::Contains;
    throw ValidationError("unknown operator: " + std::string(name));
}

// =========================================================
//  Condition
// =========================================================

Condition::Condition(Variant node, std::string description)
    : node_(std::move(node)), description_(std::move(description)) {}

bool Condition::Evaluate(const State& state) const {
    bool result = std::visit(
        overloaded{
            [&](const KeyTest& test) { return evaluate_key_test(test, state); },
            [&](const AllOf& all) {
                for (const auto& child : all.children) {
                    if (!child->Evaluate(state)) return false;
                }
                return true;
            },
            [&](const AnyOf& any) {
                for (const auto& child : any.children) {
                    if (child->Evaluate(state)) return true;
                }
                return false;
            },
            [&](const NotOf& negation) { return !negation.child->Evaluate(state); },
            [](const Constant& constant) { return constant.value; },
            [&](const Native& native) { return native.fn(state); },
        },
        node_);

    spdlog::trace("Condition [{}] -> {}", description_, result);
    return result;
}

// =========================================================
//  Factories
// =========================================================

ConditionPtr MakeKeyCondition(std::string key) {
    if (key.empty()) {
        throw ValidationError("condition key cannot be empty");
    }
    std::string description = "key '" + key + "' exists";
    return std::make_shared<const Condition>(
        Condition::KeyTest{std::move(key), ConditionOperator::Exists, nullptr},
        std::move(description));
}

ConditionPtr MakeValueCondition(std::string key, json::value expected, ConditionOperator op) {
    if (key.empty()) {
        throw ValidationError("condition key cannot be empty");
    }
    std::string description = "key '" + key + "' " + ToString(op);
    if (op != ConditionOperator::Exists && op != ConditionOperator::NotExists) {
        description += " " + json::serialize(expected);
    }
    return std::make_shared<const Condition>(
        Condition::KeyTest{std::move(key), op, std::move(expected)}, std::move(description));
}

ConditionPtr MakeValueCondition(std::string key, json::value expected, std::string_view op) {
    return MakeValueCondition(std::move(key), std::move(expected), ParseOperator(op));
}

ConditionPtr MakeAnd(std::vector<ConditionPtr> children) {
    require_children(children, "AND");
    std::string description = join_descriptions(children, " AND ");
    return std::make_shared<const Condition>(Condition::AllOf{std::move(children)},
                                             std::move(description));
}

ConditionPtr MakeOr(std::vector<ConditionPtr> children) {
    require_children(children, "OR");
    std::string description = join_descriptions(children, " OR ");
    return std::make_shared<const Condition>(Condition::AnyOf{std::move(children)},
                                             std::move(description));
}

ConditionPtr MakeNot(ConditionPtr child) {
    if (!child) {
        throw ValidationError("NOT condition has a null child");
    }
    std::string description = "NOT (" + child->description() + ")";
    return std::make_shared<const Condition>(Condition::NotOf{std::move(child)},
                                             std::move(description));
}

ConditionPtr MakeAlways(bool value) {
    return std::make_shared<const Condition>(Condition::Constant{value},
                                             value ? "always true" : "always false");
}

ConditionPtr MakeCustom(std::string description, StatePredicate fn) {
    if (!fn) {
        throw ValidationError("custom condition '" + description + "' has no predicate");
    }
    return std::make_shared<const Condition>(Condition::Native{std::move(fn)},
                                             std::move(description));
}

}  // namespace flowgraph
