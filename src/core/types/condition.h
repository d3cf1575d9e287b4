#ifndef MOTIONCHART_TYPES_CONDITION_H
#define MOTIONCHART_TYPES_CONDITION_H

#include "lifecycle.h" // 引入 NodeName, Predicate, StateSnapshot
#include <cstdint>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace motionchart {

class NodeRegistry;

// Immutable boolean formula over node lifecycle predicates.
//
// A Condition is a value: copies share the same immutable tree, and
// evaluating it never mutates anything. and_/or_/not_ build the exact
// tree they are given; conjoin/disjoin are the composition helpers and
// apply the neutral-element collapses (True AND x = x, False OR x = x,
// False AND x = False, True OR x = True).
class Condition {
public:
    enum class Kind : uint8_t {
        LITERAL,
        REFERENCE,
        AND,
        OR,
        NOT
    };

    static Condition literal(bool value);
    static Condition reference(NodeName node, Predicate predicate);
    static Condition and_(const Condition& lhs, const Condition& rhs);
    static Condition or_(const Condition& lhs, const Condition& rhs);
    static Condition not_(const Condition& operand);

    static Condition conjoin(const Condition& lhs, const Condition& rhs);
    static Condition disjoin(const Condition& lhs, const Condition& rhs);

    // Throws UnresolvedReferenceError when a leaf names an unknown node.
    bool evaluate(const NodeRegistry& registry) const;
    bool evaluate(const StateSnapshot& snapshot) const;

    Kind kind() const;
    bool is_true() const;
    bool is_false() const;

    // Every (node, predicate) leaf, left to right.
    std::vector<std::pair<NodeName, Predicate>> references() const;
    std::set<NodeName> referenced_nodes() const;

    // e.g. "(reach.ended and not collision.running)"
    std::string to_string() const;

    // Structural JSON form, see StatechartParser for the grammar.
    nlohmann::json to_json() const;
    static Condition from_json(const nlohmann::json& j);

    bool operator==(const Condition& other) const;
    bool operator!=(const Condition& other) const { return !(*this == other); }

private:
    struct Expr;

    explicit Condition(std::shared_ptr<const Expr> expr) : expr_(std::move(expr)) {}

    template <typename Lookup>
    bool evaluate_with(const Lookup& lookup) const;

    void collect_references(std::vector<std::pair<NodeName, Predicate>>& out) const;

    std::shared_ptr<const Expr> expr_;
};

} // namespace motionchart

#endif // MOTIONCHART_TYPES_CONDITION_H
