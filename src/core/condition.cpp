// src/core/condition.cpp
#include "core/types/condition.h"
#include "core/types/errors.h"
#include "core/types/node.h"
#include "modules/registry/node_registry.h"
#include <variant>
#include <stdexcept>

namespace motionchart {

struct Condition::Expr {
    struct Literal {
        bool value;
    };
    struct Reference {
        NodeName node;
        Predicate predicate;
    };
    struct Binary {
        Condition lhs;
        Condition rhs;
    };
    struct Negation {
        Condition operand;
    };

    Kind kind;
    std::variant<Literal, Reference, Binary, Negation> value;
};

namespace {

bool test_predicate(Predicate predicate, LifecycleState state, bool observed) {
    switch (predicate) {
        case Predicate::IS_DORMANT:  return state == LifecycleState::DORMANT;
        case Predicate::IS_RUNNING:  return state == LifecycleState::RUNNING;
        case Predicate::IS_PAUSED:   return state == LifecycleState::PAUSED;
        case Predicate::IS_ENDED:    return state == LifecycleState::ENDED;
        case Predicate::IS_OBSERVED: return observed;
    }
    return false;
}

// Accepts a single condition or an array of conditions under all_of / any_of
std::vector<nlohmann::json> operand_list(const nlohmann::json& j, const std::string& key) {
    std::vector<nlohmann::json> items;
    if (j.is_array()) {
        for (const auto& item : j) {
            items.push_back(item);
        }
    } else if (j.is_object() || j.is_boolean()) {
        items.push_back(j);
    } else {
        throw StatechartParseError("'" + key + "' must be a condition or a list of conditions: " + j.dump());
    }
    return items;
}

} // namespace

// ————————————————————————
// Construction
// ————————————————————————

Condition Condition::literal(bool value) {
    return Condition(std::make_shared<const Expr>(Expr{Kind::LITERAL, Expr::Literal{value}}));
}

Condition Condition::reference(NodeName node, Predicate predicate) {
    return Condition(std::make_shared<const Expr>(
        Expr{Kind::REFERENCE, Expr::Reference{std::move(node), predicate}}));
}

Condition Condition::and_(const Condition& lhs, const Condition& rhs) {
    return Condition(std::make_shared<const Expr>(Expr{Kind::AND, Expr::Binary{lhs, rhs}}));
}

Condition Condition::or_(const Condition& lhs, const Condition& rhs) {
    return Condition(std::make_shared<const Expr>(Expr{Kind::OR, Expr::Binary{lhs, rhs}}));
}

Condition Condition::not_(const Condition& operand) {
    return Condition(std::make_shared<const Expr>(Expr{Kind::NOT, Expr::Negation{operand}}));
}

Condition Condition::conjoin(const Condition& lhs, const Condition& rhs) {
    if (lhs.is_false() || rhs.is_false()) return literal(false);
    if (lhs.is_true()) return rhs;
    if (rhs.is_true()) return lhs;
    return and_(lhs, rhs);
}

Condition Condition::disjoin(const Condition& lhs, const Condition& rhs) {
    if (lhs.is_true() || rhs.is_true()) return literal(true);
    if (lhs.is_false()) return rhs;
    if (rhs.is_false()) return lhs;
    return or_(lhs, rhs);
}

// ————————————————————————
// Evaluation
// ————————————————————————

template <typename Lookup>
bool Condition::evaluate_with(const Lookup& lookup) const {
    switch (expr_->kind) {
        case Kind::LITERAL:
            return std::get<Expr::Literal>(expr_->value).value;
        case Kind::REFERENCE: {
            const auto& ref = std::get<Expr::Reference>(expr_->value);
            const auto [state, observed] = lookup(ref.node);
            return test_predicate(ref.predicate, state, observed);
        }
        case Kind::AND: {
            // 两侧都求值，保证未解析的引用总会报错
            const auto& bin = std::get<Expr::Binary>(expr_->value);
            const bool lhs = bin.lhs.evaluate_with(lookup);
            const bool rhs = bin.rhs.evaluate_with(lookup);
            return lhs && rhs;
        }
        case Kind::OR: {
            const auto& bin = std::get<Expr::Binary>(expr_->value);
            const bool lhs = bin.lhs.evaluate_with(lookup);
            const bool rhs = bin.rhs.evaluate_with(lookup);
            return lhs || rhs;
        }
        case Kind::NOT:
            return !std::get<Expr::Negation>(expr_->value).operand.evaluate_with(lookup);
    }
    throw std::logic_error("Unknown condition kind");
}

bool Condition::evaluate(const NodeRegistry& registry) const {
    return evaluate_with([&registry](const NodeName& name) {
        const GraphNode* node = registry.find(name);
        if (node == nullptr) {
            throw UnresolvedReferenceError(name);
        }
        return std::pair<LifecycleState, bool>{node->state(), node->last_observation()};
    });
}

bool Condition::evaluate(const StateSnapshot& snapshot) const {
    return evaluate_with([&snapshot](const NodeName& name) {
        const StateSnapshot::Entry* entry = snapshot.find(name);
        if (entry == nullptr) {
            throw UnresolvedReferenceError(name);
        }
        return std::pair<LifecycleState, bool>{entry->state, entry->observed};
    });
}

// ————————————————————————
// Inspection
// ————————————————————————

Condition::Kind Condition::kind() const {
    return expr_->kind;
}

bool Condition::is_true() const {
    return expr_->kind == Kind::LITERAL && std::get<Expr::Literal>(expr_->value).value;
}

bool Condition::is_false() const {
    return expr_->kind == Kind::LITERAL && !std::get<Expr::Literal>(expr_->value).value;
}

void Condition::collect_references(std::vector<std::pair<NodeName, Predicate>>& out) const {
    switch (expr_->kind) {
        case Kind::LITERAL:
            break;
        case Kind::REFERENCE: {
            const auto& ref = std::get<Expr::Reference>(expr_->value);
            out.emplace_back(ref.node, ref.predicate);
            break;
        }
        case Kind::AND:
        case Kind::OR: {
            const auto& bin = std::get<Expr::Binary>(expr_->value);
            bin.lhs.collect_references(out);
            bin.rhs.collect_references(out);
            break;
        }
        case Kind::NOT:
            std::get<Expr::Negation>(expr_->value).operand.collect_references(out);
            break;
    }
}

std::vector<std::pair<NodeName, Predicate>> Condition::references() const {
    std::vector<std::pair<NodeName, Predicate>> out;
    collect_references(out);
    return out;
}

std::set<NodeName> Condition::referenced_nodes() const {
    std::set<NodeName> names;
    for (const auto& [name, predicate] : references()) {
        names.insert(name);
    }
    return names;
}

std::string Condition::to_string() const {
    switch (expr_->kind) {
        case Kind::LITERAL:
            return is_true() ? "True" : "False";
        case Kind::REFERENCE: {
            const auto& ref = std::get<Expr::Reference>(expr_->value);
            return ref.node + "." + motionchart::to_string(ref.predicate);
        }
        case Kind::AND: {
            const auto& bin = std::get<Expr::Binary>(expr_->value);
            return "(" + bin.lhs.to_string() + " and " + bin.rhs.to_string() + ")";
        }
        case Kind::OR: {
            const auto& bin = std::get<Expr::Binary>(expr_->value);
            return "(" + bin.lhs.to_string() + " or " + bin.rhs.to_string() + ")";
        }
        case Kind::NOT:
            return "not " + std::get<Expr::Negation>(expr_->value).operand.to_string();
    }
    return "";
}

// ————————————————————————
// JSON
// ————————————————————————

nlohmann::json Condition::to_json() const {
    switch (expr_->kind) {
        case Kind::LITERAL:
            return is_true();
        case Kind::REFERENCE: {
            const auto& ref = std::get<Expr::Reference>(expr_->value);
            return nlohmann::json{{motionchart::to_string(ref.predicate), ref.node}};
        }
        case Kind::AND:
        case Kind::OR: {
            // Left-nested chains of the same operator flatten into one list;
            // from_json folds lists to the left, so the tree shape survives.
            std::vector<const Condition*> chain;
            const Condition* current = this;
            while (current->kind() == expr_->kind) {
                const auto& bin = std::get<Expr::Binary>(current->expr_->value);
                chain.push_back(&bin.rhs);
                current = &bin.lhs;
            }
            nlohmann::json items = nlohmann::json::array();
            items.push_back(current->to_json());
            for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
                items.push_back((*it)->to_json());
            }
            return nlohmann::json{{expr_->kind == Kind::AND ? "all_of" : "any_of", items}};
        }
        case Kind::NOT:
            return nlohmann::json{{"not", std::get<Expr::Negation>(expr_->value).operand.to_json()}};
    }
    return nullptr;
}

Condition Condition::from_json(const nlohmann::json& j) {
    if (j.is_boolean()) {
        return literal(j.get<bool>());
    }
    if (!j.is_object() || j.size() != 1) {
        throw StatechartParseError("Invalid condition: " + j.dump());
    }

    const std::string key = j.begin().key();
    const nlohmann::json& body = j.begin().value();

    if (key == "all_of" || key == "any_of") {
        const bool conjunction = (key == "all_of");
        auto items = operand_list(body, key);
        if (items.empty()) {
            // 空列表取各自的单位元
            return literal(conjunction);
        }
        Condition result = from_json(items.front());
        for (size_t i = 1; i < items.size(); ++i) {
            Condition next = from_json(items[i]);
            result = conjunction ? and_(result, next) : or_(result, next);
        }
        return result;
    }

    if (key == "not") {
        return not_(from_json(body));
    }

    auto predicate = parse_predicate(key);
    if (!predicate.has_value()) {
        throw StatechartParseError("Unknown condition key '" + key + "'");
    }
    if (!body.is_string() || body.get<std::string>().empty()) {
        throw StatechartParseError("Condition '" + key + "' must name a node: " + j.dump());
    }
    return reference(body.get<std::string>(), predicate.value());
}

bool Condition::operator==(const Condition& other) const {
    if (expr_ == other.expr_) return true;
    if (expr_->kind != other.expr_->kind) return false;

    switch (expr_->kind) {
        case Kind::LITERAL:
            return is_true() == other.is_true();
        case Kind::REFERENCE: {
            const auto& a = std::get<Expr::Reference>(expr_->value);
            const auto& b = std::get<Expr::Reference>(other.expr_->value);
            return a.node == b.node && a.predicate == b.predicate;
        }
        case Kind::AND:
        case Kind::OR: {
            const auto& a = std::get<Expr::Binary>(expr_->value);
            const auto& b = std::get<Expr::Binary>(other.expr_->value);
            return a.lhs == b.lhs && a.rhs == b.rhs;
        }
        case Kind::NOT:
            return std::get<Expr::Negation>(expr_->value).operand ==
                   std::get<Expr::Negation>(other.expr_->value).operand;
    }
    return false;
}

} // namespace motionchart
