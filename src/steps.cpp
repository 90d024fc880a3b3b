#include "mathexpr/steps.hpp"
#include "mathexpr/format.hpp"
#include "mathexpr/simplifier.hpp"

namespace mathexpr {

void StepTracker::add_step(StepKind kind, std::string description, std::string expression,
                           std::optional<Value> result) {
    steps_.push_back(Step{next_id_++, kind, std::move(description), std::move(expression), std::move(result)});
}

void StepTracker::clear() {
    steps_.clear();
    next_id_ = 0;
}

const char* to_string(StepKind kind) {
    switch (kind) {
        case StepKind::Evaluation:     return "evaluation";
        case StepKind::Simplification: return "simplification";
        case StepKind::Substitution:   return "substitution";
    }
    return "unknown";
}

static std::string describe_bindings(const Scope& scope) {
    std::string out;
    for (const auto& [name, binding] : scope) {
        if (!std::holds_alternative<double>(binding)) continue;
        if (!out.empty()) out += ", ";
        out += name + " = " + format_number(std::get<double>(binding));
    }
    return out;
}

Solution evaluate_with_steps(const NodePtr& node, Scope& scope, StepTracker& tracker) {
    const std::size_t first = tracker.steps().size();
    const std::string original = to_string(*node);
    tracker.add_step(StepKind::Evaluation, "Original expression", original);

    NodePtr simplified = simplify_ast(node);
    const std::string simplified_text = to_string(*simplified);
    if (simplified_text != original)
        tracker.add_step(StepKind::Simplification, "Simplified expression", simplified_text);

    const std::string bindings = describe_bindings(scope);
    if (!bindings.empty())
        tracker.add_step(StepKind::Substitution, "Substitute values: " + bindings, simplified_text);

    Value result = evaluate_ast(*simplified, scope);
    tracker.add_step(StepKind::Evaluation, "Final result", simplified_text, result);

    const auto& all = tracker.steps();
    return Solution{std::move(result), std::vector<Step>(all.begin() + static_cast<std::ptrdiff_t>(first), all.end())};
}

} // namespace mathexpr
