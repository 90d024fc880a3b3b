#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "mathexpr/ast.hpp"
#include "mathexpr/evaluator.hpp"

namespace mathexpr {

enum class StepKind { Evaluation, Simplification, Substitution };

struct Step {
    std::size_t id{0};
    StepKind kind{StepKind::Evaluation};
    std::string description;
    std::string expression;
    std::optional<Value> result{};
};

class StepTracker {
public:
    void add_step(StepKind kind, std::string description, std::string expression,
                  std::optional<Value> result = std::nullopt);

    const std::vector<Step>& steps() const { return steps_; }
    void clear();

private:
    std::vector<Step> steps_;
    std::size_t next_id_{0};
};

struct Solution {
    Value result;
    std::vector<Step> steps;
};

/// Simplify, then evaluate, recording each stage in `tracker`.
/// The final value comes from the simplified tree. The returned Solution
/// holds only the steps added by this call; `tracker` keeps the full history.
Solution evaluate_with_steps(const NodePtr& node, Scope& scope, StepTracker& tracker);

const char* to_string(StepKind kind);

} // namespace mathexpr
