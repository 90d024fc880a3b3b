#include <mathexpr/expr.hpp>
#include <mathexpr/steps.hpp>

#include <iostream>
#include <string>
#include <vector>

namespace calc {

struct Options {
    bool simplify = false;
    bool steps = false;
    std::vector<std::string> expressions;
};

static Options parse_args(int argc, char** argv) {
    Options opt;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--simplify") opt.simplify = true;
        else if (arg == "--steps") opt.steps = true;
        else opt.expressions.push_back(std::move(arg));
    }
    return opt;
}

static void print_steps(const std::vector<mathexpr::Step>& steps) {
    for (const auto& s : steps) {
        std::cout << "  [" << s.id << "] " << mathexpr::to_string(s.kind) << ": " << s.description;
        if (s.description != s.expression) std::cout << "  " << s.expression;
        if (s.result && s.kind == mathexpr::StepKind::Evaluation)
            std::cout << " => " << mathexpr::to_string(*s.result);
        std::cout << "\n";
    }
}

// Returns false on error; the error has already been reported.
static bool run(const std::string& input, const Options& opt, mathexpr::Scope& scope) {
    try {
        if (opt.simplify) {
            std::cout << mathexpr::simplify_text(input) << "\n";
            return true;
        }
        if (opt.steps) {
            mathexpr::StepTracker tracker;
            auto solution = mathexpr::evaluate_with_steps(mathexpr::parse_expression(input), scope, tracker);
            print_steps(solution.steps);
            return true;
        }
        std::cout << mathexpr::to_string(mathexpr::calculate(input, scope)) << "\n";
        return true;
    } catch (const mathexpr::LexError& e) {
        std::cerr << "lex error: " << e.what() << "\n";
    } catch (const mathexpr::ParseError& e) {
        std::cerr << "parse error: " << e.what() << "\n";
    } catch (const mathexpr::EvalError& e) {
        std::cerr << "eval error: " << e.what() << "\n";
    }
    return false;
}

} // namespace calc

int main(int argc, char** argv) {
    calc::Options opt = calc::parse_args(argc, argv);

    // One scope for the whole session, so "x = 2" carries into later inputs.
    mathexpr::Scope scope;

    if (!opt.expressions.empty()) {
        for (const auto& e : opt.expressions)
            if (!calc::run(e, opt, scope)) return 1;
        return 0;
    }

    int status = 0;
    std::string line;
    while (std::getline(std::cin, line)) {
        if (line.find_first_not_of(" \t") == std::string::npos) continue;
        if (!calc::run(line, opt, scope)) status = 1;
    }
    return status;
}
