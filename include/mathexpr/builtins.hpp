#pragma once
#include <cstddef>
#include <functional>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mathexpr {

struct Builtin {
    static constexpr std::size_t kVariadic = std::numeric_limits<std::size_t>::max();

    std::size_t min_args{1};
    std::size_t max_args{1};
    // May throw std::domain_error for arguments outside the function's domain.
    double (*fn)(const std::vector<double>&){nullptr};

    bool accepts(std::size_t argc) const { return argc >= min_args && argc <= max_args; }
};

using ConstantTable = std::map<std::string, double, std::less<>>;
using FunctionTable = std::map<std::string, Builtin, std::less<>>;

// Names are case-insensitive: scope keys and table lookups use the lowercased form.
std::string fold_case(std::string_view name);

// Both tables are built on first use and never modified afterwards.
const ConstantTable& constants();
const FunctionTable& functions();

std::optional<double> find_constant(std::string_view name);
const Builtin* find_function(std::string_view name);

} // namespace mathexpr
