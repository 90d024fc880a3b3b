#include "mathexpr/builtins.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <numeric>
#include <stdexcept>

namespace mathexpr {

namespace {

using Args = std::vector<double>;

bool is_whole(double x) { return std::isfinite(x) && std::floor(x) == x; }

double factorial_of(double n) {
    if (n < 0 || !is_whole(n)) throw std::domain_error("factorial is only defined for non-negative integers");
    // 171! is past the largest finite double.
    if (n > 170) return std::numeric_limits<double>::infinity();
    double r = 1.0;
    for (double i = 2; i <= n; ++i) r *= i;
    return r;
}

void require_n_r(double n, double r, const char* what) {
    if (n < 0 || r < 0 || !is_whole(n) || !is_whole(r) || r > n)
        throw std::domain_error(std::string(what) + " is only defined for non-negative integers with r <= n");
}

// -----------------------------
// combinatorics
// -----------------------------
double factorial(const Args& a) { return factorial_of(a[0]); }

// Running products instead of factorial ratios, so large n stays finite
// as long as the result does.
double ncr(const Args& a) {
    require_n_r(a[0], a[1], "ncr");
    const double n = a[0];
    const double r = std::min(a[1], n - a[1]);
    double res = 1.0;
    for (double i = 1; i <= r && std::isfinite(res); ++i) res = res * (n - r + i) / i;
    return res;
}

double npr(const Args& a) {
    require_n_r(a[0], a[1], "npr");
    double res = 1.0;
    for (double i = 0; i < a[1] && std::isfinite(res); ++i) res *= a[0] - i;
    return res;
}

// -----------------------------
// financial
// -----------------------------
double pv(const Args& a) { return a[0] / std::pow(1 + a[1], a[2]); }
double fv(const Args& a) { return a[0] * std::pow(1 + a[1], a[2]); }
double pmt(const Args& a) { return (a[0] * a[1]) / (1 - std::pow(1 + a[1], -a[2])); }

// npv(rate, cf1, cf2, ...): first cash flow is discounted one period.
double npv(const Args& a) {
    double acc = 0.0;
    for (std::size_t i = 1; i < a.size(); ++i) acc += a[i] / std::pow(1 + a[0], static_cast<double>(i));
    return acc;
}

double irr(const Args& cf) {
    double guess = 0.1;
    for (int iter = 0; iter < 100; ++iter) {
        double value = 0.0;
        double slope = 0.0;
        for (std::size_t i = 0; i < cf.size(); ++i) {
            const double t = static_cast<double>(i);
            value += cf[i] / std::pow(1 + guess, t);
            if (i > 0) slope -= t * cf[i] / std::pow(1 + guess, t + 1);
        }
        const double next = guess - value / slope;
        if (std::abs(next - guess) < 1e-7) return next;
        guess = next;
    }
    throw std::domain_error("irr did not converge");
}

// -----------------------------
// statistics (population)
// -----------------------------
bool has_nan(const Args& a) {
    return std::any_of(a.begin(), a.end(), [](double x) { return std::isnan(x); });
}

double mean(const Args& a) {
    return std::accumulate(a.begin(), a.end(), 0.0) / static_cast<double>(a.size());
}

double median(const Args& a) {
    if (has_nan(a)) return std::nan("");
    Args s = a;
    std::sort(s.begin(), s.end());
    const std::size_t mid = s.size() / 2;
    return s.size() % 2 == 0 ? (s[mid - 1] + s[mid]) / 2 : s[mid];
}

// Most frequent value; ties go to the smallest.
double mode(const Args& a) {
    if (has_nan(a)) return std::nan("");
    std::map<double, std::size_t> freq;
    for (double x : a) ++freq[x];
    double best = a[0];
    std::size_t best_count = 0;
    for (const auto& [value, count] : freq) {
        if (count > best_count) {
            best = value;
            best_count = count;
        }
    }
    return best;
}

double variance(const Args& a) {
    const double m = mean(a);
    double acc = 0.0;
    for (double x : a) acc += (x - m) * (x - m);
    return acc / static_cast<double>(a.size());
}

double stddev(const Args& a) { return std::sqrt(variance(a)); }

double min_of(const Args& a) { return has_nan(a) ? std::nan("") : *std::min_element(a.begin(), a.end()); }
double max_of(const Args& a) { return has_nan(a) ? std::nan("") : *std::max_element(a.begin(), a.end()); }

constexpr std::size_t kAny = Builtin::kVariadic;

} // namespace

const ConstantTable& constants() {
    static const ConstantTable table{
        {"pi", std::acos(-1.0)},
        {"e", std::exp(1.0)},
    };
    return table;
}

const FunctionTable& functions() {
    static const FunctionTable table{
        {"sin",   {1, 1, [](const Args& a) { return std::sin(a[0]); }}},
        {"cos",   {1, 1, [](const Args& a) { return std::cos(a[0]); }}},
        {"tan",   {1, 1, [](const Args& a) { return std::tan(a[0]); }}},
        {"asin",  {1, 1, [](const Args& a) { return std::asin(a[0]); }}},
        {"acos",  {1, 1, [](const Args& a) { return std::acos(a[0]); }}},
        {"atan",  {1, 1, [](const Args& a) { return std::atan(a[0]); }}},
        {"sinh",  {1, 1, [](const Args& a) { return std::sinh(a[0]); }}},
        {"cosh",  {1, 1, [](const Args& a) { return std::cosh(a[0]); }}},
        {"tanh",  {1, 1, [](const Args& a) { return std::tanh(a[0]); }}},
        {"asinh", {1, 1, [](const Args& a) { return std::asinh(a[0]); }}},
        {"acosh", {1, 1, [](const Args& a) { return std::acosh(a[0]); }}},
        {"atanh", {1, 1, [](const Args& a) { return std::atanh(a[0]); }}},
        {"ln",    {1, 1, [](const Args& a) { return std::log(a[0]); }}},
        {"log",   {1, 1, [](const Args& a) { return std::log10(a[0]); }}},
        {"log10", {1, 1, [](const Args& a) { return std::log10(a[0]); }}},
        {"log2",  {1, 1, [](const Args& a) { return std::log2(a[0]); }}},
        {"sqrt",  {1, 1, [](const Args& a) { return std::sqrt(a[0]); }}},
        {"abs",   {1, 1, [](const Args& a) { return std::abs(a[0]); }}},
        {"exp",   {1, 1, [](const Args& a) { return std::exp(a[0]); }}},
        {"floor", {1, 1, [](const Args& a) { return std::floor(a[0]); }}},
        {"ceil",  {1, 1, [](const Args& a) { return std::ceil(a[0]); }}},
        {"round", {1, 1, [](const Args& a) { return std::floor(a[0] + 0.5); }}},
        {"pow",   {2, 2, [](const Args& a) { return std::pow(a[0], a[1]); }}},
        {"min",   {1, kAny, &min_of}},
        {"max",   {1, kAny, &max_of}},

        {"factorial", {1, 1, &factorial}},
        {"ncr",       {2, 2, &ncr}},
        {"npr",       {2, 2, &npr}},

        {"pv",  {3, 3, &pv}},
        {"fv",  {3, 3, &fv}},
        {"pmt", {3, 3, &pmt}},
        {"npv", {1, kAny, &npv}},
        {"irr", {2, kAny, &irr}},

        {"mean",     {1, kAny, &mean}},
        {"median",   {1, kAny, &median}},
        {"mode",     {1, kAny, &mode}},
        {"stddev",   {1, kAny, &stddev}},
        {"variance", {1, kAny, &variance}},
    };
    return table;
}

std::string fold_case(std::string_view name) {
    std::string out(name);
    for (char& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

std::optional<double> find_constant(std::string_view name) {
    const auto& table = constants();
    auto it = table.find(fold_case(name));
    if (it == table.end()) return std::nullopt;
    return it->second;
}

const Builtin* find_function(std::string_view name) {
    const auto& table = functions();
    auto it = table.find(fold_case(name));
    return it == table.end() ? nullptr : &it->second;
}

} // namespace mathexpr
