// examples/minimize.cpp
// Gradient descent on f(a, b) = a*a + b*b from a random start in [lo, hi].
// The derivative slot is a single aggregate, so each partial comes from its
// own pass with only that input seeded.
//
//   fad_minimize --seed=7 --lr=0.25 --tol=1e-5 --max_iter=1000
#include <algorithm>
#include <cmath>
#include <iostream>
#include <random>
#include <string>

#include "fad/all.hpp"

using fad::Dual;

// ---------- tiny CLI helpers ----------
static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& defval) {
    const std::string pref = "--" + key + "=";
    for (int i = 1; i < argc; ++i) {
        std::string s = argv[i];
        if (s.rfind(pref, 0) == 0) return s.substr(pref.size());
    }
    return defval;
}

static int get_arg_int(int argc, char** argv, const std::string& key, int defval) {
    try { return std::stoi(get_arg(argc, argv, key, std::to_string(defval))); }
    catch (const std::exception&) { return defval; }
}

static double get_arg_double(int argc, char** argv, const std::string& key, double defval) {
    try { return std::stod(get_arg(argc, argv, key, std::to_string(defval))); }
    catch (const std::exception&) { return defval; }
}

// ---------- objective ----------
template <class T>
static T func_f(const T& a, const T& b) {
    return a * a + b * b;
}

struct Eval {
    Dual fa;  // f with a seeded
    Dual fb;  // f with b seeded
    double value() const { return fa.value(); }
    double max_partial() const { return std::max(std::fabs(fa.derivative()), std::fabs(fb.derivative())); }
};

static Eval evaluate(double a, double b) {
    return { func_f(fad::variable(a), fad::constant(b)),
             func_f(fad::constant(a), fad::variable(b)) };
}

int main(int argc, char** argv) {
    const int    SEED     = get_arg_int(argc, argv, "seed", 0);
    const int    MAX_ITER = get_arg_int(argc, argv, "max_iter", 1000);
    const double LR       = get_arg_double(argc, argv, "lr", 0.25);
    const double TOL      = get_arg_double(argc, argv, "tol", 1e-5);
    const double LO       = get_arg_double(argc, argv, "lo", -10.0);
    const double HI       = get_arg_double(argc, argv, "hi", 10.0);
    if (get_arg(argc, argv, "trace", "0") == "1") fad::config::set_trace_enabled(true);

    std::mt19937 rng(static_cast<std::mt19937::result_type>(SEED));
    std::uniform_real_distribution<double> start(LO, HI);
    double a = start(rng);
    double b = start(rng);

    try {
        std::cout << "starting from " << a << "," << b << "\n";
        Eval e = evaluate(a, b);
        int it = 0;
        while (e.max_partial() > TOL) {
            if (++it > MAX_ITER) {
                std::cerr << "no convergence after " << MAX_ITER << " iterations\n";
                return 2;
            }
            std::cerr << "iteration, function, gradient = " << it << ", " << e.value()
                      << ", " << e.max_partial() << "\n";
            a -= LR * e.fa.derivative();
            b -= LR * e.fb.derivative();
            e = evaluate(a, b);
        }
        std::cout << "the minimum of f is at " << a << "," << b << "\n";
        std::cout << "the function value is:\n";
        fad::report(std::cout, e.fa, "f", "a");
        std::cout << "df/db = " << e.fb.derivative() << "\n";
    } catch (const fad::Error& ex) {
        std::cerr << "fad error: " << ex.what() << "\n";
        return 1;
    }
    return 0;
}
