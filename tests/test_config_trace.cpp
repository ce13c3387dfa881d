
// tests/test_config_trace.cpp
#include "test_framework.hpp"
#include <cstdio>
#include <string>

#include "fad/all.hpp"
#include "fad/core/trace.hpp"

using fad::Dual;
namespace config = fad::config;

TEST("config/print_precision_is_clamped") {
    config::set_print_precision(0);
    ASSERT_EQ(config::print_precision(), 1);
    config::set_print_precision(99);
    ASSERT_EQ(config::print_precision(), config::kMaxPrecision);
    config::set_print_precision(6);
    ASSERT_EQ(config::print_precision(), 6);
    config::set_print_precision(config::kDefaultPrecision);
}

TEST("config/scoped_trace_restores_previous_setting") {
    const bool before = config::trace_enabled();
    {
        config::ScopedTrace on(true);
        ASSERT_TRUE(config::trace_enabled());
        {
            config::ScopedTrace off(false);
            ASSERT_FALSE(config::trace_enabled());
        }
        ASSERT_TRUE(config::trace_enabled());
    }
    ASSERT_EQ(config::trace_enabled(), before);
}

TEST("config/tracing_does_not_change_results") {
    Dual x(1.2, 1.0);
    Dual quiet = fad::sin(x * x) / fad::pow(x, 2.0) - 3.0;
    Dual traced;
    {
        config::ScopedTrace on(true);
        traced = fad::sin(x * x) / fad::pow(x, 2.0) - 3.0;
    }
    ASSERT_EQ(quiet.value(), traced.value());
    ASSERT_EQ(quiet.derivative(), traced.derivative());
}

namespace {
std::string read_all(std::FILE* f) {
    std::string out;
    std::rewind(f);
    char buf[256];
    size_t n;
    while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) out.append(buf, n);
    return out;
}
} // anon

TEST("config/trace_lines_go_to_sink") {
    std::FILE* tmp = std::tmpfile();
    ASSERT_TRUE(tmp != nullptr);
    config::set_print_precision(config::kDefaultPrecision);
    fad::trace::set_sink(tmp);
    {
        config::ScopedTrace on(true);
        Dual x(3.0, 1.0);
        (void)(x * x);
        (void)fad::pow(2.0, Dual(3.0, 0.0));   // inactive exponent still traced
    }
    fad::trace::set_sink(nullptr);
    const std::string text = read_all(tmp);
    std::fclose(tmp);
    ASSERT_EQ(text, std::string("[FAD_TRACE] mul | (3, 1) (3, 1) -> (9, 6)\n"
                                "[FAD_TRACE] pow | (2, 0) (3, 0) -> (8, 0)\n"));
    ASSERT_TRUE(fad::trace::sink() == stderr);
}
