// fad_module.cpp — pybind11 bindings for fad::Dual and the elementary functions.
//
// Python resolves operand kinds at run time, so every incoming object goes
// through to_operand(): Dual, float, int and bool are accepted, anything else
// raises fad.UnsupportedOperand (a TypeError).
#include <pybind11/pybind11.h>

#include <optional>
#include <sstream>
#include <string>

#include "fad/all.hpp"

namespace py = pybind11;

#ifndef FAD_BINDINGS_VERSION
#define FAD_BINDINGS_VERSION "0.1.0"
#endif

namespace {

fad::Operand to_operand(py::handle h) {
  std::optional<fad::Dual> dual;
  std::optional<double> number;
  if (py::isinstance<fad::Dual>(h)) dual = h.cast<fad::Dual>();
  else if (py::isinstance<py::bool_>(h)) number = h.cast<bool>() ? 1.0 : 0.0;
  else if (py::isinstance<py::int_>(h) || py::isinstance<py::float_>(h)) number = h.cast<double>();
  return fad::resolve_operand(dual, number, Py_TYPE(h.ptr())->tp_name);
}

py::object to_python(const fad::Operand& x) {
  if (x.is_dual()) return py::cast(x.as_dual());
  return py::float_(x.value());
}

template <class Fn>
py::object binary(const fad::Dual& self, py::handle other, Fn fn) {
  return to_python(fn(fad::Operand(self), to_operand(other)));
}

template <class Fn>
py::object reflected(const fad::Dual& self, py::handle other, Fn fn) {
  return to_python(fn(to_operand(other), fad::Operand(self)));
}

// Relational operators compare values only; visit picks the Dual or plain overload.
template <class Cmp>
bool compare(const fad::Dual& self, py::handle other, Cmp cmp) {
  return to_operand(other).visit([&](const auto& v) { return cmp(self, v); });
}

template <class Fn>
void def_elementary(py::module_& m, const char* name, Fn fn, const char* doc) {
  m.def(name, [fn](py::object x) { return to_python(fn(to_operand(x))); }, py::arg("x"), doc);
}

} // anon

PYBIND11_MODULE(fad, m) {
  m.doc() = "Forward-mode automatic differentiation on (value, derivative) pairs";
  m.attr("__version__") = FAD_BINDINGS_VERSION;

  // --- errors ---
  py::register_exception<fad::Error>(m, "Error", PyExc_ArithmeticError);
  py::register_exception<fad::DivisionByZero>(m, "DivisionByZero", PyExc_ZeroDivisionError);
  py::register_exception<fad::DomainError>(m, "DomainError", PyExc_ValueError);
  py::register_exception<fad::UnsupportedOperand>(m, "UnsupportedOperand", PyExc_TypeError);

  // --- config ---
  m.def("set_trace_enabled", &fad::config::set_trace_enabled, py::arg("enabled"),
        "Print every propagated operation to stderr");
  m.def("trace_enabled", &fad::config::trace_enabled);
  m.def("set_print_precision", &fad::config::set_print_precision, py::arg("digits"));
  m.def("print_precision", &fad::config::print_precision);

  // --- Dual ---
  py::class_<fad::Dual>(m, "Dual")
    .def(py::init<double, double>(), py::arg("value"), py::arg("derivative") = 0.0)
    .def_property_readonly("value", &fad::Dual::value)
    .def_property_readonly("derivative", &fad::Dual::derivative)
    .def("is_active", &fad::Dual::is_active)
    .def("__repr__", [](const fad::Dual& x) { return fad::to_string(x); })
    .def("report", [](const fad::Dual& x, const std::string& f, const std::string& wrt) {
      std::ostringstream oss;
      fad::report(oss, x, f, wrt);
      py::print(oss.str(), py::arg("end") = "");
    }, py::arg("f") = "f", py::arg("wrt") = "x")

    // arithmetic with reflected forms
    .def("__add__",      [](const fad::Dual& s, py::object o) { return binary(s, o, [](auto a, auto b) { return fad::add(a, b); }); })
    .def("__radd__",     [](const fad::Dual& s, py::object o) { return reflected(s, o, [](auto a, auto b) { return fad::add(a, b); }); })
    .def("__sub__",      [](const fad::Dual& s, py::object o) { return binary(s, o, [](auto a, auto b) { return fad::sub(a, b); }); })
    .def("__rsub__",     [](const fad::Dual& s, py::object o) { return reflected(s, o, [](auto a, auto b) { return fad::sub(a, b); }); })
    .def("__mul__",      [](const fad::Dual& s, py::object o) { return binary(s, o, [](auto a, auto b) { return fad::mul(a, b); }); })
    .def("__rmul__",     [](const fad::Dual& s, py::object o) { return reflected(s, o, [](auto a, auto b) { return fad::mul(a, b); }); })
    .def("__truediv__",  [](const fad::Dual& s, py::object o) { return binary(s, o, [](auto a, auto b) { return fad::div(a, b); }); })
    .def("__rtruediv__", [](const fad::Dual& s, py::object o) { return reflected(s, o, [](auto a, auto b) { return fad::div(a, b); }); })
    .def("__pow__",      [](const fad::Dual& s, py::object o) { return binary(s, o, [](auto a, auto b) { return fad::pow(a, b); }); })
    .def("__rpow__",     [](const fad::Dual& s, py::object o) { return reflected(s, o, [](auto a, auto b) { return fad::pow(a, b); }); })
    .def("__neg__", [](const fad::Dual& s) { return -s; })
    .def("__pos__", [](const fad::Dual& s) { return s; })
    .def("__abs__", [](const fad::Dual& s) { return fad::abs(s); })

    // comparisons on values only
    .def("__lt__", [](const fad::Dual& s, py::object o) { return compare(s, o, [](const auto& a, const auto& b) { return a <  b; }); })
    .def("__le__", [](const fad::Dual& s, py::object o) { return compare(s, o, [](const auto& a, const auto& b) { return a <= b; }); })
    .def("__gt__", [](const fad::Dual& s, py::object o) { return compare(s, o, [](const auto& a, const auto& b) { return a >  b; }); })
    .def("__ge__", [](const fad::Dual& s, py::object o) { return compare(s, o, [](const auto& a, const auto& b) { return a >= b; }); })
    .def("__eq__", [](const fad::Dual& s, py::object o) { return compare(s, o, [](const auto& a, const auto& b) { return a == b; }); })
    .def("__ne__", [](const fad::Dual& s, py::object o) { return compare(s, o, [](const auto& a, const auto& b) { return a != b; }); });

  m.def("variable", &fad::variable, py::arg("value"), "Active independent variable (derivative 1)");
  m.def("constant", &fad::constant, py::arg("value"), "Inactive input (derivative 0)");

  // --- elementary functions: Dual in -> Dual out, number in -> float out ---
  def_elementary(m, "sin",  [](const fad::Operand& x) { return fad::sin(x); },  "sin with chain rule");
  def_elementary(m, "cos",  [](const fad::Operand& x) { return fad::cos(x); },  "cos with chain rule");
  def_elementary(m, "tan",  [](const fad::Operand& x) { return fad::tan(x); },  "tan with chain rule");
  def_elementary(m, "exp",  [](const fad::Operand& x) { return fad::exp(x); },  "exp with chain rule");
  def_elementary(m, "log",  [](const fad::Operand& x) { return fad::log(x); },  "natural log; DomainError for x <= 0");
  def_elementary(m, "sqrt", [](const fad::Operand& x) { return fad::sqrt(x); }, "sqrt; DomainError for x < 0");
}
