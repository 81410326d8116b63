#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <pybind11/operators.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "asymunc/api/expression.hpp"
#include "asymunc/api/propagator.hpp"
#include "asymunc/api/uncertain_value.hpp"
#include "asymunc/core/errors.hpp"
#include "asymunc/io/value_json.hpp"
#include "asymunc/stats/rounding.hpp"
#include "asymunc/symbolic/formula.hpp"

namespace py = pybind11;

namespace {

class PyPropagator {
 public:
  explicit PyPropagator(const asymunc::PropagationConfig& config) : impl_(asymunc::make_propagator(config)) {}

  asymunc::Result evaluate(const asymunc::Expression& expression) { return impl_->evaluate(expression); }

  std::vector<double> sample(const asymunc::Expression& expression) { return impl_->sample(expression).data(); }

  std::vector<double> samples_for(const asymunc::UncertainValue& value) { return impl_->samples_for(value).data(); }

  void clear_cache() { impl_->clear_cache(); }

  std::string diagnostics_json() const { return impl_->diagnostics_json(); }

 private:
  std::unique_ptr<asymunc::IPropagator> impl_;
};

}  // namespace

PYBIND11_MODULE(_asymunc, m) {
  m.doc() = "Monte Carlo propagation of asymmetric uncertainties";

  py::register_exception<asymunc::InvalidParameterError>(m, "InvalidParameterError", PyExc_ValueError);
  py::register_exception<asymunc::InsufficientSamplesError>(m, "InsufficientSamplesError", PyExc_RuntimeError);

  py::enum_<asymunc::DistributionKind>(m, "DistributionKind")
      .value("Normal", asymunc::DistributionKind::Normal)
      .value("AsymmetricNormal", asymunc::DistributionKind::AsymmetricNormal)
      .value("Uniform", asymunc::DistributionKind::Uniform)
      .value("Triangular", asymunc::DistributionKind::Triangular);

  py::class_<asymunc::ValueSpec>(m, "ValueSpec")
      .def(py::init<>())
      .def_readwrite("nominal", &asymunc::ValueSpec::nominal)
      .def_readwrite("lower_uncertainty", &asymunc::ValueSpec::lower_uncertainty)
      .def_readwrite("upper_uncertainty", &asymunc::ValueSpec::upper_uncertainty)
      .def_readwrite("kind", &asymunc::ValueSpec::kind)
      .def_readwrite("lower_limit", &asymunc::ValueSpec::lower_limit)
      .def_readwrite("upper_limit", &asymunc::ValueSpec::upper_limit)
      .def_readwrite("seed", &asymunc::ValueSpec::seed)
      .def_readwrite("conserve_mean", &asymunc::ValueSpec::conserve_mean);

  py::class_<asymunc::PropagationConfig>(m, "PropagationConfig")
      .def(py::init<>())
      .def_readwrite("trial_count", &asymunc::PropagationConfig::trial_count)
      .def_readwrite("coverage", &asymunc::PropagationConfig::coverage)
      .def_readwrite("seed", &asymunc::PropagationConfig::seed)
      .def_readwrite("minimum_valid_samples", &asymunc::PropagationConfig::minimum_valid_samples)
      .def_readwrite("threads", &asymunc::PropagationConfig::threads)
      .def_readwrite("block_size", &asymunc::PropagationConfig::block_size)
      .def_readwrite("cache_samples", &asymunc::PropagationConfig::cache_samples);

  py::class_<asymunc::Result>(m, "Result")
      .def_readonly("mean", &asymunc::Result::mean)
      .def_readonly("lower_bound", &asymunc::Result::lower_bound)
      .def_readonly("upper_bound", &asymunc::Result::upper_bound)
      .def_readonly("coverage", &asymunc::Result::coverage)
      .def_readonly("mode", &asymunc::Result::mode)
      .def_readonly("median", &asymunc::Result::median)
      .def_readonly("standard_deviation", &asymunc::Result::standard_deviation)
      .def_readonly("invalid_fraction", &asymunc::Result::invalid_fraction)
      .def_readonly("valid_count", &asymunc::Result::valid_count)
      .def_readonly("trial_count", &asymunc::Result::trial_count)
      .def("lower_uncertainty", &asymunc::Result::lower_uncertainty)
      .def("upper_uncertainty", &asymunc::Result::upper_uncertainty)
      .def("to_json", [](const asymunc::Result& r) { return asymunc::to_json(r); })
      .def("__str__", [](const asymunc::Result& r) { return asymunc::to_string(r); });

  py::class_<asymunc::Expression>(m, "Expression")
      .def(py::init<double>(), py::arg("constant"))
      .def(py::init<const asymunc::UncertainValue&>(), py::arg("value"))
      .def("node_count", &asymunc::Expression::node_count)
      .def("__str__", &asymunc::Expression::to_string)
      .def(py::self + py::self)
      .def(py::self - py::self)
      .def(py::self * py::self)
      .def(py::self / py::self)
      .def(py::self + double())
      .def(py::self - double())
      .def(py::self * double())
      .def(py::self / double())
      .def(double() + py::self)
      .def(double() - py::self)
      .def(double() * py::self)
      .def(double() / py::self)
      .def(-py::self)
      .def("__pow__", [](const asymunc::Expression& a, const asymunc::Expression& b) { return asymunc::pow(a, b); })
      .def("__pow__", [](const asymunc::Expression& a, double b) { return asymunc::pow(a, b); })
      .def("__rpow__", [](const asymunc::Expression& a, double b) { return asymunc::pow(b, a); });

  py::class_<asymunc::UncertainValue>(m, "UncertainValue")
      .def(py::init<const asymunc::ValueSpec&>(), py::arg("spec"))
      .def(py::init(&asymunc::UncertainValue::create),
           py::arg("nominal"),
           py::arg("lower_uncertainty"),
           py::arg("upper_uncertainty"),
           py::arg("kind") = asymunc::DistributionKind::AsymmetricNormal,
           py::arg("seed") = std::optional<std::uint64_t>{})
      .def_property_readonly("nominal", &asymunc::UncertainValue::nominal)
      .def_property_readonly("lower_uncertainty", &asymunc::UncertainValue::lower_uncertainty)
      .def_property_readonly("upper_uncertainty", &asymunc::UncertainValue::upper_uncertainty)
      .def_property_readonly("kind", &asymunc::UncertainValue::kind)
      .def_property_readonly("lower_limit", &asymunc::UncertainValue::lower_limit)
      .def_property_readonly("upper_limit", &asymunc::UncertainValue::upper_limit)
      .def_property_readonly("seed", &asymunc::UncertainValue::seed)
      .def_property_readonly("conserve_mean", &asymunc::UncertainValue::conserves_mean)
      .def("is_exact", &asymunc::UncertainValue::is_exact)
      .def("with_limits", &asymunc::UncertainValue::with_limits, py::arg("lower_limit"), py::arg("upper_limit"))
      .def("to_json", [](const asymunc::UncertainValue& v) { return asymunc::to_json(v); })
      .def("__str__", [](const asymunc::UncertainValue& v) { return asymunc::to_string(v); })
      .def_static("from_result", &asymunc::UncertainValue::from_result, py::arg("result"))
      .def_static("from_json", [](const std::string& json) { return asymunc::value_from_json(json); });

  py::implicitly_convertible<asymunc::UncertainValue, asymunc::Expression>();
  py::implicitly_convertible<double, asymunc::Expression>();

  m.def("sqrt", [](const asymunc::Expression& e) { return asymunc::sqrt(e); });
  m.def("log", [](const asymunc::Expression& e) { return asymunc::log(e); });
  m.def("log10", [](const asymunc::Expression& e) { return asymunc::log10(e); });
  m.def("exp", [](const asymunc::Expression& e) { return asymunc::exp(e); });
  m.def("sin", [](const asymunc::Expression& e) { return asymunc::sin(e); });
  m.def("cos", [](const asymunc::Expression& e) { return asymunc::cos(e); });
  m.def("tan", [](const asymunc::Expression& e) { return asymunc::tan(e); });
  m.def("abs", [](const asymunc::Expression& e) { return asymunc::abs(e); });

  m.def("compile_expression", &asymunc::compile_expression, py::arg("text"), py::arg("bindings"));

  m.def("evaluate",
        py::overload_cast<const asymunc::Expression&, std::size_t, double>(&asymunc::evaluate),
        py::arg("expression"),
        py::arg("trial_count") = 1'000'000,
        py::arg("coverage") = 0.95);

  py::class_<PyPropagator>(m, "Propagator")
      .def(py::init<const asymunc::PropagationConfig&>(), py::arg("config"))
      .def("evaluate", &PyPropagator::evaluate, py::arg("expression"))
      .def("sample", &PyPropagator::sample, py::arg("expression"))
      .def("samples_for", &PyPropagator::samples_for, py::arg("value"))
      .def("clear_cache", &PyPropagator::clear_cache)
      .def("diagnostics_json", &PyPropagator::diagnostics_json);
}
