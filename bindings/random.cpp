// bindings/random.cpp — pybind11 module `repro`
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "repro/all.hpp"

namespace py = pybind11;

#ifndef REPRO_BINDINGS_VERSION
#define REPRO_BINDINGS_VERSION "0.1.0"
#endif

namespace {

using SeedMap = std::map<std::string, std::optional<std::int64_t>>;

// Python dict configs report a missing seed as KeyError, not IndexError.
repro::RandomizationConfig config_from_dict(const SeedMap& m) {
  try {
    return repro::RandomizationConfig::from_map(m);
  } catch (const std::out_of_range& e) {
    throw py::key_error(e.what());
  }
}

void bind_streams(py::module_& m) {
  auto g = m.def_submodule("general", "General-purpose random stream");
  g.def("getstate", &repro::general::get_state);
  g.def("setstate", &repro::general::set_state, py::arg("state"));
  g.def("seed", &repro::general::seed, py::arg("seed") = py::none());
  g.def("randint", &repro::general::randint, py::arg("a"), py::arg("b"));
  g.def("random", &repro::general::random);

  auto n = m.def_submodule("numeric", "Numeric-array random stream");
  n.def("get_state", &repro::numeric::get_state);
  n.def("set_state", &repro::numeric::set_state, py::arg("state"));
  n.def("seed", &repro::numeric::seed, py::arg("seed") = py::none());
  n.def("uniform", &repro::numeric::uniform);

  auto t = m.def_submodule("tensor", "Tensor-computation random streams");
  t.def("get_rng_state", &repro::tensor::get_rng_state);
  t.def("set_rng_state", &repro::tensor::set_rng_state, py::arg("state"));
  t.def("get_device_rng_state", &repro::tensor::get_device_rng_state, py::arg("device"));
  t.def("set_device_rng_state", &repro::tensor::set_device_rng_state, py::arg("state"), py::arg("device"));
  t.def("manual_seed", &repro::tensor::manual_seed, py::arg("seed"));
  t.def("rand", [] { return repro::tensor::cpu_generator().next_uniform01(); });
  t.def("device_count", &repro::device::count);
  t.def("set_device_count", &repro::device::set_count, py::arg("n"));
}

} // anon

PYBIND11_MODULE(repro, m) {
  m.attr("__version__") = REPRO_BINDINGS_VERSION;

  py::register_exception<repro::AlreadyActiveError>(m, "AlreadyActiveError", PyExc_RuntimeError);
  py::register_exception<repro::DeviceTopologyMismatchError>(m, "DeviceTopologyMismatchError", PyExc_IndexError);

  bind_streams(m);

  py::class_<repro::RandomState>(m, "RandomState")
    .def(py::init<>())
    .def("restore", &repro::RandomState::restore)
    .def_property_readonly("device_count", &repro::RandomState::device_count)
    .def("__eq__", [](const repro::RandomState& a, const repro::RandomState& b) { return a == b; });

  // `with ctx:` enters and exits; exceptions from the body are never suppressed.
  py::class_<repro::RandomContext>(m, "RandomContext")
    .def(py::init([](std::optional<std::int64_t> seed) {
           return std::make_unique<repro::RandomContext>(seed);
         }),
         py::arg("seed") = py::none())
    .def("__enter__", [](repro::RandomContext& c) -> repro::RandomContext& { c.enter(); return c; },
         py::return_value_policy::reference_internal)
    .def("__exit__", [](repro::RandomContext& c, py::object, py::object, py::object) {
           c.exit();
           return false;
         })
    .def_property_readonly("active", &repro::RandomContext::active)
    .def_property_readonly("seed", &repro::RandomContext::seed)
    .def_property_readonly("inside_state", &repro::RandomContext::inside_state,
                           py::return_value_policy::copy);

  py::class_<repro::RandomizationConfig>(m, "RandomizationConfig")
    .def(py::init([](std::optional<std::int64_t> data_seed, std::optional<std::int64_t> init_seed,
                     std::optional<std::int64_t> model_seed) {
           return repro::RandomizationConfig{data_seed, init_seed, model_seed};
         }),
         py::arg("data_seed") = py::none(), py::arg("init_seed") = py::none(),
         py::arg("model_seed") = py::none())
    .def_static("from_env", &repro::RandomizationConfig::from_env)
    .def_readwrite("data_seed", &repro::RandomizationConfig::data_seed)
    .def_readwrite("init_seed", &repro::RandomizationConfig::init_seed)
    .def_readwrite("model_seed", &repro::RandomizationConfig::model_seed);

  py::class_<repro::Reproducible>(m, "Reproducible")
    .def(py::init([](const repro::RandomizationConfig& c) {
           return std::make_unique<repro::Reproducible>(c);
         }),
         py::arg("config"))
    .def(py::init([](const SeedMap& d) {
           return std::make_unique<repro::Reproducible>(config_from_dict(d));
         }),
         py::arg("config"))
    .def_property_readonly("data_random",
         [](repro::Reproducible& r) -> repro::RandomContext& { return r.data_random; },
         py::return_value_policy::reference_internal)
    .def_property_readonly("model_random",
         [](repro::Reproducible& r) -> repro::RandomContext& { return r.model_random; },
         py::return_value_policy::reference_internal)
    .def_property_readonly("init_random",
         [](repro::Reproducible& r) -> repro::RandomContext& { return r.init_random; },
         py::return_value_policy::reference_internal);
}
