#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <pybind11/functional.h>
#include <pybind11/numpy.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "seiswave/api/errors.hpp"
#include "seiswave/api/simulation.hpp"

namespace py = pybind11;

namespace {

py::array_t<double> to_array(const seiswave::Field2D<double>& field) {
  py::array_t<double> out({static_cast<py::ssize_t>(field.rows()), static_cast<py::ssize_t>(field.cols())});
  auto view = out.mutable_unchecked<2>();
  for (std::size_t row = 0; row < field.rows(); ++row) {
    for (std::size_t col = 0; col < field.cols(); ++col) {
      view(static_cast<py::ssize_t>(row), static_cast<py::ssize_t>(col)) = field(row, col);
    }
  }
  return out;
}

std::vector<double> flatten(const py::array_t<double, py::array::c_style | py::array::forcecast>& values,
                            std::size_t rows,
                            std::size_t cols,
                            const char* name) {
  if (values.ndim() != 2 || static_cast<std::size_t>(values.shape(0)) != rows ||
      static_cast<std::size_t>(values.shape(1)) != cols) {
    throw seiswave::InvalidMediumError(std::string(name) + " array must have shape (rows, cols)");
  }
  return std::vector<double>(values.data(), values.data() + values.size());
}

class PySimulation {
 public:
  PySimulation(const py::array_t<double, py::array::c_style | py::array::forcecast>& velocity,
               const py::array_t<double, py::array::c_style | py::array::forcecast>& density,
               double spacing,
               const seiswave::SimulationConfig& config) {
    if (velocity.ndim() != 2) {
      throw seiswave::InvalidMediumError("velocity must be a 2D array");
    }
    const auto rows = static_cast<std::size_t>(velocity.shape(0));
    const auto cols = static_cast<std::size_t>(velocity.shape(1));
    const seiswave::Grid2D grid(rows, cols, spacing);
    seiswave::Medium medium(grid, flatten(velocity, rows, cols, "velocity"), flatten(density, rows, cols, "density"));
    impl_ = seiswave::make_simulation(std::move(medium), config);
  }

  std::size_t add_source(std::size_t row, std::size_t col, const seiswave::WaveletSpec& wavelet) {
    return impl_->add_source(row, col, wavelet).id;
  }

  bool remove_source(std::size_t id) { return impl_->remove_source(seiswave::SourceHandle{id}); }

  seiswave::RunResult run(std::size_t steps, std::size_t snapshot_every, bool resume) {
    seiswave::RunRequest request;
    request.steps = steps;
    request.snapshot_every = snapshot_every;
    request.resume = resume;
    request.on_step = [this](std::size_t) {
      if (PyErr_CheckSignals() != 0) {
        impl_->request_cancel();
      }
    };
    const seiswave::RunResult result = impl_->run(request);
    if (PyErr_Occurred() != nullptr) {
      throw py::error_already_set();
    }
    return result;
  }

  py::list snapshots() const {
    py::list out;
    for (const auto& snapshot : impl_->snapshots()) {
      out.append(py::make_tuple(snapshot.step, snapshot.time, to_array(snapshot.pressure)));
    }
    return out;
  }

  py::array_t<double> wavefield() const { return to_array(impl_->wavefield()); }

  seiswave::ISimulation& impl() { return *impl_; }
  const seiswave::ISimulation& impl() const { return *impl_; }

 private:
  std::unique_ptr<seiswave::ISimulation> impl_;
};

}  // namespace

PYBIND11_MODULE(_seiswave, m) {
  m.doc() = "seiswave 2D acoustic finite-difference engine";

  auto base_error = py::register_exception<seiswave::SimulationError>(m, "SimulationError", PyExc_RuntimeError);
  py::register_exception<seiswave::InvalidMediumError>(m, "InvalidMediumError", base_error.ptr());
  py::register_exception<seiswave::UnsupportedOrderError>(m, "UnsupportedOrderError", base_error.ptr());
  py::register_exception<seiswave::UnstableConfigurationError>(m, "UnstableConfigurationError", base_error.ptr());
  py::register_exception<seiswave::OutOfBoundsSourceError>(m, "OutOfBoundsSourceError", base_error.ptr());
  py::register_exception<seiswave::StepOverflowError>(m, "StepOverflowError", base_error.ptr());

  py::enum_<seiswave::BoundaryKind>(m, "BoundaryKind")
      .value("Damping", seiswave::BoundaryKind::Damping)
      .value("Rigid", seiswave::BoundaryKind::Rigid)
      .value("Periodic", seiswave::BoundaryKind::Periodic);

  py::enum_<seiswave::WaveletKind>(m, "WaveletKind")
      .value("Ricker", seiswave::WaveletKind::Ricker)
      .value("Gaussian", seiswave::WaveletKind::Gaussian);

  py::enum_<seiswave::SimulationState>(m, "SimulationState")
      .value("Uninitialized", seiswave::SimulationState::Uninitialized)
      .value("Ready", seiswave::SimulationState::Ready)
      .value("Running", seiswave::SimulationState::Running)
      .value("Completed", seiswave::SimulationState::Completed)
      .value("Cancelled", seiswave::SimulationState::Cancelled)
      .value("Failed", seiswave::SimulationState::Failed);

  py::class_<seiswave::BoundarySpec>(m, "BoundarySpec")
      .def(py::init<>())
      .def_readwrite("kind", &seiswave::BoundarySpec::kind)
      .def_readwrite("width", &seiswave::BoundarySpec::width)
      .def_readwrite("taper", &seiswave::BoundarySpec::taper)
      .def_readwrite("free_surface", &seiswave::BoundarySpec::free_surface);

  py::class_<seiswave::WaveletSpec>(m, "WaveletSpec")
      .def(py::init<>())
      .def_readwrite("kind", &seiswave::WaveletSpec::kind)
      .def_readwrite("frequency", &seiswave::WaveletSpec::frequency)
      .def_readwrite("delay", &seiswave::WaveletSpec::delay)
      .def_readwrite("amplitude", &seiswave::WaveletSpec::amplitude);

  py::class_<seiswave::SimulationConfig>(m, "SimulationConfig")
      .def(py::init<>())
      .def_readwrite("spatial_order", &seiswave::SimulationConfig::spatial_order)
      .def_readwrite("time_step", &seiswave::SimulationConfig::time_step)
      .def_readwrite("cfl_safety", &seiswave::SimulationConfig::cfl_safety)
      .def_readwrite("boundary", &seiswave::SimulationConfig::boundary)
      .def_readwrite("threads", &seiswave::SimulationConfig::threads)
      .def_readwrite("overflow_sample_stride", &seiswave::SimulationConfig::overflow_sample_stride)
      .def_readwrite("overflow_threshold", &seiswave::SimulationConfig::overflow_threshold);

  py::class_<seiswave::RunResult>(m, "RunResult")
      .def_readonly("steps_completed", &seiswave::RunResult::steps_completed)
      .def_readonly("snapshots_recorded", &seiswave::RunResult::snapshots_recorded)
      .def_readonly("cancelled", &seiswave::RunResult::cancelled);

  py::class_<PySimulation>(m, "Simulation")
      .def(py::init<const py::array_t<double, py::array::c_style | py::array::forcecast>&,
                    const py::array_t<double, py::array::c_style | py::array::forcecast>&,
                    double,
                    const seiswave::SimulationConfig&>(),
           py::arg("velocity"),
           py::arg("density"),
           py::arg("spacing"),
           py::arg("config") = seiswave::SimulationConfig{})
      .def("add_source", &PySimulation::add_source, py::arg("row"), py::arg("col"), py::arg("wavelet"))
      .def("remove_source", &PySimulation::remove_source, py::arg("handle"))
      .def("run", &PySimulation::run, py::arg("steps"), py::arg("snapshot_every") = 1, py::arg("resume") = false)
      .def("snapshots", &PySimulation::snapshots)
      .def("wavefield", &PySimulation::wavefield)
      .def("clear_snapshots", [](PySimulation& self) { self.impl().clear_snapshots(); })
      .def("request_cancel", [](PySimulation& self) { self.impl().request_cancel(); })
      .def_property_readonly("state", [](const PySimulation& self) { return self.impl().state(); })
      .def_property_readonly("dt", [](const PySimulation& self) { return self.impl().time_step(); })
      .def_property_readonly("steps", [](const PySimulation& self) { return self.impl().steps_completed(); })
      .def_property_readonly("extent", [](const PySimulation& self) {
        const auto extent = self.impl().extent();
        return py::make_tuple(extent.height, extent.width);
      })
      .def("diagnostics_json", [](const PySimulation& self) { return self.impl().diagnostics_json(); });
}
