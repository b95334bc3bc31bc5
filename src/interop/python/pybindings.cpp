#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <optional>
#include <string>

#include "qsurf/core/circuit/circuit_program.h"
#include "qsurf/core/circuit/synthesis.h"
#include "qsurf/core/code/qubit_map.h"
#include "qsurf/core/code/rotated_surface_code.h"
#include "qsurf/core/errors.h"
#include "qsurf/core/experiment/memory_experiment.h"
#include "qsurf/core/noise/noise_injection.h"
#include "qsurf/core/noise/noise_model.h"
#include "qsurf/core/sim/analysis.h"
#include "qsurf/core/sim/sampler.h"
#include "qsurf/core/translation/stim_translation.h"

namespace py = pybind11;

namespace {

py::tuple coord_to_python(const qsurf::Coordinate& c) { return py::make_tuple(c.row, c.col); }

py::list coords_to_python(const std::vector<qsurf::Coordinate>& coords) {
  py::list out;
  for (const qsurf::Coordinate& c : coords) {
    out.append(coord_to_python(c));
  }
  return out;
}

qsurf::Coordinate coord_from_python(const std::pair<std::size_t, std::size_t>& coord) {
  return qsurf::Coordinate{coord.first, coord.second};
}

py::dict coord_to_index_to_python(const qsurf::QubitMap& qubit_map) {
  py::dict out;
  for (const qsurf::Qubit& q : qubit_map.qubits()) {
    out[coord_to_python(q.coord)] = q.index;
  }
  return out;
}

py::dict index_to_coord_to_python(const qsurf::QubitMap& qubit_map) {
  py::dict out;
  for (const qsurf::Qubit& q : qubit_map.qubits()) {
    out[py::int_(q.index)] = coord_to_python(q.coord);
  }
  return out;
}

std::string noise_repr(const qsurf::NoiseModel& model) {
  std::string repr = "NoiseModel(";
  for (std::size_t c = 0; c < model.values().size(); ++c) {
    if (c > 0) {
      repr += ", ";
    }
    repr += std::string(qsurf::NoiseModel::to_string(static_cast<qsurf::NoiseChannel>(c)));
    repr += "=";
    repr += std::to_string(model.values()[c]);
  }
  repr += ")";
  return repr;
}

}  // namespace

PYBIND11_MODULE(qsurf_python, m) {
  m.doc() = "Python bindings for the qsurf rotated surface code library";

  py::register_exception<qsurf::InvalidDistanceError>(m, "InvalidDistanceError", PyExc_ValueError);
  py::register_exception<qsurf::UnsupportedTaskError>(m, "UnsupportedTaskError", PyExc_ValueError);
  py::register_exception<qsurf::InvalidProbabilityError>(m, "InvalidProbabilityError",
                                                         PyExc_ValueError);
  py::register_exception<qsurf::SamplingError>(m, "SamplingError", PyExc_ValueError);
  py::register_exception<qsurf::DuplicateAssignmentError>(m, "DuplicateAssignmentError",
                                                          PyExc_RuntimeError);

  py::enum_<qsurf::QubitRole>(m, "QubitRole")
      .value("DATA", qsurf::QubitRole::DATA)
      .value("ANCILLA_X", qsurf::QubitRole::ANCILLA_X)
      .value("ANCILLA_Z", qsurf::QubitRole::ANCILLA_Z)
      .export_values();

  py::enum_<qsurf::StabilizerType>(m, "StabilizerType")
      .value("X", qsurf::StabilizerType::X)
      .value("Z", qsurf::StabilizerType::Z);

  py::class_<qsurf::StabilizerGroup>(m, "StabilizerGroup")
      .def_property_readonly("ancilla",
                             [](const qsurf::StabilizerGroup& g) { return coord_to_python(g.ancilla); })
      .def_readonly("type", &qsurf::StabilizerGroup::type)
      .def_property_readonly(
          "data_members",
          [](const qsurf::StabilizerGroup& g) { return coords_to_python(g.data_members); })
      .def_readonly("member_steps", &qsurf::StabilizerGroup::member_steps)
      .def_property_readonly("weight", &qsurf::StabilizerGroup::weight);

  py::class_<qsurf::Lattice>(m, "Lattice")
      .def_readonly("distance", &qsurf::Lattice::distance)
      .def_readonly("stabilizers", &qsurf::Lattice::stabilizers)
      .def_property_readonly("sites",
                             [](const qsurf::Lattice& l) {
                               py::list out;
                               for (const qsurf::LatticeSite& s : l.sites) {
                                 out.append(py::make_tuple(coord_to_python(s.coord), s.role));
                               }
                               return out;
                             })
      .def_property_readonly(
          "logical_x_support",
          [](const qsurf::Lattice& l) { return coords_to_python(l.logical_x_support); })
      .def_property_readonly(
          "logical_z_support",
          [](const qsurf::Lattice& l) { return coords_to_python(l.logical_z_support); })
      .def_property_readonly("num_data", &qsurf::Lattice::num_data)
      .def_property_readonly("num_ancillas", &qsurf::Lattice::num_ancillas);

  m.def("build_rotated_surface_code", &qsurf::build_rotated_surface_code, py::arg("distance"));

  py::class_<qsurf::QubitMap>(m, "QubitMap")
      .def(py::init<const qsurf::Lattice&>(), py::arg("lattice"))
      .def_property_readonly("num_qubits", &qsurf::QubitMap::num_qubits)
      .def_property_readonly("num_data", &qsurf::QubitMap::num_data)
      .def_property_readonly("coord_to_index", &coord_to_index_to_python)
      .def_property_readonly("index_to_coord", &index_to_coord_to_python)
      .def("index_of",
           [](const qsurf::QubitMap& q, const std::pair<std::size_t, std::size_t>& coord) {
             return q.index_of(coord_from_python(coord));
           },
           py::arg("coord"))
      .def("role", [](const qsurf::QubitMap& q, std::size_t index) { return q.qubit(index).role; },
           py::arg("index"))
      .def("indices_with_role", &qsurf::QubitMap::indices_with_role, py::arg("role"));

  py::enum_<qsurf::MemoryTask>(m, "MemoryTask")
      .value("MEMORY_X", qsurf::MemoryTask::MEMORY_X)
      .value("MEMORY_Z", qsurf::MemoryTask::MEMORY_Z)
      .export_values();
  m.def("parse_memory_task", &qsurf::parse_memory_task, py::arg("task"));

  py::class_<qsurf::MeasurementRecord>(m, "MeasurementRecord")
      .def_readonly("qubit", &qsurf::MeasurementRecord::qubit)
      .def_readonly("round", &qsurf::MeasurementRecord::round);

  py::class_<qsurf::CircuitProgram>(m, "CircuitProgram")
      .def_property_readonly("num_qubits", &qsurf::CircuitProgram::num_qubits)
      .def_property_readonly("num_measurements", &qsurf::CircuitProgram::num_measurements)
      .def_property_readonly("num_detectors", &qsurf::CircuitProgram::num_detectors)
      .def_property_readonly("num_rounds", &qsurf::CircuitProgram::num_rounds)
      .def_property_readonly("measurement_records", &qsurf::CircuitProgram::measurement_records)
      .def_property_readonly("detectors", &qsurf::CircuitProgram::detectors)
      .def_property_readonly("observable", &qsurf::CircuitProgram::observable);

  m.def("synthesize_memory_circuit", &qsurf::synthesize_memory_circuit, py::arg("lattice"),
        py::arg("qubit_map"), py::arg("rounds"), py::arg("task"));

  py::enum_<qsurf::NoiseChannel>(m, "NoiseChannel")
      .value("AFTER_CLIFFORD_DEPOLARIZATION", qsurf::NoiseChannel::kAfterCliffordDepolarization)
      .value("BEFORE_ROUND_DATA_DEPOLARIZATION",
             qsurf::NoiseChannel::kBeforeRoundDataDepolarization)
      .value("BEFORE_MEASURE_FLIP_PROBABILITY", qsurf::NoiseChannel::kBeforeMeasureFlipProbability)
      .value("AFTER_RESET_FLIP_PROBABILITY", qsurf::NoiseChannel::kAfterResetFlipProbability)
      .export_values();

  py::class_<qsurf::NoiseModel>(m, "NoiseModel")
      .def(py::init<>())
      .def(py::init<double, double, double, double>(), py::arg("after_clifford_depolarization"),
           py::arg("before_round_data_depolarization"), py::arg("before_measure_flip_probability"),
           py::arg("after_reset_flip_probability"))
      .def("get", py::overload_cast<const std::string&>(&qsurf::NoiseModel::get, py::const_),
           py::arg("key"))
      .def("get", py::overload_cast<qsurf::NoiseChannel>(&qsurf::NoiseModel::get, py::const_),
           py::arg("channel"))
      .def("with_probability",
           py::overload_cast<const std::string&, double>(&qsurf::NoiseModel::with_probability,
                                                         py::const_),
           py::arg("key"), py::arg("probability"))
      .def("with_probability",
           py::overload_cast<qsurf::NoiseChannel, double>(&qsurf::NoiseModel::with_probability,
                                                          py::const_),
           py::arg("channel"), py::arg("probability"))
      .def_property_readonly("is_noiseless", &qsurf::NoiseModel::is_noiseless)
      .def("__repr__", &noise_repr);

  py::class_<qsurf::NoisyCircuitProgram>(m, "NoisyCircuitProgram")
      .def_readonly("noiseless", &qsurf::NoisyCircuitProgram::noiseless)
      .def_readonly("noisy", &qsurf::NoisyCircuitProgram::noisy)
      .def_readonly("noise", &qsurf::NoisyCircuitProgram::noise);

  m.def("inject_noise", &qsurf::inject_noise, py::arg("program"), py::arg("noise"));

  py::class_<qsurf::SamplerParams>(m, "SamplerParams")
      .def(py::init<std::size_t, std::optional<std::uint64_t>, bool, std::size_t>(),
           py::arg("shots"), py::arg("seed") = py::none(), py::arg("skip_ref_sample") = false,
           py::arg("num_threads") = 1)
      .def_readonly("shots", &qsurf::SamplerParams::shots)
      .def_readonly("seed", &qsurf::SamplerParams::seed)
      .def_readonly("skip_ref_sample", &qsurf::SamplerParams::skip_ref_sample)
      .def_readonly("num_threads", &qsurf::SamplerParams::num_threads);

  py::class_<qsurf::SampleResult>(m, "SampleResult")
      .def_readonly("measurements", &qsurf::SampleResult::measurements)
      .def_readonly("reference", &qsurf::SampleResult::reference)
      .def_readonly("seed", &qsurf::SampleResult::seed)
      .def_readonly("seed_from_entropy", &qsurf::SampleResult::seed_from_entropy);

  py::class_<qsurf::Sampler>(m, "Sampler")
      .def(py::init<qsurf::SamplerParams>(), py::arg("params"))
      .def_property_readonly("seed", &qsurf::Sampler::seed)
      .def("sample", &qsurf::Sampler::sample, py::arg("program"),
           py::call_guard<py::gil_scoped_release>());

  py::class_<qsurf::MeasurementLabel>(m, "MeasurementLabel")
      .def_readonly("record", &qsurf::MeasurementLabel::record)
      .def_readonly("qubit", &qsurf::MeasurementLabel::qubit)
      .def_property_readonly(
          "coord", [](const qsurf::MeasurementLabel& l) { return coord_to_python(l.coord); })
      .def_readonly("role", &qsurf::MeasurementLabel::role)
      .def_readonly("round", &qsurf::MeasurementLabel::round)
      .def_readonly("final_readout", &qsurf::MeasurementLabel::final_readout);

  py::class_<qsurf::SampleSummary>(m, "SampleSummary")
      .def_readonly("shots", &qsurf::SampleSummary::shots)
      .def_readonly("records", &qsurf::SampleSummary::records)
      .def_readonly("detectors", &qsurf::SampleSummary::detectors)
      .def_readonly("seed", &qsurf::SampleSummary::seed)
      .def_readonly("seed_from_entropy", &qsurf::SampleSummary::seed_from_entropy)
      .def_readonly("detector_event_fraction", &qsurf::SampleSummary::detector_event_fraction)
      .def_readonly("observable_flip_fraction", &qsurf::SampleSummary::observable_flip_fraction)
      .def_readonly("reference_mismatch_fraction",
                    &qsurf::SampleSummary::reference_mismatch_fraction)
      .def_readonly("has_reference", &qsurf::SampleSummary::has_reference)
      .def_readonly("error_rates", &qsurf::SampleSummary::error_rates);

  m.def("label_measurements", &qsurf::label_measurements, py::arg("program"),
        py::arg("qubit_map"));
  m.def("detector_parities", &qsurf::detector_parities, py::arg("program"),
        py::arg("measurements"));
  m.def("observable_values", &qsurf::observable_values, py::arg("program"),
        py::arg("measurements"));
  m.def("flip_events", &qsurf::flip_events, py::arg("measurements"), py::arg("reference"));
  m.def("summarize", &qsurf::summarize, py::arg("program"), py::arg("result"));

  m.def("build_stim_circuit",
        py::overload_cast<const qsurf::CircuitProgram&>(&qsurf::build_stim_circuit),
        py::arg("program"), "Render a circuit program in Stim's text format.");
  m.def("build_stim_circuit",
        py::overload_cast<const qsurf::CircuitProgram&, const qsurf::QubitMap&>(
            &qsurf::build_stim_circuit),
        py::arg("program"), py::arg("qubit_map"),
        "Render a circuit program in Stim's text format, prefixed with QUBIT_COORDS.");

  py::class_<qsurf::MemoryExperimentParams>(m, "MemoryExperimentParams")
      .def(py::init<const std::string&, std::size_t, std::size_t, qsurf::NoiseModel, std::size_t,
                    std::optional<std::uint64_t>, bool, std::size_t>(),
           py::arg("task"), py::arg("distance"), py::arg("rounds"), py::arg("noise"),
           py::arg("shots"), py::arg("seed") = py::none(), py::arg("skip_ref_sample") = false,
           py::arg("num_threads") = 1)
      .def_readonly("task", &qsurf::MemoryExperimentParams::task)
      .def_readonly("distance", &qsurf::MemoryExperimentParams::distance)
      .def_readonly("rounds", &qsurf::MemoryExperimentParams::rounds)
      .def_readonly("noise", &qsurf::MemoryExperimentParams::noise)
      .def_readonly("shots", &qsurf::MemoryExperimentParams::shots)
      .def_readonly("seed", &qsurf::MemoryExperimentParams::seed);

  py::class_<qsurf::MemoryExperimentResult>(m, "MemoryExperimentResult")
      .def_readonly("lattice", &qsurf::MemoryExperimentResult::lattice)
      .def_readonly("qubit_map", &qsurf::MemoryExperimentResult::qubit_map)
      .def_readonly("circuits", &qsurf::MemoryExperimentResult::circuits)
      .def_readonly("samples", &qsurf::MemoryExperimentResult::samples)
      .def_readonly("summary", &qsurf::MemoryExperimentResult::summary);

  m.def("run_memory_experiment", &qsurf::run_memory_experiment, py::arg("params"),
        "Run lattice construction, synthesis, noise injection and sampling end to end.");
}
