#include "qsurf/core/circuit/circuit_program.h"
#include "qsurf/core/errors.h"

#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

template <typename Exception, typename Fn>
void expect_throw(Fn fn, const char* what) {
  try {
    fn();
  } catch (const Exception&) {
    return;
  }
  throw std::runtime_error(std::string("Expected exception: ") + what);
}

}  // namespace

int main() {
  using namespace qsurf;

  CircuitProgram program(4);
  program.append(OpCode::R, {0, 1, 2, 3});
  program.append(OpCode::TICK, {});
  program.append(OpCode::ROUND, {0, 1});
  program.safe_append("CX", {0, 2, 1, 3});
  program.append(OpCode::M, {2, 3});
  program.append(OpCode::DETECTOR, {0});
  program.append(OpCode::ROUND, {0, 1});
  program.append(OpCode::MX, {2});
  program.append(OpCode::DETECTOR, {0, 2});
  program.append(OpCode::M, {0, 1});
  program.append(OpCode::OBSERVABLE_INCLUDE, {3, 4});

  if (program.num_measurements() != 5 || program.num_detectors() != 2 || program.num_rounds() != 2) {
    throw std::runtime_error("Unexpected bookkeeping counts");
  }
  const std::vector<MeasurementRecord>& records = program.measurement_records();
  if (records[0].qubit != 2 || records[0].round != 0 || records[2].round != 1 ||
      records[4].qubit != 1 || records[4].round != 1) {
    throw std::runtime_error("Measurement records must carry qubit and round");
  }
  if (program.observable() != std::vector<std::uint32_t>{3, 4}) {
    throw std::runtime_error("Observable must hold absolute record indices");
  }

  std::ostringstream summary;
  program.print_summary(summary);
  if (summary.str().find("Detectors: 2") == std::string::npos) {
    throw std::runtime_error("Summary must report the detector count");
  }

  expect_throw<InvalidProbabilityError>([&] { program.append(OpCode::X_ERROR, {0}, 1.5); },
                                        "probability above one");
  expect_throw<InvalidProbabilityError>([&] { program.append(OpCode::DEPOLARIZE1, {0}, -0.1); },
                                        "negative probability");
  expect_throw<InvalidProbabilityError>(
      [&] { program.append(OpCode::Z_ERROR, {0}, std::numeric_limits<double>::quiet_NaN()); },
      "NaN probability");
  expect_throw<std::invalid_argument>([&] { program.append(OpCode::CX, {0, 1}, 0.5); },
                                      "argument on a gate");
  expect_throw<std::invalid_argument>([&] { program.append(OpCode::CX, {0, 1, 2}); },
                                      "odd two-qubit target count");
  expect_throw<std::invalid_argument>([&] { program.append(OpCode::CX, {1, 1}); },
                                      "self-paired CX");
  expect_throw<std::invalid_argument>([&] { program.append(OpCode::M, {}); }, "empty targets");
  expect_throw<std::invalid_argument>([&] { program.append(OpCode::TICK, {0}); },
                                      "TICK with targets");
  expect_throw<std::out_of_range>([&] { program.append(OpCode::R, {4}); }, "qubit out of range");
  expect_throw<std::out_of_range>([&] { program.append(OpCode::DETECTOR, {5}); },
                                  "record out of range");
  expect_throw<std::invalid_argument>([&] { program.safe_append("H", {0}); }, "unknown op name");

  // Failed appends leave the program untouched.
  if (program.num_measurements() != 5 || program.instructions().size() != 11) {
    throw std::runtime_error("Rejected instructions must not be recorded");
  }

  for (OpCode op : {OpCode::R, OpCode::RX, OpCode::CX, OpCode::M, OpCode::MX, OpCode::X_ERROR,
                    OpCode::Z_ERROR, OpCode::DEPOLARIZE1, OpCode::DEPOLARIZE2, OpCode::DETECTOR,
                    OpCode::OBSERVABLE_INCLUDE, OpCode::ROUND, OpCode::TICK}) {
    auto it = opcode_map().find(std::string(opcode_name(op)));
    if (it == opcode_map().end() || it->second != op) {
      throw std::runtime_error("Opcode names must round trip through the opcode map");
    }
  }

  return 0;
}
