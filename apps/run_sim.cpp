#include "qsurf/core/errors.h"
#include "qsurf/core/experiment/memory_experiment.h"
#include "qsurf/core/translation/stim_translation.h"

#include <cstdint>
#include <exception>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

void print_usage(const char* program) {
  std::cerr << "Usage: " << program
            << " <task> <distance> <rounds> <shots> [seed|-]"
               " [p_clifford p_data p_measure p_reset] [skip_ref] [threads] [console_log]\n"
            << "  task: memory_x | memory_z | surface_code:rotated_memory_x | "
               "surface_code:rotated_memory_z\n";
}

[[noreturn]] void reject(const char* name, const std::string& text, const char* expected) {
  throw std::invalid_argument(std::string(name) + " must be " + expected + ", got '" + text + "'");
}

// Whole-argument integer parse; trailing characters are rejected.
long long parse_integer(const char* arg, const char* name) {
  const std::string text(arg);
  std::size_t pos = 0;
  long long value = 0;
  try {
    value = std::stoll(text, &pos);
  } catch (const std::logic_error&) {
    reject(name, text, "an integer");
  }
  if (pos != text.size()) {
    reject(name, text, "an integer");
  }
  return value;
}

std::size_t parse_size(const char* arg, const char* name) {
  const long long value = parse_integer(arg, name);
  if (value < 0) {
    reject(name, arg, "a non-negative integer");
  }
  return static_cast<std::size_t>(value);
}

// Zero is left to run_memory_experiment so its validation order holds.
std::size_t parse_shots(const char* arg) {
  const long long value = parse_integer(arg, "shots");
  if (value < 0) {
    throw qsurf::SamplingError(value);
  }
  return static_cast<std::size_t>(value);
}

std::uint64_t parse_seed(const char* arg) {
  const std::string text(arg);
  std::size_t pos = 0;
  std::uint64_t value = 0;
  try {
    value = static_cast<std::uint64_t>(std::stoull(text, &pos));
  } catch (const std::logic_error&) {
    reject("seed", text, "an unsigned 64-bit integer");
  }
  if (text.empty() || text[0] == '-' || pos != text.size()) {
    reject("seed", text, "an unsigned 64-bit integer");
  }
  return value;
}

double parse_probability(const char* arg, const char* name) {
  const std::string text(arg);
  std::size_t pos = 0;
  double value = 0.0;
  try {
    value = std::stod(text, &pos);
  } catch (const std::logic_error&) {
    reject(name, text, "a number");
  }
  if (pos != text.size()) {
    reject(name, text, "a number");
  }
  return value;
}

bool parse_flag(const char* arg) {
  const std::string text(arg);
  return text == "1" || text == "true" || text == "yes";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 5) {
    print_usage(argv[0]);
    return 1;
  }

  try {
    const std::string task(argv[1]);
    const std::size_t distance = parse_size(argv[2], "distance");
    const std::size_t rounds = parse_size(argv[3], "rounds");
    const std::size_t shots = parse_shots(argv[4]);

    std::optional<std::uint64_t> seed;
    if (argc > 5 && std::string(argv[5]) != "-") {
      seed = parse_seed(argv[5]);
    }

    qsurf::NoiseModel noise;
    if (argc > 9) {
      noise = qsurf::NoiseModel(parse_probability(argv[6], "p_clifford"),
                                parse_probability(argv[7], "p_data"),
                                parse_probability(argv[8], "p_measure"),
                                parse_probability(argv[9], "p_reset"));
    } else if (argc > 6) {
      throw std::invalid_argument("Noise requires all four probabilities");
    }

    const bool skip_ref = argc > 10 && parse_flag(argv[10]);
    const std::size_t threads = argc > 11 ? parse_size(argv[11], "threads") : 1;
    const bool console_log = argc > 12 && parse_flag(argv[12]);

    const qsurf::MemoryExperimentParams params(task, distance, rounds, noise, shots, seed,
                                               skip_ref, threads);
    const qsurf::MemoryExperimentResult result = qsurf::run_memory_experiment(params);

    std::cout << "Task: " << qsurf::to_string(params.task) << ", distance: " << distance
              << ", rounds: " << rounds << "\n";
    std::cout << "Qubits: " << result.qubit_map.num_qubits()
              << " (data: " << result.qubit_map.num_data() << ")\n";
    if (console_log) {
      result.circuits.noisy.print_summary(std::cout);
      std::cout << qsurf::build_stim_circuit(result.circuits.noisy, result.qubit_map) << "\n";
      for (const std::vector<std::uint8_t>& row : result.samples.measurements) {
        for (const std::uint8_t bit : row) {
          std::cout << static_cast<char>('0' + bit);
        }
        std::cout << "\n";
      }
    }
    qsurf::print_sample_summary(result.summary, std::cout);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
