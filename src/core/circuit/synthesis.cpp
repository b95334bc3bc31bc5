#include "qsurf/core/circuit/synthesis.h"

#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "qsurf/core/errors.h"

namespace qsurf {

namespace {

// Holds precomputed index lists for efficient circuit construction later on.
struct SynthesisContext {
  OpCode data_reset = OpCode::R;
  OpCode data_measure = OpCode::M;
  StabilizerType basis_type = StabilizerType::Z;

  std::vector<std::uint32_t> data_qubits;
  std::vector<std::uint32_t> x_ancillas;
  std::vector<std::uint32_t> z_ancillas;

  // Ancillas in record order within one round: MX on X ancillas, then M on Z ancillas.
  std::vector<std::uint32_t> ancillas_in_record_order;

  // Flattened control/target pairs per schedule step.
  std::vector<std::vector<std::uint32_t>> cx_targets_by_step;

  // Per ancilla (record order): is it a task-basis check, and its data support.
  std::vector<bool> is_basis_check;
  std::vector<std::vector<std::uint32_t>> supports;

  std::vector<std::uint32_t> logical_support;
};

std::uint32_t as_u32(QubitIndex q) { return static_cast<std::uint32_t>(q); }

std::vector<std::uint32_t> as_u32_targets(const std::vector<QubitIndex>& indices) {
  std::vector<std::uint32_t> out;
  out.reserve(indices.size());
  for (const QubitIndex q : indices) {
    out.push_back(as_u32(q));
  }
  return out;
}

SynthesisContext build_context(const Lattice& lattice, const QubitMap& qubit_map, MemoryTask task) {
  SynthesisContext ctx;
  switch (task) {
    case MemoryTask::MEMORY_X:
      ctx.data_reset = OpCode::RX;
      ctx.data_measure = OpCode::MX;
      ctx.basis_type = StabilizerType::X;
      break;
    case MemoryTask::MEMORY_Z:
      ctx.data_reset = OpCode::R;
      ctx.data_measure = OpCode::M;
      ctx.basis_type = StabilizerType::Z;
      break;
    default:
      throw UnsupportedTaskError(std::to_string(static_cast<int>(task)));
  }

  ctx.data_qubits = as_u32_targets(qubit_map.indices_with_role(QubitRole::DATA));
  ctx.x_ancillas = as_u32_targets(qubit_map.indices_with_role(QubitRole::ANCILLA_X));
  ctx.z_ancillas = as_u32_targets(qubit_map.indices_with_role(QubitRole::ANCILLA_Z));
  ctx.ancillas_in_record_order = ctx.x_ancillas;
  ctx.ancillas_in_record_order.insert(ctx.ancillas_in_record_order.end(), ctx.z_ancillas.begin(),
                                      ctx.z_ancillas.end());

  // Stabilizer lookup by ancilla index, so supports follow record order.
  std::vector<const StabilizerGroup*> group_of(qubit_map.num_qubits(), nullptr);
  for (const StabilizerGroup& group : lattice.stabilizers) {
    group_of[qubit_map.index_of(group.ancilla)] = &group;
  }

  ctx.cx_targets_by_step.assign(kScheduleSteps, {});
  ctx.is_basis_check.reserve(ctx.ancillas_in_record_order.size());
  ctx.supports.reserve(ctx.ancillas_in_record_order.size());
  for (const std::uint32_t anc : ctx.ancillas_in_record_order) {
    const StabilizerGroup* group = group_of[anc];
    if (group == nullptr) {
      throw std::invalid_argument("Ancilla " + std::to_string(anc) + " has no stabilizer group");
    }
    ctx.is_basis_check.push_back(group->type == ctx.basis_type);

    std::vector<std::uint32_t> support;
    support.reserve(group->weight());
    for (std::size_t k = 0; k < group->data_members.size(); ++k) {
      const std::uint32_t data = as_u32(qubit_map.index_of(group->data_members[k]));
      support.push_back(data);

      // X checks: ancilla -> data CNOT orientation. Z checks: data -> ancilla.
      std::vector<std::uint32_t>& cx = ctx.cx_targets_by_step[group->member_steps[k]];
      if (group->type == StabilizerType::X) {
        cx.push_back(anc);
        cx.push_back(data);
      } else {
        cx.push_back(data);
        cx.push_back(anc);
      }
    }
    std::sort(support.begin(), support.end());
    ctx.supports.push_back(std::move(support));
  }

  const std::vector<Coordinate>& logical =
      ctx.basis_type == StabilizerType::Z ? lattice.logical_z_support : lattice.logical_x_support;
  for (const Coordinate& c : logical) {
    ctx.logical_support.push_back(as_u32(qubit_map.index_of(c)));
  }
  std::sort(ctx.logical_support.begin(), ctx.logical_support.end());

  return ctx;
}

void append_if_any(CircuitProgram* program, OpCode op, const std::vector<std::uint32_t>& targets) {
  if (!targets.empty()) {
    program->append(op, targets);
  }
}

// Appends one extraction round and its detectors. `first_record` is the absolute index of the
// round's first ancilla record.
void append_extraction_round(CircuitProgram* program, const SynthesisContext& ctx,
                             std::size_t round, std::size_t first_record) {
  program->append(OpCode::ROUND, ctx.data_qubits);

  append_if_any(program, OpCode::RX, ctx.x_ancillas);
  append_if_any(program, OpCode::R, ctx.z_ancillas);
  program->append(OpCode::TICK, {});

  for (std::size_t step = 0; step < kScheduleSteps; ++step) {
    append_if_any(program, OpCode::CX, ctx.cx_targets_by_step[step]);
    program->append(OpCode::TICK, {});
  }

  append_if_any(program, OpCode::MX, ctx.x_ancillas);
  append_if_any(program, OpCode::M, ctx.z_ancillas);

  const std::size_t num_anc = ctx.ancillas_in_record_order.size();
  for (std::size_t a = 0; a < num_anc; ++a) {
    const std::uint32_t current = static_cast<std::uint32_t>(first_record + a);
    if (round == 0) {
      // Only checks of the preparation basis are deterministic in the first round.
      if (ctx.is_basis_check[a]) {
        program->append(OpCode::DETECTOR, {current});
      }
    } else {
      program->append(OpCode::DETECTOR, {static_cast<std::uint32_t>(current - num_anc), current});
    }
  }
}

void append_final_readout_detectors_and_observable(CircuitProgram* program,
                                                   const SynthesisContext& ctx,
                                                   std::size_t last_round_first_record) {
  const std::size_t data_first_record = program->num_measurements();
  program->append(ctx.data_measure, ctx.data_qubits);

  // Data qubits are measured in index order, so a data index is its record offset.
  for (std::size_t a = 0; a < ctx.ancillas_in_record_order.size(); ++a) {
    if (!ctx.is_basis_check[a]) {
      continue;
    }
    std::vector<std::uint32_t> records;
    records.reserve(ctx.supports[a].size() + 1);
    records.push_back(static_cast<std::uint32_t>(last_round_first_record + a));
    for (const std::uint32_t data : ctx.supports[a]) {
      records.push_back(static_cast<std::uint32_t>(data_first_record + data));
    }
    program->append(OpCode::DETECTOR, records);
  }

  std::vector<std::uint32_t> logical_records;
  logical_records.reserve(ctx.logical_support.size());
  for (const std::uint32_t data : ctx.logical_support) {
    logical_records.push_back(static_cast<std::uint32_t>(data_first_record + data));
  }
  program->append(OpCode::OBSERVABLE_INCLUDE, logical_records);
}

}  // namespace

MemoryTask parse_memory_task(const std::string& task) {
  if (task == "memory_x" || task == "surface_code:rotated_memory_x") {
    return MemoryTask::MEMORY_X;
  }
  if (task == "memory_z" || task == "surface_code:rotated_memory_z") {
    return MemoryTask::MEMORY_Z;
  }
  throw UnsupportedTaskError(task);
}

std::string_view to_string(MemoryTask task) {
  switch (task) {
    case MemoryTask::MEMORY_X:
      return "memory_x";
    case MemoryTask::MEMORY_Z:
      return "memory_z";
  }
  throw UnsupportedTaskError(std::to_string(static_cast<int>(task)));
}

CircuitProgram synthesize_memory_circuit(const Lattice& lattice, const QubitMap& qubit_map,
                                         std::size_t rounds, MemoryTask task) {
  if (rounds == 0) {
    throw std::invalid_argument("rounds must be >= 1 for memory circuit synthesis");
  }

  const SynthesisContext ctx = build_context(lattice, qubit_map, task);
  if (ctx.data_qubits.size() != qubit_map.num_data()) {
    throw std::invalid_argument("Qubit map does not match lattice data qubit count");
  }

  CircuitProgram program(qubit_map.num_qubits());
  program.append(ctx.data_reset, ctx.data_qubits);
  program.append(OpCode::TICK, {});

  std::size_t round_first_record = 0;
  for (std::size_t round = 0; round < rounds; ++round) {
    round_first_record = program.num_measurements();
    append_extraction_round(&program, ctx, round, round_first_record);
  }

  append_final_readout_detectors_and_observable(&program, ctx, round_first_record);
  return program;
}

}  // namespace qsurf
