// I8008Timing.hpp
// I8008 state & timing sequencer and machine-cycle controller

// Copyright (c) 2026 The B8008 Team. All rights reserved.
// This file is part of B8008 and is made available under
// the terms of the BSD license (see the COPYING file).

#ifndef I8008Timing_hpp
#define I8008Timing_hpp

#include "I8008Decoder.hpp"
#include <cstdint>
#include <iostream>

namespace b8008 {

/// Processor state as broadcast on the S2 S1 S0 pins.
enum class State : int {
  // clang-format off
  WAIT    = 0b000,
  T3      = 0b001,
  T1      = 0b010,
  STOPPED = 0b011,
  T2      = 0b100,
  T5      = 0b101,
  T1I     = 0b110,
  T4      = 0b111
  // clang-format on
};

/// Machine-cycle type, as driven on bus[7:6] during T2.
enum class CycleType : int {
  PCI = 0b00, /// Instruction (opcode or operand) fetch.
  PCR = 0b01, /// Memory read.
  PCW = 0b10, /// Memory write.
  PCC = 0b11  /// I/O.
};

/// Inputs consumed by the sequencer at a state boundary.
struct SequencerInputs {
  bool ready{true};        /// READY line (sampled at T2 and in WAIT).
  bool interrupt{false};   /// Synchronized interrupt latch (used in STOPPED).
  bool executePhase{false}; /// Decided at T3: the cycle needs T4 and T5.
  bool halt{false};        /// Decided at T3: the instruction is HLT.
  bool acknowledge{false}; /// The next machine cycle is an interrupt acknowledge.
};

/// The sequencer transition function. Pure: the next state depends only
/// on the current state and the inputs.
State nextState(State current, SequencerInputs const& in);

/// True for the states that begin a machine cycle (SYNC marker).
inline bool isCycleStart(State s) {
  return s == State::T1 || s == State::T1I;
}

/// True for the data-transfer states, where a device may drive the bus.
inline bool isTransferState(State s) {
  return s == State::T3;
}

// -------------------------------------------------------------------
// MARK: - Machine-cycle controller
// -------------------------------------------------------------------

/// Number of machine cycles of an instruction, opcode fetch included.
int machineCycleCount(InstructionTraits const& ins);

/// Type of the machine cycle number `cycle` (0 is the opcode fetch).
/// Known from the opcode alone, so it is available before T2.
CycleType machineCycleType(InstructionTraits const& ins, int cycle);

/// Whether machine cycle `cycle` runs T4 and T5. Decided at T3, when
/// the condition of a conditional transfer is known.
bool needsExecutePhase(InstructionTraits const& ins, int cycle, bool conditionMet);

char const* stateName(State s);
char const* cycleTypeName(CycleType t);

} // namespace b8008

std::ostream& operator<<(std::ostream& os, b8008::State s);
std::ostream& operator<<(std::ostream& os, b8008::CycleType t);

#endif /* I8008Timing_hpp */
