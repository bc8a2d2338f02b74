// I8008Timing.cpp
// I8008 state & timing sequencer and machine-cycle controller

// Copyright (c) 2026 The B8008 Team. All rights reserved.
// This file is part of B8008 and is made available under
// the terms of the BSD license (see the COPYING file).

#include "I8008Timing.hpp"

using namespace std;
using namespace b8008;

// -------------------------------------------------------------------
// MARK: - Sequencer
// -------------------------------------------------------------------

/// The state diagram is:
///
///   STOPPED --int--> T1I
///   T1, T1I -> T2 -> (WAIT)* -> T3
///   T3 -> STOPPED               on HLT
///   T3 -> T4 -> T5 -> T1/T1I    when an execute phase is needed
///   T3 -> T1/T1I                otherwise
///
/// T1I replaces T1 only when the controller decided, at T3 of the last
/// FETCH cycle of an instruction, to acknowledge the interrupt.

State b8008::nextState(State current, SequencerInputs const& in) {
  switch (current) {
  case State::STOPPED: return in.interrupt ? State::T1I : State::STOPPED;
  case State::T1:
  case State::T1I: return State::T2;
  case State::T2:
  case State::WAIT: return in.ready ? State::T3 : State::WAIT;
  case State::T3:
    if (in.halt) return State::STOPPED;
    if (in.executePhase) return State::T4;
    return in.acknowledge ? State::T1I : State::T1;
  case State::T4: return State::T5;
  case State::T5: return in.acknowledge ? State::T1I : State::T1;
  }
  return State::STOPPED;
}

// -------------------------------------------------------------------
// MARK: - Machine-cycle controller
// -------------------------------------------------------------------

int b8008::machineCycleCount(InstructionTraits const& ins) {
  switch (ins.instructionType) {
  case MOV:
  case ALU: return (ins.accessType == AccessType::none) ? 1 : 2;
  case MVI: return isMemory(ins.dst) ? 3 : 2;
  case ALI:
  case INP:
  case OUT: return 2;
  case JMP:
  case CAL: return 3;
  default: return 1;
  }
}

CycleType b8008::machineCycleType(InstructionTraits const& ins, int cycle) {
  if (cycle == 0) {
    return CycleType::PCI;
  }
  switch (ins.instructionType) {
  case MOV: return isMemory(ins.dst) ? CycleType::PCW : CycleType::PCR;
  case ALU: return CycleType::PCR;
  case MVI: return (cycle == 2) ? CycleType::PCW : CycleType::PCI;
  case INP:
  case OUT: return CycleType::PCC;
  default: return CycleType::PCI;
  }
}

bool b8008::needsExecutePhase(InstructionTraits const& ins, int cycle, bool conditionMet) {
  switch (ins.instructionType) {
  case MOV:
    // MOV r,r executes in the fetch cycle, MOV r,M in the read cycle,
    // MOV M,r only writes.
    if (isMemory(ins.dst)) return false;
    return (cycle == 0) != isMemory(ins.src);
  case ALU: return (cycle == 0) != isMemory(ins.src);
  case MVI: return cycle == 1 && !isMemory(ins.dst);
  case ALI: return cycle == 1;
  case INR:
  case DCR:
  case ROT:
  case RST: return true;
  case RET: return conditionMet;
  case JMP:
  case CAL: return cycle == 2 && conditionMet;
  case INP:
  case OUT: return cycle == 1;
  default: return false;
  }
}

// -------------------------------------------------------------------
// MARK: - Printing
// -------------------------------------------------------------------

char const* b8008::stateName(State s) {
  switch (s) {
  case State::WAIT: return "WAIT";
  case State::T3: return "T3";
  case State::T1: return "T1";
  case State::STOPPED: return "STOPPED";
  case State::T2: return "T2";
  case State::T5: return "T5";
  case State::T1I: return "T1I";
  case State::T4: return "T4";
  }
  return "?";
}

char const* b8008::cycleTypeName(CycleType t) {
  switch (t) {
  case CycleType::PCI: return "PCI";
  case CycleType::PCR: return "PCR";
  case CycleType::PCW: return "PCW";
  case CycleType::PCC: return "PCC";
  }
  return "?";
}

ostream& operator<<(ostream& os, State s) {
  return os << stateName(s);
}

ostream& operator<<(ostream& os, CycleType t) {
  return os << cycleTypeName(t);
}
