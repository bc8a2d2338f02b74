// I8008.cpp
// I8008 emulator

// Copyright (c) 2026 The B8008 Team. All rights reserved.
// This file is part of B8008 and is made available under
// the terms of the BSD license (see the COPYING file).

#include "I8008.hpp"
#include <iomanip>
#include <iostream>

using namespace std;
using namespace b8008;
using json = nlohmann::json;

// -------------------------------------------------------------------
// MARK: - Serialization
// -------------------------------------------------------------------

void b8008::to_json(json& j, const I8008State& s) {
#undef jput
#define jput(x) j[#x] = s.x
  j["state"] = static_cast<int>(s.state);
  j["cycleType"] = static_cast<int>(s.cycleType);
  jput(dataBus);
  jput(readyLine);
  jput(interruptLine);
  j["regs"] = s.regs.r;
  j["flags"] = static_cast<int>(static_cast<uint8_t>(s.flags));
  jput(PC);
  j["stack"] = {{"slots", s.stack.slots}, {"pointer", s.stack.pointer}};
  jput(IR);
  jput(regA);
  jput(regB);
  jput(machineCycle);
  jput(executePhase);
  jput(conditionMet);
  jput(acknowledging);
  jput(acknowledgePending);
  j["interrupt"] = {{"stage1", s.interrupt.stage1},
                    {"stage2", s.interrupt.stage2},
                    {"previous", s.interrupt.previous},
                    {"latch", s.interrupt.latch}};
  jput(numCycles);
}

/// Throws `nlohmann::json::exception` on parsing errors.
void b8008::from_json(const json& j, I8008State& state) {
#undef jget
#define jget(x) state.x = j.at(#x)
  state.state = static_cast<State>(j.at("state").get<int>() & 0x07);
  state.cycleType = static_cast<CycleType>(j.at("cycleType").get<int>() & 0x03);
  jget(dataBus);
  jget(readyLine);
  jget(interruptLine);
  state.regs.r = j.at("regs").get<array<uint8_t, 7>>();
  state.flags = static_cast<uint8_t>(j.at("flags").get<int>());
  jget(PC);
  state.PC &= addressMask;
  auto const& stack = j.at("stack");
  state.stack.slots = stack.at("slots").get<array<uint16_t, AddressStack::depth>>();
  state.stack.pointer = stack.at("pointer").get<uint8_t>() & (AddressStack::depth - 1);
  jget(IR);
  jget(regA);
  jget(regB);
  jget(machineCycle);
  jget(executePhase);
  jget(conditionMet);
  jget(acknowledging);
  jget(acknowledgePending);
  auto const& interrupt = j.at("interrupt");
  state.interrupt.stage1 = interrupt.at("stage1");
  state.interrupt.stage2 = interrupt.at("stage2");
  state.interrupt.previous = interrupt.at("previous");
  state.interrupt.latch = interrupt.at("latch");
  jget(numCycles);
}

#define cmp(x) (x == s.x)
bool I8008State::operator==(I8008State const& s) const {
  return cmp(state) && cmp(cycleType) && cmp(dataBus) && cmp(readyLine) && cmp(interruptLine) && cmp(regs) &&
         cmp(flags) && cmp(PC) && cmp(stack) && cmp(IR) && cmp(regA) && cmp(regB) && cmp(machineCycle) &&
         cmp(executePhase) && cmp(conditionMet) && cmp(acknowledging) && cmp(acknowledgePending) &&
         cmp(interrupt) && cmp(numCycles);
}
#undef cmp

// -------------------------------------------------------------------
// MARK: - Lifecycle
// -------------------------------------------------------------------

I8008::I8008() {
  verbose = false;
  reset();
}

/// Power-on clear. All registers, flags and the stack are zero and the
/// CPU waits in STOPPED for an interrupt.
void I8008::reset() {
  *this = I8008State{};
}

I8008& I8008::operator=(I8008State const& s) {
  this->I8008State::operator=(s);
  // Restore transient state.
  dc = decode(IR);
  return *this;
}

// -------------------------------------------------------------------
// MARK: - Bus interface
// -------------------------------------------------------------------

/// The address of the current machine cycle, as it is sent out at T1
/// and T2. For an I/O cycle, this is A in the low byte and the low six
/// bits of the instruction register in the high byte.
uint16_t I8008::getCycleAddress() const {
  if (state == State::T1I) {
    return PC;
  }
  switch (cycleType) {
  case CycleType::PCI: return PC;
  case CycleType::PCR:
  case CycleType::PCW: return regs.addressPointer();
  case CycleType::PCC: return static_cast<uint16_t>(((IR & 0x3f) << 8) | regs.read(Reg::A));
  }
  return PC;
}

/// What the CPU drives on the data bus in the current state.
BusDrive I8008::getBusDrive() const {
  auto address = getCycleAddress();
  switch (state) {
  case State::T1:
  case State::T1I: return BusDrive{true, static_cast<uint8_t>(address & 0xff)};
  case State::T2: {
    auto type = static_cast<int>(cycleType);
    return BusDrive{true, static_cast<uint8_t>((type << 6) | ((address >> 8) & 0x3f))};
  }
  case State::T3:
    if (cycleType == CycleType::PCW) {
      auto value = (dc.instructionType == MVI) ? regB : regs.read(dc.src);
      return BusDrive{true, value};
    }
    return BusDrive{false, 0};
  default: return BusDrive{false, 0};
  }
}

// -------------------------------------------------------------------
// MARK: - Execution
// -------------------------------------------------------------------

/// Latch the data bus at T3.
void I8008::transfer(uint8_t bus) {
  switch (cycleType) {
  case CycleType::PCI:
    if (machineCycle == 0) {
      IR = bus;
      dc = decode(IR);
      // The opcode supplied by an interrupting device does not come
      // from memory, so the PC stays where it is.
      if (!acknowledging) {
        PC = (PC + 1) & addressMask;
      }
    } else {
      if (machineCycle == 1) {
        regB = bus;
      } else {
        regA = bus;
      }
      PC = (PC + 1) & addressMask;
    }
    break;
  case CycleType::PCR: regB = bus; break;
  case CycleType::PCW: break;
  case CycleType::PCC:
    if (dc.instructionType == INP) {
      regB = bus;
    }
    break;
  }
  conditionMet = conditionHolds(dc.condition, flags);
  executePhase = needsExecutePhase(dc, machineCycle, conditionMet);
}

void I8008::executeT4() {
  switch (dc.instructionType) {
  case MOV:
  case ALU:
    if (!isMemory(dc.src)) {
      regB = regs.read(dc.src);
    }
    break;
  case INR:
  case DCR: regB = regs.read(dc.dst); break;
  case CAL:
  case RST: stack.push(PC); break;
  case RET: {
    auto address = stack.pop();
    regB = address & 0xff;
    regA = (address >> 8) & 0x3f;
    break;
  }
  default: break;
  }
}

void I8008::executeT5() {
  switch (dc.instructionType) {
  case MOV:
  case MVI: regs.write(dc.dst, regB); break;
  case INR: commit(increment(regB, flags), dc.dst); break;
  case DCR: commit(decrement(regB, flags), dc.dst); break;
  case ALU:
  case ALI: commit(alu(dc.aluOp, regs.read(Reg::A), regB, flags), Reg::A); break;
  case ROT: commit(rotate(dc.rotateOp, regs.read(Reg::A), flags), Reg::A); break;
  case JMP:
  case CAL:
  case RET: PC = static_cast<uint16_t>(((regA & 0x3f) << 8) | regB); break;
  case RST: PC = static_cast<uint16_t>(dc.vector * 8); break;
  case INP: regs.write(Reg::A, regB); break;
  default: break;
  }
}

void I8008::commit(AluResult const& r, Reg dst) {
  flags = r.flags;
  if (r.writeBack) {
    regs.write(dst, r.value);
  }
}

/// Set up the machine cycle that starts with `next`.
void I8008::beginCycle(State next) {
  executePhase = false;
  conditionMet = false;
  if (next == State::T1I) {
    interrupt.acknowledge();
    acknowledging = true;
    acknowledgePending = false;
    machineCycle = 0;
    cycleType = CycleType::PCI;
    return;
  }
  acknowledging = false;
  bool finished = machineCycle + 1 >= machineCycleCount(dc);
  machineCycle = finished ? 0 : machineCycle + 1;
  cycleType = machineCycleType(dc, machineCycle);
}

/// Simulate one clock state. `bus` is the value on the data bus during
/// this state, after arbitration. `ready` and `interruptRequest` are the
/// READY and INT pins.
void I8008::cycle(uint8_t bus, bool ready, bool interruptRequest) {
  auto currentState = state;
  auto currentPC = PC;

  interrupt.clock(interruptRequest);
  dataBus = bus;
  readyLine = ready;
  interruptLine = interruptRequest;

  bool halt = false;
  switch (state) {
  case State::T3:
    transfer(bus);
    if (cycleType == CycleType::PCI && machineCycle == 0 && dc.instructionType == HLT) {
      halt = true;
    } else if (cycleType == CycleType::PCI && machineCycle + 1 == machineCycleCount(dc) && interrupt.pending()) {
      acknowledgePending = true;
    }
    break;
  case State::T4: executeT4(); break;
  case State::T5: executeT5(); break;
  default: break;
  }

  SequencerInputs in;
  in.ready = ready;
  in.interrupt = interrupt.pending();
  in.executePhase = executePhase;
  in.halt = halt;
  in.acknowledge = acknowledgePending;
  auto next = nextState(state, in);
  if (isCycleStart(next)) {
    beginCycle(next);
  }
  state = next;

  if (verbose) {
    cout << "I8008: @" << setfill('0') << setw(4) << hex << currentPC << " " << setfill(' ') << left << setw(7)
         << currentState << right << " " << cycleType << "/" << dec << machineCycle << " " << setfill('0') << setw(2)
         << hex << (int)bus << (interruptRequest ? " INT" : "    ") << (ready ? "  " : " W") << " " << setfill(' ')
         << left << setw(10) << dc << right << " " << setfill('0') << "[A:" << setw(2) << hex << (int)regs.read(Reg::A)
         << " B:" << setw(2) << (int)regs.read(Reg::B) << " C:" << setw(2) << (int)regs.read(Reg::C)
         << " D:" << setw(2) << (int)regs.read(Reg::D) << " E:" << setw(2) << (int)regs.read(Reg::E)
         << " H:" << setw(2) << (int)regs.read(Reg::H) << " L:" << setw(2) << (int)regs.read(Reg::L) << " "
         << (flags[Flags::c] ? "C" : "c") << (flags[Flags::z] ? "Z" : "z") << (flags[Flags::s] ? "S" : "s")
         << (flags[Flags::p] ? "P" : "p") << " SP:" << dec << (int)stack.pointer << "]" << endl;
  }

  // One more state completed.
  numCycles++;
}
