// I8008.hpp
// I8008 emulator

// Copyright (c) 2026 The B8008 Team. All rights reserved.
// This file is part of B8008 and is made available under
// the terms of the BSD license (see the COPYING file).

#ifndef I8008_hpp
#define I8008_hpp

#include "I8008ALU.hpp"
#include "I8008Bus.hpp"
#include "I8008Decoder.hpp"
#include "I8008Interrupt.hpp"
#include "I8008Registers.hpp"
#include "I8008Stack.hpp"
#include "I8008Timing.hpp"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <cstdint>
#include <iostream>

namespace b8008 {

/// The state of the I8008 CPU.
struct I8008State {
  // Lifecycle.
  virtual ~I8008State() = default;
  bool operator==(I8008State const&) const;

  // Pins.
  State getState() const;
  int getStateCode() const;
  bool getSync() const;
  CycleType getCycleType() const;
  std::uint8_t getDataBus() const;
  bool getReadyLine() const;
  bool getInterruptLine() const;

  // Programmable registers.
  std::uint8_t getRegister(Reg r) const;
  void setRegister(Reg r, std::uint8_t value);
  std::uint8_t getA() const;
  std::uint8_t getB() const;
  std::uint8_t getC() const;
  std::uint8_t getD() const;
  std::uint8_t getE() const;
  std::uint8_t getH() const;
  std::uint8_t getL() const;
  std::uint16_t getHL() const;
  Flags getFlags() const;
  void setFlags(Flags f);
  std::uint16_t getPC() const;
  void setPC(std::uint16_t PC);
  AddressStack const& getStack() const;

  // Internal CPU state.
  std::uint8_t getIR() const;
  void setIR(std::uint8_t IR);
  std::uint8_t getRegA() const;
  std::uint8_t getRegB() const;
  int getMachineCycle() const;
  bool getAcknowledging() const;
  bool getInterruptPending() const;
  bool isStopped() const;

  std::size_t getNumCycles() const;
  void setNumCycles(std::size_t n);

protected:
  // Pins.
  State state{State::STOPPED};        /// S2 S1 S0.
  CycleType cycleType{CycleType::PCI}; /// Type of the current machine cycle.
  std::uint8_t dataBus{};             /// Last value sampled on the data bus.
  bool readyLine{true};               /// READY, as last sampled.
  bool interruptLine{};               /// INT, as last sampled.

  // Programmable registers.
  RegisterFile regs;   /// A, B, C, D, E, H, L.
  Flags flags{};       /// Carry, zero, sign, parity.
  std::uint16_t PC{};  /// Program counter (14 bits).
  AddressStack stack;  /// Return addresses.

  // Internal CPU state.
  std::uint8_t IR{};           /// Instruction register.
  std::uint8_t regA{};         /// Temporary register a (high address byte).
  std::uint8_t regB{};         /// Temporary register b (data, low address byte).
  int machineCycle{};          /// Machine cycle of the current instruction (0 = opcode fetch).
  bool executePhase{};         /// The current machine cycle runs T4 and T5.
  bool conditionMet{};         /// Condition of the current instruction, sampled at T3.
  bool acknowledging{};        /// The current machine cycle is an interrupt acknowledge.
  bool acknowledgePending{};   /// The next machine cycle is an interrupt acknowledge.
  InterruptSynchronizer interrupt; /// INT synchronizer and latch.

  // Counters.
  std::size_t numCycles{}; /// Number of states simulated so far.

  friend void to_json(nlohmann::json& j, const I8008State& s);
  friend void from_json(const nlohmann::json& j, I8008State& state);
};

void to_json(nlohmann::json& j, const I8008State& s);
void from_json(const nlohmann::json& j, I8008State& state);

class I8008 : public I8008State {
public:
  // Lifecycle.
  I8008();
  I8008& operator=(I8008State const&);
  I8008& operator=(I8008 const&) = delete;
  virtual ~I8008() = default;

  // Operation.
  void reset();
  BusDrive getBusDrive() const;
  std::uint16_t getCycleAddress() const;
  void cycle(std::uint8_t bus, bool ready, bool interruptRequest);
  InstructionTraits const& getDecodedInstruction() const;
  void setIR(std::uint8_t IR);
  bool getVerbose() const;
  void setVerbose(bool x);

private:
  // Transient.
  InstructionTraits dc; // Can be deduced from IR.
  bool verbose;

  // Helpers.
  void beginCycle(State next);
  void transfer(std::uint8_t bus);
  void executeT4();
  void executeT5();
  void commit(AluResult const& r, Reg dst);
};

// -------------------------------------------------------------------
// MARK: - Getters & setters
// -------------------------------------------------------------------

inline State I8008State::getState() const {
  return state;
}

inline int I8008State::getStateCode() const {
  return static_cast<int>(state);
}

inline bool I8008State::getSync() const {
  return isCycleStart(state);
}

inline CycleType I8008State::getCycleType() const {
  return cycleType;
}

inline std::uint8_t I8008State::getDataBus() const {
  return dataBus;
}

inline bool I8008State::getReadyLine() const {
  return readyLine;
}

inline bool I8008State::getInterruptLine() const {
  return interruptLine;
}

inline std::uint8_t I8008State::getRegister(Reg r) const {
  return regs.read(r);
}

inline void I8008State::setRegister(Reg r, std::uint8_t value) {
  regs.write(r, value);
}

inline std::uint8_t I8008State::getA() const {
  return regs.read(Reg::A);
}

inline std::uint8_t I8008State::getB() const {
  return regs.read(Reg::B);
}

inline std::uint8_t I8008State::getC() const {
  return regs.read(Reg::C);
}

inline std::uint8_t I8008State::getD() const {
  return regs.read(Reg::D);
}

inline std::uint8_t I8008State::getE() const {
  return regs.read(Reg::E);
}

inline std::uint8_t I8008State::getH() const {
  return regs.read(Reg::H);
}

inline std::uint8_t I8008State::getL() const {
  return regs.read(Reg::L);
}

inline std::uint16_t I8008State::getHL() const {
  return regs.addressPointer();
}

inline Flags I8008State::getFlags() const {
  return flags;
}

inline void I8008State::setFlags(Flags f) {
  flags = f;
}

inline std::uint16_t I8008State::getPC() const {
  return PC;
}

inline void I8008State::setPC(std::uint16_t PC) {
  this->PC = PC & addressMask;
}

inline AddressStack const& I8008State::getStack() const {
  return stack;
}

inline std::uint8_t I8008State::getIR() const {
  return IR;
}

inline void I8008State::setIR(std::uint8_t IR) {
  this->IR = IR;
}

inline std::uint8_t I8008State::getRegA() const {
  return regA;
}

inline std::uint8_t I8008State::getRegB() const {
  return regB;
}

inline int I8008State::getMachineCycle() const {
  return machineCycle;
}

inline bool I8008State::getAcknowledging() const {
  return acknowledging;
}

inline bool I8008State::getInterruptPending() const {
  return interrupt.pending();
}

inline bool I8008State::isStopped() const {
  return state == State::STOPPED;
}

inline std::size_t I8008State::getNumCycles() const {
  return numCycles;
}

inline void I8008State::setNumCycles(std::size_t n) {
  numCycles = n;
}

inline InstructionTraits const& I8008::getDecodedInstruction() const {
  return dc;
}

// Also decode, so that the next state runs the new instruction.
inline void I8008::setIR(std::uint8_t IR) {
  I8008State::setIR(IR);
  dc = decode(IR);
}

inline bool I8008::getVerbose() const {
  return verbose;
}

inline void I8008::setVerbose(bool x) {
  verbose = x;
}

} // namespace b8008

#endif /* I8008_hpp */
