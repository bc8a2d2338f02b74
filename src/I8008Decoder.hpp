// I8008Decoder.hpp
// I8008 instruction decoder

// Copyright (c) 2026 The B8008 Team. All rights reserved.
// This file is part of B8008 and is made available under
// the terms of the BSD license (see the COPYING file).

#ifndef I8008Decoder_hpp
#define I8008Decoder_hpp

#include "I8008ALU.hpp"
#include "I8008Registers.hpp"
#include <array>
#include <cstdint>
#include <iostream>

namespace b8008 {

/// Instruction classes. Every opcode maps to exactly one of these;
/// the remaining fields of `InstructionTraits` are its operands.
enum InstructionType {
  // clang-format off
  HLT, MOV, MVI, INR, DCR,
  ALU, ALI, ROT,
  JMP, CAL, RET, RST,
  INP, OUT,
  UNDEFINED
  // clang-format on
};

/// How an instruction uses the bus after the opcode fetch.
enum class AccessType { none, immediate, read, write, branch, stack, io };

/// Condition tested by the conditional jumps, calls and returns.
struct Condition {
  bool conditional; /// False for the unconditional forms.
  int flag;         /// Flags::c, Flags::z, Flags::s or Flags::p.
  bool sense;       /// Branch when the flag equals this value.
};

/// Descriptor for a CPU instruction.
struct InstructionTraits {
  std::uint8_t opcode;
  int length;
  const char* mnemonic;
  InstructionType instructionType;
  AccessType accessType;
  Reg dst;
  Reg src;
  AluOp aluOp;
  RotateOp rotateOp;
  Condition condition;
  int vector; /// RST target is vector * 8.
  int port;   /// INP 0..7, OUT 8..31.
  bool undefined;
};

/// An instruction with its operand value (immediate byte or 14-bit address).
struct Instruction : public InstructionTraits {
  std::uint16_t operand;
};

InstructionTraits const& decode(std::uint8_t opcode);
Instruction decode(std::array<std::uint8_t, 3> const& bytes);

inline bool conditionHolds(Condition const& cond, Flags const& flags) {
  return !cond.conditional || (flags[cond.flag] == cond.sense);
}

template <class T> struct asBytesWrapper {
  asBytesWrapper(T& object) : object(object) {}
  T& get() { return object; }
  T& object;
};

template <class T> asBytesWrapper<T const> asBytes(T const& object) {
  return asBytesWrapper<T const>(object);
}

} // namespace b8008

std::ostream& operator<<(std::ostream& os, b8008::InstructionTraits const& ins);
std::ostream& operator<<(std::ostream& os, b8008::Instruction const& ins);
std::ostream& operator<<(std::ostream& os, b8008::asBytesWrapper<b8008::InstructionTraits const> ins);
std::ostream& operator<<(std::ostream& os, b8008::asBytesWrapper<b8008::Instruction const> ins);

#endif /* I8008Decoder_hpp */
