// I8008ALU.hpp
// I8008 arithmetic-logic unit and condition flags

// Copyright (c) 2026 The B8008 Team. All rights reserved.
// This file is part of B8008 and is made available under
// the terms of the BSD license (see the COPYING file).

#ifndef I8008ALU_hpp
#define I8008ALU_hpp

#include <bitset>
#include <cstdint>

namespace b8008 {

/// Condition flags. The bit order matches the 2-bit condition code
/// field of the conditional jump, call and return instructions.
struct Flags : std::bitset<4> {
  enum { c = 0, z, s, p };
  using bitset::bitset;
  Flags& operator=(std::uint8_t value);
  operator std::uint8_t() const;
};

/// ALU operation, in the order of the 3-bit operation field.
enum class AluOp : int { ADD = 0, ADC, SUB, SBB, AND, XOR, OR, CMP };

/// Rotate operation, in the order of the 2-bit rotate field.
enum class RotateOp : int { RLC = 0, RRC, RAL, RAR };

/// Output of the 8-bit carry-lookahead adder.
struct AdderResult {
  std::uint8_t sum;
  bool carry; /// Carry out of bit 7.
};

/// Output of an ALU operation. `writeBack` is false for CMP.
struct AluResult {
  std::uint8_t value;
  Flags flags;
  bool writeBack;
};

AdderResult carryLookaheadAdd(std::uint8_t a, std::uint8_t b, bool carryIn);
bool evenParity(std::uint8_t value);
Flags resultFlags(std::uint8_t value, bool carry);

AluResult alu(AluOp op, std::uint8_t accumulator, std::uint8_t operand, Flags flags);
AluResult increment(std::uint8_t value, Flags flags);
AluResult decrement(std::uint8_t value, Flags flags);
AluResult rotate(RotateOp op, std::uint8_t accumulator, Flags flags);

char const* aluOpName(AluOp op);
char const* rotateOpName(RotateOp op);

// -------------------------------------------------------------------
// MARK: - Inline members
// -------------------------------------------------------------------

inline Flags& Flags::operator=(std::uint8_t value) {
  std::bitset<4>::operator=(value & 0x0f);
  return *this;
}

inline Flags::operator std::uint8_t() const {
  return static_cast<std::uint8_t>(to_ulong());
}

} // namespace b8008

#endif /* I8008ALU_hpp */
