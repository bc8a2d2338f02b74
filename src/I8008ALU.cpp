// I8008ALU.cpp
// I8008 arithmetic-logic unit and condition flags

// Copyright (c) 2026 The B8008 Team. All rights reserved.
// This file is part of B8008 and is made available under
// the terms of the BSD license (see the COPYING file).

#include "I8008ALU.hpp"

using namespace std;
using namespace b8008;

// -------------------------------------------------------------------
// MARK: - Adder
// -------------------------------------------------------------------

/// 8-bit carry-lookahead adder. With generate g[i] = a[i] & b[i] and
/// propagate p[i] = a[i] ^ b[i], the carry into bit i+1 is
///
///   c[i+1] = g[i] | p[i] g[i-1] | p[i] p[i-1] g[i-2] | ... | p[i]...p[0] c[0]
///
/// and every carry is computed directly from g, p and c[0].

AdderResult b8008::carryLookaheadAdd(uint8_t a, uint8_t b, bool carryIn) {
  uint8_t g = a & b;
  uint8_t p = a ^ b;
  bool carries[9];
  carries[0] = carryIn;
  for (int i = 0; i < 8; ++i) {
    bool c = false;
    bool chain = true; // p[i] p[i-1] ... p[j+1]
    for (int j = i; j >= 0; --j) {
      c |= chain && ((g >> j) & 1);
      chain = chain && ((p >> j) & 1);
    }
    c |= chain && carryIn;
    carries[i + 1] = c;
  }
  uint8_t sum = 0;
  for (int i = 0; i < 8; ++i) {
    sum |= static_cast<uint8_t>((((p >> i) & 1) ^ carries[i]) << i);
  }
  return AdderResult{sum, carries[8]};
}

bool b8008::evenParity(uint8_t value) {
  value ^= value >> 4;
  value ^= value >> 2;
  value ^= value >> 1;
  return (value & 1) == 0;
}

Flags b8008::resultFlags(uint8_t value, bool carry) {
  Flags f;
  f[Flags::c] = carry;
  f[Flags::z] = (value == 0);
  f[Flags::s] = (value & 0x80) != 0;
  f[Flags::p] = evenParity(value);
  return f;
}

// -------------------------------------------------------------------
// MARK: - Operations
// -------------------------------------------------------------------

AluResult b8008::alu(AluOp op, uint8_t accumulator, uint8_t operand, Flags flags) {
  bool carry = flags[Flags::c];
  switch (op) {
  case AluOp::ADD:
  case AluOp::ADC: {
    auto r = carryLookaheadAdd(accumulator, operand, op == AluOp::ADC && carry);
    return AluResult{r.sum, resultFlags(r.sum, r.carry), true};
  }
  case AluOp::SUB:
  case AluOp::SBB:
  case AluOp::CMP: {
    // Two's complement subtraction. The carry flag holds the borrow,
    // which is the complement of the adder carry-out.
    bool borrowIn = (op == AluOp::SBB) && carry;
    auto r = carryLookaheadAdd(accumulator, static_cast<uint8_t>(~operand), !borrowIn);
    return AluResult{r.sum, resultFlags(r.sum, !r.carry), op != AluOp::CMP};
  }
  case AluOp::AND: {
    uint8_t v = accumulator & operand;
    return AluResult{v, resultFlags(v, false), true};
  }
  case AluOp::XOR: {
    uint8_t v = accumulator ^ operand;
    return AluResult{v, resultFlags(v, false), true};
  }
  case AluOp::OR: {
    uint8_t v = accumulator | operand;
    return AluResult{v, resultFlags(v, false), true};
  }
  }
  return AluResult{accumulator, flags, false};
}

// INR and DCR leave the carry alone.

AluResult b8008::increment(uint8_t value, Flags flags) {
  auto r = carryLookaheadAdd(value, 0x01, false);
  return AluResult{r.sum, resultFlags(r.sum, flags[Flags::c]), true};
}

AluResult b8008::decrement(uint8_t value, Flags flags) {
  auto r = carryLookaheadAdd(value, 0xff, false);
  return AluResult{r.sum, resultFlags(r.sum, flags[Flags::c]), true};
}

// Rotations only touch the carry.

AluResult b8008::rotate(RotateOp op, uint8_t a, Flags flags) {
  bool carry = flags[Flags::c];
  uint8_t v = a;
  switch (op) {
  case RotateOp::RLC:
    carry = a & 0x80;
    v = static_cast<uint8_t>((a << 1) | (a >> 7));
    break;
  case RotateOp::RRC:
    carry = a & 0x01;
    v = static_cast<uint8_t>((a >> 1) | (a << 7));
    break;
  case RotateOp::RAL:
    v = static_cast<uint8_t>((a << 1) | (carry ? 1 : 0));
    carry = a & 0x80;
    break;
  case RotateOp::RAR:
    v = static_cast<uint8_t>((a >> 1) | (carry ? 0x80 : 0));
    carry = a & 0x01;
    break;
  }
  flags[Flags::c] = carry;
  return AluResult{v, flags, true};
}

// -------------------------------------------------------------------
// MARK: - Names
// -------------------------------------------------------------------

char const* b8008::aluOpName(AluOp op) {
  static char const* names[] = {"ADD", "ADC", "SUB", "SBB", "ANA", "XRA", "ORA", "CMP"};
  return names[static_cast<int>(op) & 7];
}

char const* b8008::rotateOpName(RotateOp op) {
  static char const* names[] = {"RLC", "RRC", "RAL", "RAR"};
  return names[static_cast<int>(op) & 3];
}
