// I8008Decoder.cpp
// I8008 instruction decoder

// Copyright (c) 2026 The B8008 Team. All rights reserved.
// This file is part of B8008 and is made available under
// the terms of the BSD license (see the COPYING file).

#include "I8008Decoder.hpp"
#include <iomanip>
#include <type_traits>

using namespace std;
using namespace b8008;

// -------------------------------------------------------------------
// MARK: - Mnemonics
// -------------------------------------------------------------------

// Conditional forms, indexed by [sense:1][flag:2].
// clang-format off
static const char* jumpNames[] = {"JNC", "JNZ", "JP", "JPO", "JC", "JZ", "JM", "JPE"};
static const char* callNames[] = {"CNC", "CNZ", "CP", "CPO", "CC", "CZ", "CM", "CPE"};
static const char* returnNames[] = {"RNC", "RNZ", "RP", "RPO", "RC", "RZ", "RM", "RPE"};
static const char* immediateNames[] = {"ADI", "ACI", "SUI", "SBI", "ANI", "XRI", "ORI", "CPI"};
// clang-format on

// -------------------------------------------------------------------
// MARK: - Decoding
// -------------------------------------------------------------------

/// Decode an opcode from its bit fields. Bits not looked at by a given
/// group are don't-cares, which is where the duplicate encodings of
/// RET, JMP and CALL come from.
static InstructionTraits decodeFields(uint8_t opcode) {
  InstructionTraits dc;
  dc.opcode = opcode;
  dc.length = 1;
  dc.mnemonic = "???";
  dc.instructionType = UNDEFINED;
  dc.accessType = AccessType::none;
  dc.dst = Reg::A;
  dc.src = Reg::A;
  dc.aluOp = AluOp::ADD;
  dc.rotateOp = RotateOp::RLC;
  dc.condition = Condition{false, Flags::c, false};
  dc.vector = 0;
  dc.port = 0;
  dc.undefined = false;

  int group = (opcode >> 6) & 0x03;
  int ddd = (opcode >> 3) & 0x07;
  int sss = opcode & 0x07;
  auto cond = Condition{true, ddd & 0x03, (ddd & 0x04) != 0};

  switch (group) {
  case 0:
    switch (sss) {
    case 0: // HLT (DDD=0), INR r
    case 1: // HLT (DDD=0), DCR r
      if (ddd == 0) {
        dc.instructionType = HLT;
        dc.mnemonic = "HLT";
      } else if (ddd != 7) {
        dc.instructionType = (sss == 0) ? INR : DCR;
        dc.mnemonic = (sss == 0) ? "INR" : "DCR";
        dc.dst = static_cast<Reg>(ddd);
      } else {
        dc.undefined = true; // INR M and DCR M do not exist.
      }
      break;
    case 2: // Rotates. Only the low two bits of DDD are defined.
      if (ddd < 4) {
        dc.instructionType = ROT;
        dc.rotateOp = static_cast<RotateOp>(ddd);
        dc.mnemonic = rotateOpName(dc.rotateOp);
      } else {
        dc.undefined = true;
      }
      break;
    case 3: // Conditional return.
      dc.instructionType = RET;
      dc.accessType = AccessType::stack;
      dc.condition = cond;
      dc.mnemonic = returnNames[ddd];
      break;
    case 4: // ALU with immediate operand.
      dc.instructionType = ALI;
      dc.accessType = AccessType::immediate;
      dc.length = 2;
      dc.aluOp = static_cast<AluOp>(ddd);
      dc.mnemonic = immediateNames[ddd];
      break;
    case 5: // RST
      dc.instructionType = RST;
      dc.accessType = AccessType::stack;
      dc.vector = ddd;
      dc.mnemonic = "RST";
      break;
    case 6: // MVI r / MVI M
      dc.instructionType = MVI;
      dc.accessType = (ddd == 7) ? AccessType::write : AccessType::immediate;
      dc.length = 2;
      dc.dst = static_cast<Reg>(ddd);
      dc.mnemonic = "MVI";
      break;
    case 7: // Unconditional return, DDD is a don't-care.
      dc.instructionType = RET;
      dc.accessType = AccessType::stack;
      dc.mnemonic = "RET";
      break;
    }
    break;

  case 1:
    if (sss & 0x01) {
      // I/O. Ports 0-7 are inputs (RR = 00), ports 8-31 outputs.
      int port = (opcode >> 1) & 0x1f;
      dc.accessType = AccessType::io;
      dc.port = port;
      if (port < 8) {
        dc.instructionType = INP;
        dc.mnemonic = "IN";
      } else {
        dc.instructionType = OUT;
        dc.mnemonic = "OUT";
      }
      break;
    }
    dc.length = 3;
    dc.accessType = AccessType::branch;
    switch (sss) {
    case 0: // Conditional jump.
      dc.instructionType = JMP;
      dc.condition = cond;
      dc.mnemonic = jumpNames[ddd];
      break;
    case 2: // Conditional call.
      dc.instructionType = CAL;
      dc.condition = cond;
      dc.mnemonic = callNames[ddd];
      break;
    case 4: // Unconditional jump, DDD is a don't-care.
      dc.instructionType = JMP;
      dc.mnemonic = "JMP";
      break;
    case 6: // Unconditional call, DDD is a don't-care.
      dc.instructionType = CAL;
      dc.mnemonic = "CALL";
      break;
    }
    break;

  case 2: // ALU with register or memory operand.
    dc.instructionType = ALU;
    dc.aluOp = static_cast<AluOp>(ddd);
    dc.src = static_cast<Reg>(sss);
    dc.accessType = (sss == 7) ? AccessType::read : AccessType::none;
    dc.mnemonic = aluOpName(dc.aluOp);
    break;

  case 3: // MOV, except MOV M,M which is HLT.
    if (opcode == 0xff) {
      dc.instructionType = HLT;
      dc.mnemonic = "HLT";
      break;
    }
    dc.instructionType = MOV;
    dc.dst = static_cast<Reg>(ddd);
    dc.src = static_cast<Reg>(sss);
    if (ddd == 7) {
      dc.accessType = AccessType::write;
    } else if (sss == 7) {
      dc.accessType = AccessType::read;
    }
    dc.mnemonic = "MOV";
    break;
  }
  return dc;
}

struct OpcodeTable {
  InstructionTraits data[256];

  OpcodeTable() {
    for (int opcode = 0; opcode < 256; ++opcode) {
      data[opcode] = decodeFields(static_cast<uint8_t>(opcode));
    }
  }
} opcodeTable;

InstructionTraits const& b8008::decode(uint8_t opcode) {
  return opcodeTable.data[opcode];
}

Instruction b8008::decode(array<uint8_t, 3> const& bytes) {
  Instruction ins;
  ins.InstructionTraits::operator=(decode(bytes[0]));
  ins.operand = 0;
  if (ins.length == 2) {
    ins.operand = bytes[1];
  } else if (ins.length == 3) {
    ins.operand = static_cast<uint16_t>(((bytes[2] & 0x3f) << 8) | bytes[1]);
  }
  return ins;
}

// -------------------------------------------------------------------
// MARK: - Printing
// -------------------------------------------------------------------

template <typename T> static inline ostream& printHelper(ostream& os, InstructionTraits const& ins, T operand) {
  auto w = os.width();
  auto f = os.flags();
  auto l = os.fill();
  if (ins.instructionType == UNDEFINED) {
    os << "DB " << hex << uppercase << setfill('0') << setw(2) << (int)ins.opcode << "h";
  } else {
    // Without an operand value, print placeholders (hh, hhhh).
    bool placeholder = is_same<T, char const*>::value;
    auto suffix = placeholder ? "" : "h";
    os << ins.mnemonic << hex << uppercase;
    os << setfill(placeholder ? 'h' : '0');
    switch (ins.instructionType) {
    case MOV: os << " " << regName(ins.dst) << "," << regName(ins.src); break;
    case MVI: os << " " << regName(ins.dst) << "," << setw(2) << operand << suffix; break;
    case INR:
    case DCR: os << " " << regName(ins.dst); break;
    case ALU: os << " " << regName(ins.src); break;
    case ALI: os << " " << setw(2) << operand << suffix; break;
    case JMP:
    case CAL: os << " " << setw(4) << operand << suffix; break;
    case RST: os << " " << dec << ins.vector; break;
    case INP:
    case OUT: os << " " << dec << ins.port; break;
    default: break;
    }
  }
  os.fill(l);
  os.flags(f);
  os.width(w);
  return os;
}

ostream& operator<<(ostream& os, InstructionTraits const& ins) {
  return printHelper(os, ins, "");
}

ostream& operator<<(ostream& os, Instruction const& ins) {
  return printHelper(os, ins, ins.operand);
}

std::ostream& operator<<(std::ostream& os, asBytesWrapper<InstructionTraits const> ins) {
  auto w = os.width();
  auto f = os.flags();
  auto l = os.fill();
  os << hex << setw(2) << setfill('0') << (unsigned)ins.get().opcode;
  if (ins.get().length >= 2) os << " hh";
  if (ins.get().length >= 3) os << " hh";
  os.fill(l);
  os.flags(f);
  os.width(w);
  return os;
}

std::ostream& operator<<(std::ostream& os, asBytesWrapper<Instruction const> ins) {
  auto w = os.width();
  auto f = os.flags();
  auto l = os.fill();
  os << hex << setw(2) << setfill('0') << (unsigned)ins.get().opcode;
  if (ins.get().length >= 2) os << " " << setw(2) << (ins.get().operand & 0xff);
  if (ins.get().length >= 3) os << " " << setw(2) << (ins.get().operand >> 8);
  os.fill(l);
  os.flags(f);
  os.width(w);
  return os;
}
