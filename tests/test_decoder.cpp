// test_decoder.cpp
// I8008 instruction decoder tests

// Copyright (c) 2026 The B8008 Team. All rights reserved.
// This file is part of B8008 and is made available under
// the terms of the BSD license (see the COPYING file).

#include "I8008Decoder.hpp"
#include <gtest/gtest.h>
#include <sstream>
#include <string>

using namespace b8008;

static std::string print(std::array<std::uint8_t, 3> const& bytes) {
  std::ostringstream oss;
  oss << decode(bytes);
  return oss.str();
}

TEST(Decoder, HaltEncodings) {
  EXPECT_EQ(decode(0x00).instructionType, HLT);
  EXPECT_EQ(decode(0x01).instructionType, HLT);
  EXPECT_EQ(decode(0xff).instructionType, HLT);
  EXPECT_EQ(decode(0xff).length, 1);
}

TEST(Decoder, EveryOpcodeHasAType) {
  int undefined = 0;
  for (int opcode = 0; opcode < 256; ++opcode) {
    auto const& dc = decode(static_cast<std::uint8_t>(opcode));
    EXPECT_EQ(dc.opcode, opcode);
    EXPECT_GE(dc.length, 1);
    EXPECT_LE(dc.length, 3);
    if (dc.instructionType == UNDEFINED) {
      EXPECT_TRUE(dc.undefined);
      undefined++;
    }
  }
  EXPECT_EQ(undefined, 6);
}

TEST(Decoder, UndefinedOpcodes) {
  for (std::uint8_t opcode : {0x22, 0x2a, 0x32, 0x3a, 0x38, 0x39}) {
    EXPECT_EQ(decode(opcode).instructionType, UNDEFINED) << std::hex << (int)opcode;
  }
}

TEST(Decoder, DuplicateReturnJumpCallEncodings) {
  for (int ddd = 0; ddd < 8; ++ddd) {
    auto const& ret = decode(static_cast<std::uint8_t>(0x07 | (ddd << 3)));
    EXPECT_EQ(ret.instructionType, RET);
    EXPECT_FALSE(ret.condition.conditional);

    auto const& jmp = decode(static_cast<std::uint8_t>(0x44 | (ddd << 3)));
    EXPECT_EQ(jmp.instructionType, JMP);
    EXPECT_FALSE(jmp.condition.conditional);
    EXPECT_EQ(jmp.length, 3);

    auto const& call = decode(static_cast<std::uint8_t>(0x46 | (ddd << 3)));
    EXPECT_EQ(call.instructionType, CAL);
    EXPECT_FALSE(call.condition.conditional);
    EXPECT_EQ(call.length, 3);
  }
}

TEST(Decoder, ConditionalForms) {
  auto const& jnz = decode(0x48);
  EXPECT_EQ(jnz.instructionType, JMP);
  EXPECT_TRUE(jnz.condition.conditional);
  EXPECT_EQ(jnz.condition.flag, Flags::z);
  EXPECT_FALSE(jnz.condition.sense);

  auto const& cc = decode(0x62);
  EXPECT_EQ(cc.instructionType, CAL);
  EXPECT_EQ(cc.condition.flag, Flags::c);
  EXPECT_TRUE(cc.condition.sense);

  auto const& rpe = decode(0x3b);
  EXPECT_EQ(rpe.instructionType, RET);
  EXPECT_EQ(rpe.condition.flag, Flags::p);
  EXPECT_TRUE(rpe.condition.sense);
}

TEST(Decoder, ConditionEvaluation) {
  Flags f;
  f[Flags::z] = true;
  EXPECT_FALSE(conditionHolds(decode(0x48).condition, f)); // JNZ
  EXPECT_TRUE(conditionHolds(decode(0x68).condition, f));  // JZ
  EXPECT_TRUE(conditionHolds(decode(0x44).condition, f));  // JMP
}

TEST(Decoder, InputOutputPorts) {
  for (int port = 0; port < 32; ++port) {
    auto const& dc = decode(static_cast<std::uint8_t>(0x41 | (port << 1)));
    EXPECT_EQ(dc.port, port);
    EXPECT_EQ(dc.instructionType, port < 8 ? INP : OUT);
    EXPECT_EQ(dc.accessType, AccessType::io);
    EXPECT_EQ(dc.length, 1);
  }
}

TEST(Decoder, MoveAndMemoryOperands) {
  auto const& movBA = decode(0xc8);
  EXPECT_EQ(movBA.instructionType, MOV);
  EXPECT_EQ(movBA.dst, Reg::B);
  EXPECT_EQ(movBA.src, Reg::A);
  EXPECT_EQ(movBA.accessType, AccessType::none);

  EXPECT_EQ(decode(0xd7).accessType, AccessType::read);  // MOV C,M
  EXPECT_EQ(decode(0xf8).accessType, AccessType::write); // MOV M,A
  EXPECT_EQ(decode(0x87).accessType, AccessType::read);  // ADD M
  EXPECT_EQ(decode(0x3e).accessType, AccessType::write); // MVI M
  EXPECT_EQ(decode(0x3e).length, 2);
}

TEST(Decoder, AluGroups) {
  EXPECT_EQ(decode(0x81).aluOp, AluOp::ADD);
  EXPECT_EQ(decode(0x81).src, Reg::B);
  EXPECT_EQ(decode(0x90).aluOp, AluOp::SUB);
  EXPECT_EQ(decode(0xbf).aluOp, AluOp::CMP);
  EXPECT_EQ(decode(0x04).instructionType, ALI);
  EXPECT_EQ(decode(0x3c).aluOp, AluOp::CMP);
  EXPECT_EQ(decode(0x12).rotateOp, RotateOp::RAL);
  EXPECT_EQ(decode(0x1d).instructionType, RST);
  EXPECT_EQ(decode(0x1d).vector, 3);
}

TEST(Decoder, OperandAssembly) {
  auto ins = decode(std::array<std::uint8_t, 3>{0x44, 0x34, 0xd2});
  EXPECT_EQ(ins.operand, 0x1234); // The two high bits of the third byte are ignored.
  ins = decode(std::array<std::uint8_t, 3>{0x06, 0x05, 0xaa});
  EXPECT_EQ(ins.operand, 0x05);
}

TEST(Decoder, Printing) {
  EXPECT_EQ(print({0x06, 0x05, 0x00}), "MVI A,05h");
  EXPECT_EQ(print({0x48, 0x00, 0x01}), "JNZ 0100h");
  EXPECT_EQ(print({0x0d, 0x00, 0x00}), "RST 1");
  EXPECT_EQ(print({0xc8, 0x00, 0x00}), "MOV B,A");
  EXPECT_EQ(print({0x47, 0x00, 0x00}), "IN 3");
  EXPECT_EQ(print({0x51, 0x00, 0x00}), "OUT 8");
  EXPECT_EQ(print({0x14, 0x2f, 0x00}), "SUI 2Fh");
  EXPECT_EQ(print({0x22, 0x00, 0x00}), "DB 22h");
  EXPECT_EQ(print({0x00, 0x00, 0x00}), "HLT");
}

TEST(Decoder, PrintingWithoutOperand) {
  std::ostringstream oss;
  oss << decode(0x44);
  EXPECT_EQ(oss.str(), "JMP hhhh");
}
