// test_disassembler.cpp
// I8008 disassembler tests

// Copyright (c) 2026 The B8008 Team. All rights reserved.
// This file is part of B8008 and is made available under
// the terms of the BSD license (see the COPYING file).

#include "I8008Disassembler.hpp"
#include <gtest/gtest.h>
#include <sstream>
#include <vector>

using namespace b8008;

TEST(Disassembler, LinearListing) {
  std::vector<std::uint8_t> code{
      0x06, 0x05,       // MVI A,05h
      0x81,             // ADD B
      0x44, 0x59, 0x00, // JMP 0059h
      0x51,             // OUT 8
  };
  auto lines = disassemble(code, 0x0100);
  ASSERT_EQ(lines.size(), 4u);
  EXPECT_EQ(lines[0].first, 0x0100);
  EXPECT_EQ(lines[0].second.instructionType, MVI);
  EXPECT_EQ(lines[0].second.operand, 0x05);
  EXPECT_EQ(lines[1].first, 0x0102);
  EXPECT_EQ(lines[1].second.instructionType, ALU);
  EXPECT_EQ(lines[2].first, 0x0103);
  EXPECT_EQ(lines[2].second.operand, 0x0059);
  EXPECT_EQ(lines[3].first, 0x0106);
  EXPECT_EQ(lines[3].second.port, 8);
}

TEST(Disassembler, TruncatedInstructionIsData) {
  std::vector<std::uint8_t> code{0x00, 0x46, 0x10};
  auto lines = disassemble(code);
  ASSERT_EQ(lines.size(), 3u);
  EXPECT_EQ(lines[0].second.instructionType, HLT);
  EXPECT_EQ(lines[1].second.instructionType, UNDEFINED);
  EXPECT_EQ(lines[1].second.opcode, 0x46);
  // The operand byte is decoded on its own: INR C.
  EXPECT_EQ(lines[2].first, 0x0002);
  EXPECT_EQ(lines[2].second.instructionType, INR);
}

TEST(Disassembler, EmptyBlock) {
  EXPECT_TRUE(disassemble(std::vector<std::uint8_t>{}).empty());
}

TEST(Disassembler, PrintListing) {
  std::vector<std::uint8_t> code{0x06, 0xab, 0x44, 0x59, 0x00, 0x22};
  std::ostringstream oss;
  printDisassembly(oss, disassemble(code, 0x0040));
  EXPECT_EQ(oss.str(), "0040  06 AB     MVI A,ABh\n"
                       "0042  44 59 00  JMP 0059h\n"
                       "0045  22        DB 22h\n");
}
