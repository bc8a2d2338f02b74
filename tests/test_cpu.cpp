// test_cpu.cpp
// I8008 CPU tests, driving the pins directly

// Copyright (c) 2026 The B8008 Team. All rights reserved.
// This file is part of B8008 and is made available under
// the terms of the BSD license (see the COPYING file).

#include "I8008.hpp"
#include <gtest/gtest.h>

using namespace b8008;

namespace {

/// Bring a CPU from power-up to T1 of the instruction at 0x38, by
/// jamming RST 7 in an interrupt acknowledge cycle.
void bootWithRestart7(I8008& cpu) {
  cpu.cycle(0x00, true, true);
  cpu.cycle(0x00, true, true); // Synchronized: STOPPED -> T1I.
  cpu.cycle(0x00, true, false); // T1I
  cpu.cycle(0x00, true, false); // T2
  cpu.cycle(0x3d, true, false); // T3: RST 7
  cpu.cycle(0x00, true, false); // T4
  cpu.cycle(0x00, true, false); // T5
}

} // namespace

TEST(I8008, PowerUpState) {
  I8008 cpu;
  EXPECT_EQ(cpu.getState(), State::STOPPED);
  EXPECT_EQ(cpu.getStateCode(), 0b011);
  EXPECT_FALSE(cpu.getSync());
  EXPECT_EQ(cpu.getPC(), 0);
  EXPECT_EQ(cpu.getA(), 0);
  EXPECT_EQ(cpu.getL(), 0);
  EXPECT_EQ(static_cast<std::uint8_t>(cpu.getFlags()), 0);
  EXPECT_EQ(cpu.getStack().pointer, 0);
  EXPECT_FALSE(cpu.getBusDrive().enabled);
}

TEST(I8008, StaysStoppedWithoutInterrupt) {
  I8008 cpu;
  for (int i = 0; i < 20; ++i) {
    cpu.cycle(0xff, true, false);
  }
  EXPECT_TRUE(cpu.isStopped());
  EXPECT_EQ(cpu.getNumCycles(), 20u);
}

TEST(I8008, InterruptWakesIntoAcknowledge) {
  I8008 cpu;
  cpu.cycle(0x00, true, true);
  EXPECT_EQ(cpu.getState(), State::STOPPED);
  cpu.cycle(0x00, true, true);
  EXPECT_EQ(cpu.getState(), State::T1I);
  EXPECT_TRUE(cpu.getSync());
  EXPECT_TRUE(cpu.getAcknowledging());
  EXPECT_FALSE(cpu.getInterruptPending());

  // T1I sends out the PC, T2 the cycle type and the high address bits.
  auto d = cpu.getBusDrive();
  EXPECT_TRUE(d.enabled);
  EXPECT_EQ(d.value, 0x00);
  cpu.cycle(d.value, true, false);
  EXPECT_EQ(cpu.getState(), State::T2);
  EXPECT_EQ(cpu.getBusDrive().value, 0x00);
  cpu.cycle(0x00, true, false);
  EXPECT_EQ(cpu.getState(), State::T3);
  EXPECT_FALSE(cpu.getBusDrive().enabled);

  // The jammed opcode does not advance the PC.
  cpu.cycle(0x3d, true, false);
  EXPECT_EQ(cpu.getIR(), 0x3d);
  EXPECT_EQ(cpu.getPC(), 0x0000);
  EXPECT_EQ(cpu.getState(), State::T4);
  cpu.cycle(0x00, true, false);
  cpu.cycle(0x00, true, false);
  EXPECT_EQ(cpu.getState(), State::T1);
  EXPECT_EQ(cpu.getPC(), 0x0038);
  EXPECT_EQ(cpu.getStack().top(), 0x0000);
  EXPECT_FALSE(cpu.getAcknowledging());
}

TEST(I8008, FetchAndExecuteImmediate) {
  I8008 cpu;
  bootWithRestart7(cpu);
  ASSERT_EQ(cpu.getState(), State::T1);
  EXPECT_EQ(cpu.getBusDrive().value, 0x38);

  // Opcode fetch of MVI A,42h: three states.
  cpu.cycle(0x38, true, false);
  EXPECT_EQ(cpu.getBusDrive().value, 0x00);
  cpu.cycle(0x00, true, false);
  cpu.cycle(0x06, true, false);
  EXPECT_EQ(cpu.getState(), State::T1);
  EXPECT_EQ(cpu.getMachineCycle(), 1);
  EXPECT_EQ(cpu.getCycleType(), CycleType::PCI);
  EXPECT_EQ(cpu.getPC(), 0x0039);

  // Operand fetch: five states.
  EXPECT_EQ(cpu.getBusDrive().value, 0x39);
  cpu.cycle(0x39, true, false);
  cpu.cycle(0x00, true, false);
  cpu.cycle(0x42, true, false);
  EXPECT_EQ(cpu.getState(), State::T4);
  EXPECT_EQ(cpu.getRegB(), 0x42);
  cpu.cycle(0x42, true, false);
  cpu.cycle(0x42, true, false);
  EXPECT_EQ(cpu.getState(), State::T1);
  EXPECT_EQ(cpu.getMachineCycle(), 0);
  EXPECT_EQ(cpu.getA(), 0x42);
  EXPECT_EQ(cpu.getPC(), 0x003a);
  EXPECT_EQ(cpu.getNumCycles(), 15u);
}

TEST(I8008, WaitStretchesTheCycle) {
  I8008 cpu;
  bootWithRestart7(cpu);
  cpu.cycle(0x38, true, false);
  EXPECT_EQ(cpu.getState(), State::T2);
  cpu.cycle(0x00, false, false);
  EXPECT_EQ(cpu.getState(), State::WAIT);
  EXPECT_EQ(cpu.getStateCode(), 0);
  cpu.cycle(0x00, false, false);
  cpu.cycle(0x00, false, false);
  EXPECT_EQ(cpu.getState(), State::WAIT);
  EXPECT_EQ(cpu.getPC(), 0x0038);
  cpu.cycle(0x00, true, false);
  EXPECT_EQ(cpu.getState(), State::T3);
  cpu.cycle(0xc8, true, false); // MOV B,A
  EXPECT_EQ(cpu.getState(), State::T4);
  EXPECT_EQ(cpu.getPC(), 0x0039);
}

TEST(I8008, HaltThenInterrupt) {
  I8008 cpu;
  bootWithRestart7(cpu);
  cpu.cycle(0x38, true, false);
  cpu.cycle(0x00, true, false);
  cpu.cycle(0x00, true, true); // HLT, with INT rising.
  EXPECT_EQ(cpu.getState(), State::STOPPED);
  EXPECT_EQ(cpu.getPC(), 0x0039);
  cpu.cycle(0x00, true, true);
  EXPECT_EQ(cpu.getState(), State::T1I);
  EXPECT_EQ(cpu.getBusDrive().value, 0x39);
}

TEST(I8008, WriteCycleDrivesData) {
  I8008 cpu;
  bootWithRestart7(cpu);
  cpu.setRegister(Reg::A, 0x77);
  cpu.setRegister(Reg::H, 0x08);
  cpu.setRegister(Reg::L, 0x10);
  cpu.cycle(0x38, true, false);
  cpu.cycle(0x00, true, false);
  cpu.cycle(0xf8, true, false); // MOV M,A
  EXPECT_EQ(cpu.getCycleType(), CycleType::PCW);
  EXPECT_EQ(cpu.getBusDrive().value, 0x10);
  cpu.cycle(0x10, true, false);
  EXPECT_EQ(cpu.getBusDrive().value, 0x88);
  cpu.cycle(0x88, true, false);
  auto d = cpu.getBusDrive();
  EXPECT_TRUE(d.enabled);
  EXPECT_EQ(d.value, 0x77);
  cpu.cycle(0x77, true, false);
  EXPECT_EQ(cpu.getState(), State::T1);
  EXPECT_EQ(cpu.getMachineCycle(), 0);
}

TEST(I8008, StateSerializationRoundTrip) {
  I8008 cpu;
  bootWithRestart7(cpu);
  cpu.cycle(0x38, true, false);
  cpu.cycle(0x00, true, false);
  cpu.cycle(0x06, true, false);

  nlohmann::json j = static_cast<I8008State const&>(cpu);
  I8008 copy;
  copy = j.get<I8008State>();
  EXPECT_TRUE(copy == cpu);
  EXPECT_EQ(copy.getDecodedInstruction().instructionType, MVI);
}

TEST(I8008, ResetClearsEverything) {
  I8008 cpu;
  bootWithRestart7(cpu);
  cpu.setRegister(Reg::C, 0x12);
  cpu.reset();
  EXPECT_TRUE(cpu.isStopped());
  EXPECT_EQ(cpu.getC(), 0);
  EXPECT_EQ(cpu.getStack().pointer, 0);
  EXPECT_EQ(cpu.getNumCycles(), 0u);
}

TEST(I8008, SettingIRDecodes) {
  I8008 cpu;
  cpu.setIR(0x06);
  EXPECT_EQ(cpu.getIR(), 0x06);
  EXPECT_EQ(cpu.getDecodedInstruction().instructionType, MVI);
  cpu.setIR(0x51);
  EXPECT_EQ(cpu.getDecodedInstruction().instructionType, OUT);
  EXPECT_EQ(cpu.getDecodedInstruction().port, 8);
}

TEST(I8008, LoadingStateDecodesIR) {
  I8008 source;
  bootWithRestart7(source);
  source.cycle(0x38, true, false);
  source.cycle(0x00, true, false);
  source.cycle(0x51, true, false); // OUT 8

  nlohmann::json j = static_cast<I8008State const&>(source);
  I8008 cpu;
  cpu.setIR(0x06);
  cpu = j.get<I8008State>();
  EXPECT_EQ(cpu.getDecodedInstruction().instructionType, OUT);
  EXPECT_EQ(cpu.getCycleType(), CycleType::PCC);
}
