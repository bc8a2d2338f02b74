// test_bus.cpp
// I8008 bus arbitration and address latch tests

// Copyright (c) 2026 The B8008 Team. All rights reserved.
// This file is part of B8008 and is made available under
// the terms of the BSD license (see the COPYING file).

#include "I8008Bus.hpp"
#include <gtest/gtest.h>

using namespace b8008;

TEST(Arbitration, UndrivenBusHoldsValue) {
  BusCandidates c;
  auto v = arbitrate(c, 0x5a);
  EXPECT_EQ(v.driver, BusDriver::none);
  EXPECT_EQ(v.value, 0x5a);
}

TEST(Arbitration, Priority) {
  BusCandidates c;
  c.io = BusDrive{true, 0x04};
  EXPECT_EQ(arbitrate(c, 0).driver, BusDriver::io);
  c.memory = BusDrive{true, 0x03};
  EXPECT_EQ(arbitrate(c, 0).driver, BusDriver::memory);
  c.cpu = BusDrive{true, 0x02};
  EXPECT_EQ(arbitrate(c, 0).driver, BusDriver::cpu);
  c.interrupt = BusDrive{true, 0x01};
  auto v = arbitrate(c, 0);
  EXPECT_EQ(v.driver, BusDriver::interrupt);
  EXPECT_EQ(v.value, 0x01);
}

TEST(Arbitration, InterruptOverridesMemory) {
  BusCandidates c;
  c.memory = BusDrive{true, 0x44};
  c.interrupt = BusDrive{true, 0x0d};
  auto v = arbitrate(c, 0);
  EXPECT_EQ(v.driver, BusDriver::interrupt);
  EXPECT_EQ(v.value, 0x0d);
}

TEST(AddressLatch, MemoryCycle) {
  AddressLatch latch;
  latch.update(State::T1, 0x34);
  latch.update(State::T2, 0x92);
  latch.update(State::T3, 0xff);
  EXPECT_EQ(latch.type, CycleType::PCW);
  EXPECT_EQ(latch.address(), 0x1234);
  EXPECT_FALSE(latch.acknowledge);
}

TEST(AddressLatch, AcknowledgeCycle) {
  AddressLatch latch;
  latch.update(State::T1I, 0x59);
  latch.update(State::T2, 0x00);
  EXPECT_TRUE(latch.acknowledge);
  EXPECT_EQ(latch.type, CycleType::PCI);
  EXPECT_EQ(latch.address(), 0x0059);
  latch.update(State::T1, 0x5a);
  EXPECT_FALSE(latch.acknowledge);
}

TEST(AddressLatch, PortNumber) {
  AddressLatch latch;
  latch.update(State::T1, 0x99);
  latch.update(State::T2, 0xd1); // OUT 8
  EXPECT_EQ(latch.type, CycleType::PCC);
  EXPECT_EQ(latch.port(), 8);
  latch.update(State::T2, 0xc7); // IN 3
  EXPECT_EQ(latch.port(), 3);
}
