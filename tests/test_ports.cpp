// test_ports.cpp
// I8008 board I/O ports tests

// Copyright (c) 2026 The B8008 Team. All rights reserved.
// This file is part of B8008 and is made available under
// the terms of the BSD license (see the COPYING file).

#include "I8008Ports.hpp"
#include <gtest/gtest.h>

using namespace b8008;

TEST(Ports, InputsAreHostDriven) {
  I8008Ports p;
  p.setInput(3, 0x5a);
  EXPECT_EQ(p.read(3), 0x5a);
  EXPECT_EQ(p.getInput(3), 0x5a);
  EXPECT_EQ(p.read(0), 0x00);
  // Out of range.
  p.setInput(8, 0x11);
  EXPECT_EQ(p.getInput(8), 0x00);
  EXPECT_EQ(p.read(8), 0xff);
}

TEST(Ports, OutputsAreLatchedAndLogged) {
  I8008Ports p;
  EXPECT_TRUE(p.write(8, 0x99, 10));
  EXPECT_TRUE(p.write(31, 0x01, 20));
  EXPECT_TRUE(p.write(8, 0x42, 30));
  EXPECT_EQ(p.getOutput(8), 0x42);
  EXPECT_EQ(p.getOutput(31), 0x01);
  ASSERT_EQ(p.getWriteLog().size(), 3u);
  EXPECT_EQ(p.getWriteLog()[0], (PortWrite{8, 0x99, 10}));
  EXPECT_EQ(p.getWriteLog()[2], (PortWrite{8, 0x42, 30}));
}

TEST(Ports, InputPortsCannotBeWritten) {
  I8008Ports p;
  EXPECT_FALSE(p.write(7, 0x99, 0));
  EXPECT_FALSE(p.write(32, 0x99, 0));
  EXPECT_TRUE(p.getWriteLog().empty());
}

TEST(Ports, ResetClearsEverything) {
  I8008Ports p;
  p.setInput(1, 0x10);
  p.write(9, 0x20, 0);
  p.reset();
  EXPECT_EQ(p.getInput(1), 0);
  EXPECT_EQ(p.getOutput(9), 0);
  EXPECT_TRUE(p.getWriteLog().empty());
}

TEST(Ports, JsonRoundTrip) {
  I8008Ports p;
  p.setInput(2, 0x22);
  p.write(12, 0x34, 99);
  nlohmann::json j = static_cast<I8008PortsState const&>(p);
  auto restored = j.get<I8008PortsState>();
  EXPECT_TRUE(restored == p);
}
