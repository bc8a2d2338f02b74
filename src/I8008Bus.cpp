// I8008Bus.cpp
// I8008 multiplexed bus: drivers, arbitration and address latch

// Copyright (c) 2026 The B8008 Team. All rights reserved.
// This file is part of B8008 and is made available under
// the terms of the BSD license (see the COPYING file).

#include "I8008Bus.hpp"

using namespace std;
using namespace b8008;
using json = nlohmann::json;

// -------------------------------------------------------------------
// MARK: - Arbitration
// -------------------------------------------------------------------

BusValue b8008::arbitrate(BusCandidates const& candidates, uint8_t held) {
  if (candidates.interrupt.enabled) {
    return BusValue{BusDriver::interrupt, candidates.interrupt.value};
  }
  if (candidates.cpu.enabled) {
    return BusValue{BusDriver::cpu, candidates.cpu.value};
  }
  if (candidates.memory.enabled) {
    return BusValue{BusDriver::memory, candidates.memory.value};
  }
  if (candidates.io.enabled) {
    return BusValue{BusDriver::io, candidates.io.value};
  }
  return BusValue{BusDriver::none, held};
}

char const* b8008::busDriverName(BusDriver d) {
  switch (d) {
  case BusDriver::none: return "none";
  case BusDriver::interrupt: return "interrupt";
  case BusDriver::cpu: return "cpu";
  case BusDriver::memory: return "memory";
  case BusDriver::io: return "io";
  }
  return "?";
}

ostream& operator<<(ostream& os, BusDriver d) {
  return os << busDriverName(d);
}

// -------------------------------------------------------------------
// MARK: - Address latch
// -------------------------------------------------------------------

void AddressLatch::update(State state, uint8_t bus) {
  switch (state) {
  case State::T1:
  case State::T1I:
    low = bus;
    acknowledge = (state == State::T1I);
    break;
  case State::T2:
    type = static_cast<CycleType>(bus >> 6);
    high = bus & 0x3f;
    break;
  default: break;
  }
}

void b8008::to_json(json& j, AddressLatch const& latch) {
#undef jput
#define jput(x) j[#x] = latch.x
  jput(low);
  jput(high);
  jput(acknowledge);
  j["type"] = static_cast<int>(latch.type);
}

void b8008::from_json(json const& j, AddressLatch& latch) {
#undef jget
#define jget(x) latch.x = j.at(#x)
  jget(low);
  jget(high);
  jget(acknowledge);
  latch.type = static_cast<CycleType>(j.at("type").get<int>() & 0x03);
}
