// I8008Bus.hpp
// I8008 multiplexed bus: drivers, arbitration and address latch

// Copyright (c) 2026 The B8008 Team. All rights reserved.
// This file is part of B8008 and is made available under
// the terms of the BSD license (see the COPYING file).

#ifndef I8008Bus_hpp
#define I8008Bus_hpp

#include "I8008Timing.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <iostream>

namespace b8008 {

/// What a single device offers to put on the data bus in a state.
struct BusDrive {
  bool enabled;
  std::uint8_t value;
};

/// Who drove the bus. The order of the enumerators is not the priority.
enum class BusDriver : int { none, interrupt, cpu, memory, io };

/// The candidate drivers for one state.
struct BusCandidates {
  BusDrive interrupt{false, 0};
  BusDrive cpu{false, 0};
  BusDrive memory{false, 0};
  BusDrive io{false, 0};
};

struct BusValue {
  BusDriver driver;
  std::uint8_t value;
};

/// Pick the value of the bus. Priority is interrupt device, then CPU,
/// then memory, then I/O. With no driver the bus keeps `held`.
BusValue arbitrate(BusCandidates const& candidates, std::uint8_t held);

char const* busDriverName(BusDriver d);

/// External latch that demultiplexes the address, as on an 8008 board.
/// The low byte is captured at T1 (or T1I), the cycle type and the high
/// six bits at T2.
struct AddressLatch {
  std::uint8_t low{};
  std::uint8_t high{};
  CycleType type{CycleType::PCI};
  bool acknowledge{}; /// The cycle started with T1I.

  bool operator==(AddressLatch const& s) const {
    return low == s.low && high == s.high && type == s.type && acknowledge == s.acknowledge;
  }

  void update(State state, std::uint8_t bus);

  /// Memory address of a PCI, PCR or PCW cycle.
  std::uint16_t address() const {
    return static_cast<std::uint16_t>(((high & 0x3f) << 8) | low);
  }

  /// Port number of a PCC cycle, that is bus[5:1] at T2.
  int port() const {
    return (high >> 1) & 0x1f;
  }
};

void to_json(nlohmann::json& j, AddressLatch const& latch);
void from_json(nlohmann::json const& j, AddressLatch& latch);

} // namespace b8008

std::ostream& operator<<(std::ostream& os, b8008::BusDriver d);

#endif /* I8008Bus_hpp */
