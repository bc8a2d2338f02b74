// I8008Stack.hpp
// I8008 8-level address stack

// Copyright (c) 2026 The B8008 Team. All rights reserved.
// This file is part of B8008 and is made available under
// the terms of the BSD license (see the COPYING file).

#ifndef I8008Stack_hpp
#define I8008Stack_hpp

#include "I8008Registers.hpp"
#include <array>
#include <cstdint>

namespace b8008 {

/// Return-address stack: eight 14-bit slots and a 3-bit pointer.
/// There is no overflow detection; a ninth push overwrites the slot
/// of the oldest frame, as on the chip.
struct AddressStack {
  static constexpr int depth = 8;

  std::array<std::uint16_t, depth> slots{};
  std::uint8_t pointer{};

  bool operator==(AddressStack const& s) const {
    return slots == s.slots && pointer == s.pointer;
  }

  /// Store at the current slot, then advance the pointer.
  void push(std::uint16_t address) {
    slots[pointer] = address & addressMask;
    pointer = (pointer + 1) & (depth - 1);
  }

  /// Retreat the pointer, then read that slot.
  std::uint16_t pop() {
    pointer = (pointer + depth - 1) & (depth - 1);
    return slots[pointer];
  }

  std::uint16_t top() const {
    return slots[(pointer + depth - 1) & (depth - 1)];
  }
};

} // namespace b8008

#endif /* I8008Stack_hpp */
