// I8008Interrupt.hpp
// I8008 interrupt synchronizer and request latch

// Copyright (c) 2026 The B8008 Team. All rights reserved.
// This file is part of B8008 and is made available under
// the terms of the BSD license (see the COPYING file).

#ifndef I8008Interrupt_hpp
#define I8008Interrupt_hpp

namespace b8008 {

/// The INT line goes through two flip-flops before it is used, so that a
/// request changing close to the clock edge cannot reach the sequencer
/// half-settled. A rising edge of the synchronized signal sets the latch;
/// the latch stays set until the acknowledge cycle starts, and a new
/// request needs a new edge.
struct InterruptSynchronizer {
  bool stage1{};
  bool stage2{};
  bool previous{};
  bool latch{};

  bool operator==(InterruptSynchronizer const& s) const {
    return stage1 == s.stage1 && stage2 == s.stage2 && previous == s.previous &&
           latch == s.latch;
  }

  /// Advance one clock with the raw line level.
  void clock(bool line) {
    previous = stage2;
    stage2 = stage1;
    stage1 = line;
    if (stage2 && !previous) {
      latch = true;
    }
  }

  /// Called on entry to T1I.
  void acknowledge() {
    latch = false;
  }

  bool pending() const {
    return latch;
  }
};

} // namespace b8008

#endif /* I8008Interrupt_hpp */
