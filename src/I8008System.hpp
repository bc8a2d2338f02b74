// I8008System.hpp
// I8008 board: CPU, memory, I/O ports and interrupt device

// Copyright (c) 2026 The B8008 Team. All rights reserved.
// This file is part of B8008 and is made available under
// the terms of the BSD license (see the COPYING file).

#ifndef I8008System_hpp
#define I8008System_hpp

#include "I8008.hpp"
#include "I8008Bus.hpp"
#include "I8008Ports.hpp"
#include <nlohmann/json.hpp>

#include <bitset>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <vector>

namespace b8008 {

enum class Error : int { success, programTooLarge, addressOutOfRange, invalidState };

char const* errorName(Error e);

// -----------------------------------------------------------------
// MARK: - Board state
// -----------------------------------------------------------------

struct BreakPoint {
  std::uint16_t address;
  bool persistent;
  bool temporary;
};

/// One line of the bus trace.
struct BusTraceEntry {
  std::size_t tick;
  State state;
  bool sync;
  CycleType cycleType;
  std::uint8_t bus;
  BusDriver driver;
};

/// The external interrupting device. It raises INT and supplies the
/// instruction jammed on the bus at T3 of the acknowledge cycle.
/// After an acknowledge, INT is held low for at least one clock before
/// the next request is raised, so that the CPU sees a new edge. A
/// request made meanwhile waits in the queue.
struct InterruptDevice {
  bool line{};
  std::uint8_t opcode{};   /// Opcode of the raised request.
  std::uint8_t jammed{};   /// Opcode being answered, latched at T1I.
  bool queued{};
  std::uint8_t queuedOpcode{};
  bool armed{true}; /// The CPU clocked INT low since the last acknowledge.

  bool operator==(InterruptDevice const& s) const {
    return line == s.line && opcode == s.opcode && jammed == s.jammed && queued == s.queued &&
           queuedOpcode == s.queuedOpcode && armed == s.armed;
  }

  /// Raise INT with the queued request, if the line may go high.
  void raise() {
    if (queued && armed && !line) {
      opcode = queuedOpcode;
      line = true;
      queued = false;
    }
  }
};

struct SystemState {
  static constexpr std::size_t memorySize = 0x4000;

  // Lifecycle.
  SystemState();
  SystemState(std::shared_ptr<I8008State> cpu, std::shared_ptr<I8008PortsState> ports);
  virtual ~SystemState() = default;

  // Inspect.
  bool operator==(SystemState const&) const;

  // Data.
  std::shared_ptr<I8008State> cpu;
  std::shared_ptr<I8008PortsState> ports;
  std::vector<std::uint8_t> memory;
  AddressLatch latch;
  InterruptDevice interruptDevice;
  std::uint8_t bus{};
  BusDriver driver{BusDriver::none};
  bool readyLine{true};
  std::size_t numTicks{};
};

void to_json(nlohmann::json& j, SystemState const& state);
void from_json(nlohmann::json const& j, SystemState& state);

// -----------------------------------------------------------------
// MARK: - Board
// -----------------------------------------------------------------

class System : public SystemState {
public:
  struct StoppingReason : std::bitset<32> {
    enum { halted = 0, breakpoint, numCyclesReached };
  };

  // Lifecycle.
  System();
  ~System();
  void reset();

  // Access the components.
  I8008* getCpu() const { return static_cast<I8008*>(cpu.get()); }
  I8008Ports* getPorts() const { return static_cast<I8008Ports*>(ports.get()); }

  // Manipulate the state.
  Error loadState(SystemState const& state);
  std::shared_ptr<SystemState> saveState() const;
  std::shared_ptr<SystemState> makeState() const;

  // Memory.
  Error loadProgram(std::vector<std::uint8_t> const& bytes, std::uint16_t origin = 0);
  Error peek(std::uint16_t address, std::uint8_t& value) const;
  Error poke(std::uint16_t address, std::uint8_t value);

  // Pins and devices.
  void requestInterrupt(std::uint8_t opcode);
  void requestRestart(int vector);
  bool getInterruptLine() const;
  bool getInterruptQueued() const;
  void setReady(bool ready);
  bool getReady() const;
  void setInput(int port, std::uint8_t value);
  std::uint8_t getOutput(int port) const;

  // Debug.
  std::map<std::uint16_t, BreakPoint> const& getBreakPoints() const;
  void setBreakPoint(std::uint16_t address, bool temporary = false);
  void clearBreakPoint(std::uint16_t address, bool temporary = false);
  void setBreakPointOnNextInstruction();
  void clearBreakPointOnNextInstruction();
  void setTraceEnabled(bool x);
  bool getTraceEnabled() const;
  std::vector<BusTraceEntry> const& getTrace() const;
  void clearTrace();

  // Run the simulation.
  StoppingReason cycle(std::size_t& maxNumCycles);
  void tick();
  std::size_t getTickNumber() const;
  void setVerbosity(int verbosity);
  int getVerbosity() const;

protected:
  BusCandidates candidates(State s) const;

  // Transient.
  std::map<std::uint16_t, BreakPoint> breakPoints;
  bool breakOnNextInstruction;
  bool traceEnabled;
  std::vector<BusTraceEntry> trace;
  int verbosity;
};

} // namespace b8008

std::ostream& operator<<(std::ostream& os, b8008::Error e);
std::ostream& operator<<(std::ostream& os, b8008::BusTraceEntry const& e);

#endif /* I8008System_hpp */
