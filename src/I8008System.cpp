// I8008System.cpp
// I8008 board: CPU, memory, I/O ports and interrupt device

// Copyright (c) 2026 The B8008 Team. All rights reserved.
// This file is part of B8008 and is made available under
// the terms of the BSD license (see the COPYING file).

#include "I8008System.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <memory>

using namespace std;
using namespace b8008;
using json = nlohmann::json;

constexpr size_t SystemState::memorySize;

char const* b8008::errorName(Error e) {
  switch (e) {
  case Error::success: return "success";
  case Error::programTooLarge: return "program too large";
  case Error::addressOutOfRange: return "address out of range";
  case Error::invalidState: return "invalid state";
  }
  return "?";
}

std::ostream& operator<<(std::ostream& os, Error e) {
  return os << errorName(e);
}

std::ostream& operator<<(std::ostream& os, BusTraceEntry const& e) {
  auto f = os.flags();
  auto l = os.fill();
  os << dec << e.tick << " " << static_cast<int>(e.state) << " " << (e.sync ? "S" : "-") << " " << e.cycleType << " "
     << hex << setfill('0') << setw(2) << (int)e.bus << " " << e.driver;
  os.fill(l);
  os.flags(f);
  return os;
}

// -------------------------------------------------------------------
// MARK: - Serlialize & deserialize state
// -------------------------------------------------------------------

void b8008::to_json(json& j, const SystemState& state) {
  j["version"] = "1.0";
  j["cpu"] = *state.cpu;
  j["ports"] = *state.ports;
  j["memory"] = state.memory;
  j["latch"] = state.latch;
  j["interruptDevice"] = {{"line", state.interruptDevice.line},
                           {"opcode", state.interruptDevice.opcode},
                           {"jammed", state.interruptDevice.jammed},
                           {"queued", state.interruptDevice.queued},
                           {"queuedOpcode", state.interruptDevice.queuedOpcode},
                           {"armed", state.interruptDevice.armed}};
  j["bus"] = state.bus;
  j["driver"] = static_cast<int>(state.driver);
  j["readyLine"] = state.readyLine;
  j["numTicks"] = state.numTicks;
}

/// Throws `nlohmann::json::exception` on parsing errors.
void b8008::from_json(const json& j, SystemState& state) {
  from_json(j.at("cpu"), *state.cpu);
  from_json(j.at("ports"), *state.ports);
  state.memory = j.at("memory").get<vector<uint8_t>>();
  state.memory.resize(SystemState::memorySize);
  from_json(j.at("latch"), state.latch);
  auto const& device = j.at("interruptDevice");
  state.interruptDevice.line = device.at("line").get<bool>();
  state.interruptDevice.opcode = device.at("opcode").get<uint8_t>();
  state.interruptDevice.jammed = device.at("jammed").get<uint8_t>();
  state.interruptDevice.queued = device.at("queued").get<bool>();
  state.interruptDevice.queuedOpcode = device.at("queuedOpcode").get<uint8_t>();
  state.interruptDevice.armed = device.at("armed").get<bool>();
  state.bus = j.at("bus").get<uint8_t>();
  auto driver = j.at("driver").get<int>();
  state.driver = (driver >= 0 && driver <= static_cast<int>(BusDriver::io)) ? static_cast<BusDriver>(driver)
                                                                              : BusDriver::none;
  state.readyLine = j.at("readyLine").get<bool>();
  state.numTicks = j.at("numTicks").get<size_t>();
}

// -------------------------------------------------------------------
// MARK: - SystemState
// -------------------------------------------------------------------

/// Create a new state using the specified component states.
SystemState::SystemState(std::shared_ptr<I8008State> cpu, std::shared_ptr<I8008PortsState> ports)
    : cpu(cpu), ports(ports), memory(memorySize, 0) {}

/// Create a new state instance.
SystemState::SystemState() : SystemState(make_shared<I8008State>(), make_shared<I8008PortsState>()) {}

// Helper.
template <class T, class U> static bool cmp(const std::shared_ptr<T>& a, const std::shared_ptr<U>& b) {
  if (a == b) return true;
  if (a && b) return *a == *b;
  return false;
}

/// Compare two states for value equality.
bool SystemState::operator==(SystemState const& s) const {
  return cmp(cpu, s.cpu) && cmp(ports, s.ports) && memory == s.memory && latch == s.latch &&
         interruptDevice == s.interruptDevice && bus == s.bus && driver == s.driver && readyLine == s.readyLine &&
         numTicks == s.numTicks;
}

// -------------------------------------------------------------------
// MARK: - Simulation
// -------------------------------------------------------------------

/// The devices that may drive the bus in state `s`, besides the CPU.
/// Memory answers at T3 of fetch and read cycles, an input port at T3
/// of an I/O cycle, and the interrupting device at T3 of an acknowledge
/// cycle, where it overrides memory.
BusCandidates System::candidates(State s) const {
  BusCandidates c;
  c.cpu = getCpu()->getBusDrive();
  if (s != State::T3) {
    return c;
  }
  switch (latch.type) {
  case CycleType::PCI:
    if (latch.acknowledge) {
      c.interrupt = BusDrive{true, interruptDevice.jammed};
    }
    c.memory = BusDrive{true, memory[latch.address()]};
    break;
  case CycleType::PCR: c.memory = BusDrive{true, memory[latch.address()]}; break;
  case CycleType::PCC:
    if (I8008PortsState::isInput(latch.port())) {
      c.io = BusDrive{true, getPorts()->read(latch.port())};
    }
    break;
  case CycleType::PCW: break;
  }
  return c;
}

/// Simulate one clock state of the board.
void System::tick() {
  auto _cpu = getCpu();
  auto _ports = getPorts();
  auto s = _cpu->getState();

  // Settle the bus and latch the address.
  auto value = arbitrate(candidates(s), bus);
  bus = value.value;
  driver = value.driver;
  latch.update(s, bus);

  if (traceEnabled) {
    trace.push_back(BusTraceEntry{numTicks, s, isCycleStart(s), _cpu->getCycleType(), bus, driver});
  }

  interruptDevice.raise();
  _cpu->cycle(bus, readyLine, interruptDevice.line);
  if (!interruptDevice.line) {
    interruptDevice.armed = true;
  }

  // Commit writes.
  if (s == State::T3) {
    if (latch.type == CycleType::PCW) {
      memory[latch.address()] = bus;
    } else if (latch.type == CycleType::PCC && !I8008PortsState::isInput(latch.port())) {
      // The byte sent at T1 is the accumulator.
      _ports->write(latch.port(), latch.low, numTicks);
    }
  }

  // The device withdraws its request once the CPU acknowledges it.
  if (s == State::T1I && interruptDevice.line) {
    interruptDevice.jammed = interruptDevice.opcode;
    interruptDevice.line = false;
    interruptDevice.armed = false;
  }

  numTicks++;
}

/// Run the simulation until `maxNumCycles` states have been executed,
/// the CPU enters STOPPED, or an instruction at a breakpoint is about to
/// be fetched, depending which events occur first. More than one of
/// these criteria can be met at the same time; the function returns all
/// reasons why it stopped.

System::StoppingReason System::cycle(size_t& maxNumCycles) {
  StoppingReason reason;
  auto _cpu = getCpu();

  // If no cycles should be simulated, make sure we stop immediately.
  reason.set(StoppingReason::numCyclesReached, maxNumCycles == 0);

  while (!reason.any()) {
    auto before = _cpu->getState();
    tick();
    maxNumCycles--;
    auto after = _cpu->getState();

    reason.set(StoppingReason::numCyclesReached, maxNumCycles == 0);

    if (after == State::STOPPED && before != State::STOPPED) {
      if (verbosity > 0) {
        cout << "System: CPU halted at " << hex << setfill('0') << setw(4) << _cpu->getPC() << dec << endl;
      }
      reason.set(StoppingReason::halted);
    }

    // T1 of machine cycle 0 starts the fetch of a new instruction, whose
    // address is the PC.
    if (after == State::T1 && _cpu->getMachineCycle() == 0) {
      auto pc = _cpu->getPC();
      if (breakOnNextInstruction) {
        reason.set(StoppingReason::breakpoint);
        breakOnNextInstruction = false;
      }
      if (breakPoints.find(pc) != breakPoints.end()) {
        // Clear the breakpoint if temporary.
        clearBreakPoint(pc, true);
        reason.set(StoppingReason::breakpoint);
      }
    }
  }
  return reason;
}

size_t System::getTickNumber() const {
  return numTicks;
}

// -------------------------------------------------------------------
// MARK: - Manipulate state
// -------------------------------------------------------------------

/// Create an unitialized state object.
shared_ptr<SystemState> System::makeState() const {
  return make_shared<SystemState>();
}

/// Make a *copy* of the system state.
shared_ptr<SystemState> System::saveState() const {
  auto s = make_shared<SystemState>(static_cast<SystemState const&>(*this));
  s->cpu = make_shared<I8008State>(*cpu);
  s->ports = make_shared<I8008PortsState>(*ports);
  return s;
}

/// Reset the system's state by copying the specified state.
Error System::loadState(const SystemState& s) {
  if (!s.cpu || !s.ports || s.memory.size() != memorySize) {
    return Error::invalidState;
  }
  *getCpu() = *s.cpu;
  *getPorts() = *s.ports;
  memory = s.memory;
  latch = s.latch;
  interruptDevice = s.interruptDevice;
  bus = s.bus;
  driver = s.driver;
  readyLine = s.readyLine;
  numTicks = s.numTicks;
  return Error::success;
}

/// Copy `bytes` into memory starting at `origin`.
Error System::loadProgram(vector<uint8_t> const& bytes, uint16_t origin) {
  if (origin >= memorySize) {
    return Error::addressOutOfRange;
  }
  if (bytes.size() > memorySize - origin) {
    return Error::programTooLarge;
  }
  copy(bytes.begin(), bytes.end(), memory.begin() + origin);
  return Error::success;
}

Error System::peek(uint16_t address, uint8_t& value) const {
  if (address >= memorySize) {
    return Error::addressOutOfRange;
  }
  value = memory[address];
  return Error::success;
}

Error System::poke(uint16_t address, uint8_t value) {
  if (address >= memorySize) {
    return Error::addressOutOfRange;
  }
  memory[address] = value;
  return Error::success;
}

// -------------------------------------------------------------------
// MARK: - Pins and devices
// -------------------------------------------------------------------

/// Raise INT. The device answers the acknowledge cycle with `opcode`.
/// If INT is still high, or has not yet been seen low since the last
/// acknowledge, the request is queued and raised by a later tick. A
/// newer request replaces a queued one.
void System::requestInterrupt(uint8_t opcode) {
  if (verbosity > 0) {
    cout << "System: interrupt request, opcode " << hex << setfill('0') << setw(2) << (int)opcode << "h" << dec
         << endl;
  }
  interruptDevice.queuedOpcode = opcode;
  interruptDevice.queued = true;
  interruptDevice.raise();
}

/// Raise INT and jam RST `vector`.
void System::requestRestart(int vector) {
  requestInterrupt(static_cast<uint8_t>(0x05 | ((vector & 0x07) << 3)));
}

bool System::getInterruptLine() const {
  return interruptDevice.line;
}

bool System::getInterruptQueued() const {
  return interruptDevice.queued;
}

void System::setReady(bool ready) {
  readyLine = ready;
}

bool System::getReady() const {
  return readyLine;
}

void System::setInput(int port, uint8_t value) {
  getPorts()->setInput(port, value);
}

uint8_t System::getOutput(int port) const {
  return getPorts()->getOutput(port);
}

/// Set the emulator verbosity level. The following levels are supported:
///
/// - 0: suppresses all messages.
/// - 1: shows board events, such as resets, interrupt requests and halts.
/// - 2: also shows the output port writes.
/// - 3: also shows the individual CPU states.

void System::setVerbosity(int verbosity) {
  this->verbosity = verbosity;
  getPorts()->setVerbose(verbosity >= 2);
  getCpu()->setVerbose(verbosity >= 3);
}

int System::getVerbosity() const {
  return verbosity;
}

// -------------------------------------------------------------------
// MARK: - Init, reset, cleanup
// -------------------------------------------------------------------

System::System() : SystemState(make_shared<I8008>(), make_shared<I8008Ports>()) {
  breakOnNextInstruction = false;
  traceEnabled = false;
  verbosity = 0;
  reset();
}

System::~System() {}

/// Power-on clear of the CPU and the devices. Memory is kept, so that a
/// program loaded before the reset survives it.
void System::reset() {
  if (verbosity > 0) {
    cout << "--------------------------------------------------------" << endl;
    cout << "System Reset" << endl;
    cout << "--------------------------------------------------------" << endl;
  }
  getCpu()->reset();
  getPorts()->reset();
  latch = AddressLatch{};
  interruptDevice = InterruptDevice{};
  bus = 0;
  driver = BusDriver::none;
  readyLine = true;
  numTicks = 0;
  trace.clear();
}

// -------------------------------------------------------------------
// MARK: - Debugger
// -------------------------------------------------------------------

map<uint16_t, BreakPoint> const& System::getBreakPoints() const {
  return breakPoints;
}

void System::setBreakPoint(uint16_t address, bool temporary) {
  if (breakPoints.find(address) == breakPoints.end()) {
    breakPoints[address] = BreakPoint{address, false, false};
  }
  auto& bp = breakPoints[address];
  if (!temporary) {
    bp.persistent = true;
  } else {
    bp.temporary = true;
  }
}

void System::clearBreakPoint(uint16_t address, bool temporary) {
  auto bpi = breakPoints.find(address);
  if (bpi != breakPoints.end()) {
    auto& bp = bpi->second;
    if (!temporary) {
      bp.persistent = false;
    } else {
      bp.temporary = false;
    }
    if (!bp.persistent && !bp.temporary) {
      // There are no more breakpoints at this address.
      breakPoints.erase(bpi);
    }
  }
}

void System::setBreakPointOnNextInstruction() {
  breakOnNextInstruction = true;
}

void System::clearBreakPointOnNextInstruction() {
  breakOnNextInstruction = false;
}

void System::setTraceEnabled(bool x) {
  traceEnabled = x;
}

bool System::getTraceEnabled() const {
  return traceEnabled;
}

vector<BusTraceEntry> const& System::getTrace() const {
  return trace;
}

void System::clearTrace() {
  trace.clear();
}
