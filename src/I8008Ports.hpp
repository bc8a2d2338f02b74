//  I8008Ports.hpp
//  I8008 board input and output ports

// Copyright (c) 2026 The B8008 Team. All rights reserved.
// This file is part of B8008 and is made available under
// the terms of the BSD license (see the COPYING file).

#ifndef I8008Ports_hpp
#define I8008Ports_hpp

#include <nlohmann/json.hpp>
#include <array>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <vector>

namespace b8008 {

/// A byte latched by an OUT instruction.
struct PortWrite {
  int port;
  std::uint8_t value;
  std::size_t tick; /// Board tick of the T3 state of the I/O cycle.

  bool operator==(PortWrite const& s) const {
    return port == s.port && value == s.value && tick == s.tick;
  }
};

/// I/O ports state. The 8008 addresses 32 ports: 0-7 are inputs, read
/// by INP, and 8-31 are outputs, written by OUT.
struct I8008PortsState {
public:
  static constexpr int numInputs = 8;
  static constexpr int numOutputs = 24;
  static constexpr int numPorts = numInputs + numOutputs;

  virtual ~I8008PortsState() = default;
  bool operator==(I8008PortsState const&) const;
  static bool isInput(int port);

  // Ports.
  std::array<std::uint8_t, numInputs> inputs{};
  std::array<std::uint8_t, numOutputs> outputs{};

  // Every OUT, in order.
  std::vector<PortWrite> writeLog;
};

void to_json(nlohmann::json& j, I8008PortsState const& state);
void from_json(nlohmann::json const& j, I8008PortsState& state);

/// I/O ports device.
class I8008Ports : public I8008PortsState {
public:
  // Lifecycle.
  I8008Ports();
  I8008Ports& operator=(I8008PortsState const& s);
  virtual ~I8008Ports() = default;

  // Operation.
  void reset();
  std::uint8_t read(int port) const;
  bool write(int port, std::uint8_t value, std::size_t tick);
  void setInput(int port, std::uint8_t value);
  std::uint8_t getInput(int port) const;
  std::uint8_t getOutput(int port) const;
  std::vector<PortWrite> const& getWriteLog() const;
  void clearWriteLog();
  bool getVerbose() const;
  void setVerbose(bool x);

protected:
  // Transient.
  bool verbose;
};

// ---------------------------------------------------------------------------
// Inline members
// ---------------------------------------------------------------------------

inline bool I8008PortsState::isInput(int port) {
  return 0 <= port && port < numInputs;
}

// Only copy the ports state, not the class transient state.
inline I8008Ports& I8008Ports::operator=(I8008PortsState const& s) {
  I8008PortsState::operator=(s);
  return *this;
}

inline std::vector<PortWrite> const& I8008Ports::getWriteLog() const {
  return writeLog;
}

inline void I8008Ports::clearWriteLog() {
  writeLog.clear();
}

inline bool I8008Ports::getVerbose() const {
  return verbose;
}

inline void I8008Ports::setVerbose(bool x) {
  verbose = x;
}

} // namespace b8008

#endif /* I8008Ports_hpp */
