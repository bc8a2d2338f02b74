//  I8008Ports.cpp
//  I8008 board input and output ports

// Copyright (c) 2026 The B8008 Team. All rights reserved.
// This file is part of B8008 and is made available under
// the terms of the BSD license (see the COPYING file).

#include "I8008Ports.hpp"
#include <algorithm>
#include <iomanip>

using namespace std;
using namespace b8008;
using json = nlohmann::json;

constexpr int I8008PortsState::numInputs;
constexpr int I8008PortsState::numOutputs;
constexpr int I8008PortsState::numPorts;

#define cmp(x) (x == s.x)
bool I8008PortsState::operator==(I8008PortsState const& s) const {
  return cmp(inputs) && cmp(outputs) && cmp(writeLog);
}
#undef cmp

I8008Ports::I8008Ports() {
  verbose = false;
  reset();
}

void I8008Ports::reset() {
  fill(begin(inputs), end(inputs), 0);
  fill(begin(outputs), end(outputs), 0);
  writeLog.clear();
}

/// The byte an input port places on the bus. Output ports read as 0xff,
/// as nothing drives the bus for them.
uint8_t I8008Ports::read(int port) const {
  if (!isInput(port)) {
    return 0xff;
  }
  return inputs[port];
}

/// Latch `value` into an output port. Returns false if `port` is not an
/// output port.
bool I8008Ports::write(int port, uint8_t value, size_t tick) {
  if (port < numInputs || port >= numPorts) {
    return false;
  }
  outputs[port - numInputs] = value;
  writeLog.push_back(PortWrite{port, value, tick});
  if (verbose) {
    cout << "I8008Ports: OUT " << dec << port << " = " << hex << setfill('0') << setw(2) << (int)value << "h @"
         << dec << tick << endl;
  }
  return true;
}

void I8008Ports::setInput(int port, uint8_t value) {
  if (isInput(port)) {
    inputs[port] = value;
  }
}

uint8_t I8008Ports::getInput(int port) const {
  return isInput(port) ? inputs[port] : 0;
}

uint8_t I8008Ports::getOutput(int port) const {
  if (port < numInputs || port >= numPorts) {
    return 0;
  }
  return outputs[port - numInputs];
}

void b8008::to_json(json& j, I8008PortsState const& state) {
#undef jput
#define jput(x) j[#x] = state.x
  jput(inputs);
  jput(outputs);
  json log = json::array();
  for (auto const& w : state.writeLog) {
    log.push_back({{"port", w.port}, {"value", w.value}, {"tick", w.tick}});
  }
  j["writeLog"] = log;
}

/// Throws `nlohmann::json::exception` on parsing errors.
void b8008::from_json(json const& j, I8008PortsState& state) {
#undef jget
#define jget(m) state.m = j.at(#m).get<decltype(state.m)>()
  jget(inputs);
  jget(outputs);
  state.writeLog.clear();
  for (auto const& w : j.at("writeLog")) {
    state.writeLog.push_back(
        PortWrite{w.at("port").get<int>(), w.at("value").get<uint8_t>(), w.at("tick").get<size_t>()});
  }
}
