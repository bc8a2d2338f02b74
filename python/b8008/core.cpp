//  core.cpp
//  B8008 emulator Python 3 binding.

// Copyright (c) 2026 The B8008 Team. All rights reserved.
// This file is part of B8008 and is made available under
// the terms of the BSD license (see the COPYING file).

#include <I8008.hpp>
#include <I8008Disassembler.hpp>
#include <I8008System.hpp>
#include <cstdint>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <sstream>
#include <string>

namespace py = pybind11;
using namespace b8008;
using namespace std;
using namespace pybind11::literals;
using json = nlohmann::json;

// ------------------------------------------------------------------
// Helpers
// ------------------------------------------------------------------

template <typename T> string to_json(const T& state) {
  json j;
  to_json(j, state);
  return j.dump();
}

template <typename T> void from_json(T& state, const string& str) {
  auto j = json::parse(str);
  from_json(j, state);
}

template <typename T> string to_string(const T& x) {
  std::ostringstream oss;
  oss << x;
  return oss.str();
}

struct InvalidStateException : public std::exception {
  virtual const char* what() const noexcept override {
    return "Invalid system state.";
  }
};

/// Turn an error code into a Python exception.
static void check(Error error) {
  switch (error) {
  case Error::success: break;
  case Error::invalidState: throw InvalidStateException();
  case Error::addressOutOfRange: throw py::index_error(errorName(error));
  default: throw std::runtime_error(errorName(error));
  }
}

static vector<uint8_t> bytesFromBuffer(py::buffer b) {
  auto info = b.request();
  if (info.itemsize != 1 || info.ndim != 1 || info.strides[0] != 1) {
    throw std::runtime_error("Incompatible format: expected a 1D linear buffer of bytes.");
  }
  auto begin = static_cast<uint8_t*>(info.ptr);
  auto end = begin + info.shape[0];
  return vector<uint8_t>(begin, end);
}

// ------------------------------------------------------------------
// Enumerations
// ------------------------------------------------------------------

enum class SystemStoppingReason {
  halted = System::StoppingReason::halted,
  breakpoint = System::StoppingReason::breakpoint,
  numCyclesReached = System::StoppingReason::numCyclesReached,
};

vector<SystemStoppingReason> to_vector(System::StoppingReason const& r) {
  auto r_ = vector<SystemStoppingReason>();
  using in = System::StoppingReason;
  using out = SystemStoppingReason;
  if (r[in::halted]) r_.push_back(out::halted);
  if (r[in::breakpoint]) r_.push_back(out::breakpoint);
  if (r[in::numCyclesReached]) r_.push_back(out::numCyclesReached);
  return r_;
}

// ------------------------------------------------------------------
// MARK: - Definitions
// ------------------------------------------------------------------

PYBIND11_MODULE(core, m) {
  m.doc() = "B8008 emulator";

  static py::exception<InvalidStateException> exc(m, "InvalidStateException");

  py::enum_<State>(m, "State")
      .value("WAIT", State::WAIT)
      .value("T3", State::T3)
      .value("T1", State::T1)
      .value("STOPPED", State::STOPPED)
      .value("T2", State::T2)
      .value("T5", State::T5)
      .value("T1I", State::T1I)
      .value("T4", State::T4);

  py::enum_<CycleType>(m, "CycleType")
      .value("PCI", CycleType::PCI)
      .value("PCR", CycleType::PCR)
      .value("PCW", CycleType::PCW)
      .value("PCC", CycleType::PCC);

  py::enum_<Reg>(m, "Reg")
      .value("A", Reg::A)
      .value("B", Reg::B)
      .value("C", Reg::C)
      .value("D", Reg::D)
      .value("E", Reg::E)
      .value("H", Reg::H)
      .value("L", Reg::L)
      .value("M", Reg::M);

  py::enum_<AluOp>(m, "AluOp")
      .value("ADD", AluOp::ADD)
      .value("ADC", AluOp::ADC)
      .value("SUB", AluOp::SUB)
      .value("SBB", AluOp::SBB)
      .value("AND", AluOp::AND)
      .value("XOR", AluOp::XOR)
      .value("OR", AluOp::OR)
      .value("CMP", AluOp::CMP);

  py::enum_<RotateOp>(m, "RotateOp")
      .value("RLC", RotateOp::RLC)
      .value("RRC", RotateOp::RRC)
      .value("RAL", RotateOp::RAL)
      .value("RAR", RotateOp::RAR);

  py::enum_<BusDriver>(m, "BusDriver")
      .value("NONE", BusDriver::none)
      .value("INTERRUPT", BusDriver::interrupt)
      .value("CPU", BusDriver::cpu)
      .value("MEMORY", BusDriver::memory)
      .value("IO", BusDriver::io);

  // ----------------------------------------------------------------
  // MARK: ALU
  // ----------------------------------------------------------------

  // Flags are passed as an int: bit 0 carry, 1 zero, 2 sign, 3 parity.
  m.def("alu",
        [](AluOp op, uint8_t a, uint8_t b, int flags) {
          auto r = alu(op, a, b, Flags(flags));
          return py::make_tuple(r.value, static_cast<int>(static_cast<uint8_t>(r.flags)), r.writeBack);
        },
        "op"_a, "a"_a, "b"_a, "flags"_a = 0);
  m.def("rotate",
        [](RotateOp op, uint8_t a, int flags) {
          auto r = rotate(op, a, Flags(flags));
          return py::make_tuple(r.value, static_cast<int>(static_cast<uint8_t>(r.flags)));
        },
        "op"_a, "a"_a, "flags"_a = 0);

  // ----------------------------------------------------------------
  // MARK: I8008
  // ----------------------------------------------------------------

  py::class_<I8008State, shared_ptr<I8008State>> i8008state(m, "I8008State");
  i8008state.def(py::init<>())
      .def_property_readonly("state", &I8008State::getState)
      .def_property_readonly("state_code", &I8008State::getStateCode)
      .def_property_readonly("sync", &I8008State::getSync)
      .def_property_readonly("cycle_type", &I8008State::getCycleType)
      .def_property_readonly("data_bus", &I8008State::getDataBus)
      .def_property_readonly("ready_line", &I8008State::getReadyLine)
      .def_property_readonly("interrupt_line", &I8008State::getInterruptLine)
      .def("get_register", &I8008State::getRegister)
      .def("set_register", &I8008State::setRegister)
      .def_property_readonly("A", &I8008State::getA)
      .def_property_readonly("B", &I8008State::getB)
      .def_property_readonly("C", &I8008State::getC)
      .def_property_readonly("D", &I8008State::getD)
      .def_property_readonly("E", &I8008State::getE)
      .def_property_readonly("H", &I8008State::getH)
      .def_property_readonly("L", &I8008State::getL)
      .def_property_readonly("HL", &I8008State::getHL)
      .def_property(
          "flags", [](const I8008State& self) { return static_cast<int>(static_cast<uint8_t>(self.getFlags())); },
          [](I8008State& self, int flags) { self.setFlags(Flags(flags & 0x0f)); })
      .def_property("PC", &I8008State::getPC, &I8008State::setPC)
      .def_property_readonly("stack",
                             [](const I8008State& self) {
                               auto const& s = self.getStack();
                               return py::make_tuple(s.slots, s.pointer);
                             })
      .def_property("IR", &I8008State::getIR, &I8008State::setIR)
      .def_property_readonly("reg_a", &I8008State::getRegA)
      .def_property_readonly("reg_b", &I8008State::getRegB)
      .def_property_readonly("machine_cycle", &I8008State::getMachineCycle)
      .def_property_readonly("acknowledging", &I8008State::getAcknowledging)
      .def_property_readonly("interrupt_pending", &I8008State::getInterruptPending)
      .def_property_readonly("stopped", &I8008State::isStopped)
      .def_property("num_cycles", &I8008State::getNumCycles, &I8008State::setNumCycles)
      .def("to_json", [](const I8008State& self) -> string { return to_json(self); })
      .def("from_json", [](I8008State& self, string const& str) { from_json(self, str); });

  py::class_<I8008, shared_ptr<I8008>> i8008(m, "I8008", i8008state);
  i8008.def(py::init<>())
      .def("load_state", [](I8008& self, const I8008State& state) { self = state; })
      .def_property("IR", &I8008State::getIR, &I8008::setIR)
      .def("from_json",
           [](I8008& self, string const& str) {
             I8008State state;
             from_json(state, str);
             self = state;
           })
      .def("reset", &I8008::reset)
      .def("cycle", &I8008::cycle, "bus"_a, "ready"_a = true, "interrupt_request"_a = false)
      .def("get_bus_drive",
           [](const I8008& self) {
             auto d = self.getBusDrive();
             return py::make_tuple(d.enabled, d.value);
           })
      .def_property_readonly("cycle_address", &I8008::getCycleAddress)
      .def_property_readonly("decoded_instruction", &I8008::getDecodedInstruction)
      .def_property("verbose", &I8008::getVerbose, &I8008::setVerbose)
      .def_static("decode", static_cast<InstructionTraits const& (*)(std::uint8_t)>(&decode))
      .def_static("decode_bytes", static_cast<Instruction (*)(std::array<std::uint8_t, 3> const&)>(&decode))
      .def_static("disassemble",
                  [](py::buffer b, std::uint16_t origin) {
                    auto bytes = bytesFromBuffer(b);
                    return disassemble(bytes, origin);
                  },
                  "bytes"_a, "origin"_a = 0);

  py::enum_<InstructionType>(i8008, "InstructionType")
      .value("HLT", InstructionType::HLT)
      .value("MOV", InstructionType::MOV)
      .value("MVI", InstructionType::MVI)
      .value("INR", InstructionType::INR)
      .value("DCR", InstructionType::DCR)
      .value("ALU", InstructionType::ALU)
      .value("ALI", InstructionType::ALI)
      .value("ROT", InstructionType::ROT)
      .value("JMP", InstructionType::JMP)
      .value("CAL", InstructionType::CAL)
      .value("RET", InstructionType::RET)
      .value("RST", InstructionType::RST)
      .value("INP", InstructionType::INP)
      .value("OUT", InstructionType::OUT)
      .value("UNDEFINED", InstructionType::UNDEFINED);

  py::enum_<AccessType>(i8008, "AccessType")
      .value("NONE", AccessType::none)
      .value("IMMEDIATE", AccessType::immediate)
      .value("READ", AccessType::read)
      .value("WRITE", AccessType::write)
      .value("BRANCH", AccessType::branch)
      .value("STACK", AccessType::stack)
      .value("IO", AccessType::io);

  py::class_<InstructionTraits> is(i8008, "InstructionTraits");
  is.def_readonly("opcode", &InstructionTraits::opcode)
      .def_readonly("length", &InstructionTraits::length)
      .def_readonly("mnemonic", &InstructionTraits::mnemonic)
      .def_readonly("instruction_type", &InstructionTraits::instructionType)
      .def_readonly("access_type", &InstructionTraits::accessType)
      .def_readonly("dst", &InstructionTraits::dst)
      .def_readonly("src", &InstructionTraits::src)
      .def_readonly("alu_op", &InstructionTraits::aluOp)
      .def_readonly("rotate_op", &InstructionTraits::rotateOp)
      .def_readonly("vector", &InstructionTraits::vector)
      .def_readonly("port", &InstructionTraits::port)
      .def_readonly("undefined", &InstructionTraits::undefined)
      .def_property_readonly("conditional", [](const InstructionTraits& self) { return self.condition.conditional; })
      .def("__str__", [](const InstructionTraits& self) { return to_string(self); });

  py::class_<Instruction>(i8008, "Instruction", is)
      .def_readonly("operand", &Instruction::operand)
      .def("__str__", [](const Instruction& self) { return to_string(self); });

  // ----------------------------------------------------------------
  // MARK: Ports
  // ----------------------------------------------------------------

  py::class_<PortWrite>(m, "PortWrite")
      .def_readonly("port", &PortWrite::port)
      .def_readonly("value", &PortWrite::value)
      .def_readonly("tick", &PortWrite::tick);

  py::class_<I8008PortsState, shared_ptr<I8008PortsState>> portsState(m, "I8008PortsState");
  portsState.def(py::init<>())
      .def_readwrite("inputs", &I8008PortsState::inputs)
      .def_readwrite("outputs", &I8008PortsState::outputs)
      .def_readonly("write_log", &I8008PortsState::writeLog)
      .def_static("is_input", &I8008PortsState::isInput);

  py::class_<I8008Ports, shared_ptr<I8008Ports>> ports(m, "I8008Ports", portsState);
  ports.def(py::init<>())
      .def("load_state", [](I8008Ports& self, const I8008PortsState& state) { self = state; })
      .def("reset", &I8008Ports::reset)
      .def("set_input", &I8008Ports::setInput)
      .def("get_input", &I8008Ports::getInput)
      .def("get_output", &I8008Ports::getOutput)
      .def("clear_write_log", &I8008Ports::clearWriteLog)
      .def_property("verbose", &I8008Ports::getVerbose, &I8008Ports::setVerbose);

  // ----------------------------------------------------------------
  // MARK: System
  // ----------------------------------------------------------------

  py::class_<BusTraceEntry>(m, "BusTraceEntry")
      .def_readonly("tick", &BusTraceEntry::tick)
      .def_readonly("state", &BusTraceEntry::state)
      .def_readonly("sync", &BusTraceEntry::sync)
      .def_readonly("cycle_type", &BusTraceEntry::cycleType)
      .def_readonly("bus", &BusTraceEntry::bus)
      .def_readonly("driver", &BusTraceEntry::driver)
      .def("__str__", [](const BusTraceEntry& self) { return to_string(self); });

  py::class_<SystemState, shared_ptr<SystemState>>(m, "SystemState")
      .def(py::init<>())
      .def("to_json", [](const SystemState& self) -> string { return to_json(self); })
      .def("from_json", [](SystemState& self, string const& str) { from_json(self, str); });

  py::class_<System, shared_ptr<System>> system(m, "System");
  system.def(py::init<>())
      .def("cycle",
           [](System& self, size_t max_num_cycles) {
             auto r = self.cycle(max_num_cycles);
             return py::make_tuple(to_vector(r), max_num_cycles);
           })
      .def("tick", &System::tick)
      .def_property_readonly("tick_number", &System::getTickNumber)
      .def("reset", &System::reset)
      .def("load_program",
           [](System& self, py::buffer b, std::uint16_t origin) { check(self.loadProgram(bytesFromBuffer(b), origin)); },
           "bytes"_a, "origin"_a = 0)
      .def("peek",
           [](const System& self, std::uint16_t address) {
             std::uint8_t value = 0;
             check(self.peek(address, value));
             return value;
           })
      .def("poke", [](System& self, std::uint16_t address, std::uint8_t value) { check(self.poke(address, value)); })
      .def("load_state", [](System& self, const SystemState& state) { check(self.loadState(state)); })
      .def("save_state", &System::saveState)
      .def("make_state", &System::makeState)
      .def("request_interrupt", &System::requestInterrupt)
      .def("request_restart", &System::requestRestart)
      .def_property_readonly("interrupt_line", &System::getInterruptLine)
      .def_property_readonly("interrupt_queued", &System::getInterruptQueued)
      .def_property("ready", &System::getReady, &System::setReady)
      .def("set_input", &System::setInput)
      .def("get_output", &System::getOutput)
      .def("set_breakpoint", &System::setBreakPoint, "address"_a, "temporary"_a = false)
      .def("clear_breakpoint", &System::clearBreakPoint, "address"_a, "temporary"_a = false)
      .def("set_breakpoint_on_next_instruction", &System::setBreakPointOnNextInstruction)
      .def("clear_breakpoint_on_next_instruction", &System::clearBreakPointOnNextInstruction)
      .def_property("trace_enabled", &System::getTraceEnabled, &System::setTraceEnabled)
      .def_property_readonly("trace", &System::getTrace)
      .def("clear_trace", &System::clearTrace)
      .def_property("verbosity", &System::getVerbosity, &System::setVerbosity)
      .def_property_readonly("cpu", &System::getCpu, py::return_value_policy::reference_internal)
      .def_property_readonly("ports", &System::getPorts, py::return_value_policy::reference_internal);

  py::enum_<SystemStoppingReason>(system, "StoppingReason")
      .value("HALTED", SystemStoppingReason::halted)
      .value("BREAKPOINT", SystemStoppingReason::breakpoint)
      .value("NUM_CYCLES_REACHED", SystemStoppingReason::numCyclesReached);
}
