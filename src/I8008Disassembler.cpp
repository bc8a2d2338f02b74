// I8008Disassembler.cpp

// Copyright (c) 2026 The B8008 Team. All rights reserved.
// This file is part of B8008 and is made available under
// the terms of the BSD license (see the COPYING file).

#include "I8008Disassembler.hpp"
#include <algorithm>
#include <array>
#include <iomanip>
#include <sstream>

using namespace std;
using namespace b8008;

I8008Disassembly b8008::disassemble(uint8_t const* begin, uint8_t const* end, uint16_t origin) {
  auto lines = I8008Disassembly();
  for (auto curr = begin; curr < end;) {
    array<uint8_t, 3> threeBytes{*curr, *min(curr + 1, end - 1), *min(curr + 2, end - 1)};

    Instruction ins = decode(threeBytes);
    auto address = static_cast<uint16_t>((origin + (curr - begin)) & addressMask);

    if (end - curr >= ins.length) {
      lines.push_back(make_pair(address, ins));
      curr += ins.length;
    } else {
      // Truncated instruction: list the opcode byte as data.
      ins.instructionType = UNDEFINED;
      ins.length = 1;
      ins.operand = 0;
      lines.push_back(make_pair(address, ins));
      curr += 1;
    }
  }
  return lines;
}

I8008Disassembly b8008::disassemble(vector<uint8_t> const& bytes, uint16_t origin) {
  return disassemble(bytes.data(), bytes.data() + bytes.size(), origin);
}

ostream& b8008::printDisassembly(ostream& os, I8008Disassembly const& lines) {
  auto f = os.flags();
  auto l = os.fill();
  for (auto const& line : lines) {
    ostringstream bytes;
    bytes << uppercase << asBytes(line.second);
    os << hex << uppercase << setfill('0') << setw(4) << line.first << "  " << setfill(' ') << left << setw(10)
       << bytes.str() << right << line.second << endl;
  }
  os.fill(l);
  os.flags(f);
  return os;
}
