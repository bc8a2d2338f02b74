// I8008Disassembler.hpp

// Copyright (c) 2026 The B8008 Team. All rights reserved.
// This file is part of B8008 and is made available under
// the terms of the BSD license (see the COPYING file).

#ifndef I8008Disassembler_hpp
#define I8008Disassembler_hpp

#include "I8008Decoder.hpp"
#include <cstdint>
#include <iostream>
#include <utility>
#include <vector>

namespace b8008 {

using I8008Disassembly = std::vector<std::pair<std::uint16_t, Instruction>>;

/// Decode the bytes in [begin, end) one instruction after the other.
/// Addresses start at `origin`. An instruction cut short by the end of
/// the block is listed as data.
I8008Disassembly disassemble(std::uint8_t const* begin, std::uint8_t const* end, std::uint16_t origin = 0);

I8008Disassembly disassemble(std::vector<std::uint8_t> const& bytes, std::uint16_t origin = 0);

/// Print a listing, one `ADDR  BYTES  INSTRUCTION` line per entry.
std::ostream& printDisassembly(std::ostream& os, I8008Disassembly const& lines);

} // namespace b8008

#endif /* I8008Disassembler_hpp */
