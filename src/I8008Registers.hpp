// I8008Registers.hpp
// I8008 scratchpad register file and memory addressing

// Copyright (c) 2026 The B8008 Team. All rights reserved.
// This file is part of B8008 and is made available under
// the terms of the BSD license (see the COPYING file).

#ifndef I8008Registers_hpp
#define I8008Registers_hpp

#include <array>
#include <cstdint>

namespace b8008 {

/// Register select code, as encoded in the DDD and SSS opcode fields.
/// `M` is the memory location addressed by H:L.
enum class Reg : int { A = 0, B, C, D, E, H, L, M };

constexpr std::uint16_t addressMask = 0x3fff; /// 14-bit address space.

/// The seven scratchpad registers. The register file does not know
/// about `M`: the caller resolves it through `addressPointer()`.
struct RegisterFile {
  std::array<std::uint8_t, 7> r{};

  bool operator==(RegisterFile const& s) const { return r == s.r; }

  std::uint8_t read(Reg code) const;
  void write(Reg code, std::uint8_t value);

  /// The 14-bit address H[5:0]:L. The two high bits of H are ignored.
  std::uint16_t addressPointer() const;
};

char regName(Reg code);

inline bool isMemory(Reg code) {
  return code == Reg::M;
}

inline std::uint8_t RegisterFile::read(Reg code) const {
  return r[static_cast<int>(code) % 7];
}

inline void RegisterFile::write(Reg code, std::uint8_t value) {
  if (code != Reg::M) {
    r[static_cast<int>(code)] = value;
  }
}

inline std::uint16_t RegisterFile::addressPointer() const {
  return static_cast<std::uint16_t>(((read(Reg::H) & 0x3f) << 8) | read(Reg::L));
}

inline char regName(Reg code) {
  return "ABCDEHLM"[static_cast<int>(code) & 7];
}

} // namespace b8008

#endif /* I8008Registers_hpp */
