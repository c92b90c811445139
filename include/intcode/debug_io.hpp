#pragma once
// Utilidades de impresión compactas para el estado de una Machine.
// Pensado para dumps de stepping y resúmenes del CLI.

#include "machine.hpp"
#include "memory.hpp"
#include "types.hpp"
#include <cstddef>
#include <iomanip>
#include <optional>
#include <ostream>

namespace intcode::dbg {

// Registros visibles de la máquina en un instante.
struct Snapshot {
  Word        pc = 0;
  Word        rb = 0;
  std::size_t inputs = 0;
  std::optional<Word> output;
};

inline Snapshot snapshot(const Machine& m) {
  return Snapshot{m.pc(), m.relative_base(), m.pending_input(), m.peek_output()};
}

inline void print_state_compact(std::ostream& os, const Machine& m) {
  os << "pc=" << m.pc() << " rb=" << m.relative_base()
     << " in=" << m.pending_input()
     << " out=";
  if (m.has_output()) os << *m.peek_output();
  else                os << '-';
  os << " pasos=" << m.steps()
     << (m.finished() ? " FINISHED" : "");
}

inline void print_state_diff(std::ostream& os, const Snapshot& before, const Snapshot& after) {
  if (before.pc != after.pc)
    os << "  pc: " << before.pc << " -> " << after.pc << "\n";
  if (before.rb != after.rb)
    os << "  rb: " << before.rb << " -> " << after.rb << "\n";
  if (before.inputs != after.inputs)
    os << "  cola: " << before.inputs << " -> " << after.inputs << "\n";
  if (before.output != after.output) {
    os << "  salida: ";
    if (before.output) os << *before.output; else os << '-';
    os << " -> ";
    if (after.output) os << *after.output; else os << '-';
    os << "\n";
  }
}

// Ventana de memoria [from, from+count), 8 celdas por línea; '*' marca highlight.
inline void print_memory_window(std::ostream& os, const Memory& mem, Word from, std::size_t count,
                                std::optional<Word> highlight = std::nullopt) {
  if (from < 0) from = 0;
  for (std::size_t k = 0; k < count; ++k) {
    const Word addr = from + static_cast<Word>(k);
    if (k % 8 == 0) {
      if (k != 0) os << "\n";
      os << std::setw(6) << addr << ":";
    }
    os << (highlight && *highlight == addr ? " *" : "  ") << std::setw(8) << mem.read(addr);
  }
  os << "\n";
}

} // namespace intcode::dbg
