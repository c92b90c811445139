#include "intcode/console.hpp"
#include "intcode/config.hpp"
#include "intcode/debug_io.hpp"
#include <utility>

namespace intcode {

Console::Console(Machine machine, std::istream& in, std::ostream& out)
  : m_(std::move(machine)), in_(in), out_(out) {}

// ---------- Modo batch: enteros, uno por línea ----------
int Console::run_batch() {
  while (true) {
    switch (m_.run()) {
      case RunState::BlockedOnOutput:
        out_ << m_.take_output() << "\n";
        break;
      case RunState::BlockedOnInput: {
        Word v = 0;
        if (!(in_ >> v)) {
          INTCODE_LOG_IF(cfg::kLogConsole, "[Console] entrada agotada en pc=" << m_.pc());
          return 1;
        }
        m_.append_input(v);
        break;
      }
      case RunState::Finished:
        out_.flush();
        return 0;
    }
  }
}

// ---------- Modo ASCII ----------
int Console::run_ascii() {
  while (true) {
    if (auto text = m_.read_ascii()) out_ << *text;
    if (m_.finished()) {
      out_.flush();
      return 0;
    }
    if (m_.has_output()) {
      // valor fuera del rango ASCII (p.ej. un resultado numérico)
      out_ << m_.take_output() << "\n";
      continue;
    }
    out_.flush();
    std::string line;
    if (!std::getline(in_, line)) {
      INTCODE_LOG_IF(cfg::kLogConsole, "[Console] stdin cerrado esperando entrada");
      return 1;
    }
    m_.append_ascii(line);
    m_.append_input(Word{'\n'});
  }
}

// ---------- Dumps ----------
void Console::dump_regs() const {
  out_ << "REGISTROS [" << m_.name() << "]: ";
  dbg::print_state_compact(out_, m_);
  out_ << "\n";
}

void Console::dump_memory(Word from, std::size_t count) const {
  dbg::print_memory_window(out_, m_.memory(), from, count, m_.pc());
}

void Console::dump_metrics() const {
  const auto& x = m_.metrics();
  out_ << "----- Métricas [" << m_.name() << "] -----\n"
       << "Instrucciones: " << x.instructions
       << " | Loads: " << x.loads
       << " | Stores: " << x.stores
       << " | In: " << x.inputs
       << " | Out: " << x.outputs
       << " | Esperas: " << x.input_waits
       << " | Saltos: " << x.jumps_taken
       << " | ARB: " << x.base_adjusts
       << " | Max addr: " << x.max_address
       << " | Memoria: " << m_.memory().size() << " palabras\n";
}

} // namespace intcode
