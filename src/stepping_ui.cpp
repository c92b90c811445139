#include "intcode/console.hpp"
#include "intcode/config.hpp"
#include "intcode/debug_io.hpp"
#include "intcode/decoder.hpp"
#include <algorithm>
#include <sstream>
#include <string>

namespace intcode {

int Console::run_stepping() {
  out_ << "\n===================== STEPPING INTERACTIVO =====================\n"
       << "ENTER=step | c=continuar | r=regs | m [addr [n]]=memoria | i N=entrada | q=salir\n";

  bool auto_run = false;
  while (!m_.finished()) {
    if (!auto_run) {
      out_ << "\n[step " << m_.steps() << "] > " << std::flush;
      std::string line;
      if (!std::getline(in_, line)) { out_ << "\n[Stepping] stdin cerrado. Saliendo.\n"; return 1; }

      std::istringstream cmd(line);
      std::string word;
      cmd >> word;
      if (word == "q" || word == "Q") { out_ << "[Stepping] Salir.\n"; return 1; }
      if (word == "c" || word == "C") { auto_run = true; out_ << "[Stepping] Continuación automática habilitada.\n"; }
      else if (word == "r" || word == "R") { dump_regs(); continue; }
      else if (word == "m" || word == "M") {
        Word from = m_.pc();
        std::size_t n = 16;
        Word a = 0;
        Word b = 0;
        if (cmd >> a) {
          from = a;
          if (cmd >> b) {
            if (b <= 0) { out_ << "[Stepping] uso: m [addr [n]] con n > 0\n"; continue; }
            n = static_cast<std::size_t>(std::min<Word>(b, cfg::kMaxMemoryWindow));
          }
        }
        dump_memory(from, n);
        continue;
      }
      else if (word == "i" || word == "I") {
        Word v = 0;
        if (cmd >> v) { m_.append_input(v); out_ << "[Stepping] encolado " << v << "\n"; }
        else          { out_ << "[Stepping] uso: i N\n"; }
        continue;
      }
      else if (!word.empty()) { out_ << "[Stepping] comando desconocido: " << word << "\n"; continue; }
    }

    const StepState s = step_one();
    if (s == StepState::BlockedOnInput) {
      out_ << "[Stepping] esperando entrada (use 'i N')\n";
      auto_run = false;
    }
  }

  out_ << "\n[Stepping] Terminado (auto_run=" << (auto_run ? "true" : "false") << ").\n";
  dump_metrics();
  return 0;
}

StepState Console::step_one() {
  // Snapshot BEFORE
  const auto before = dbg::snapshot(m_);
  out_ << "pc=" << m_.pc() << "  " << format_instr(decode(m_.memory(), m_.pc())) << "\n";

  const StepState s = m_.step();

  // Diffs AFTER
  out_ << "  [" << to_string(s) << "]\n";
  dbg::print_state_diff(out_, before, dbg::snapshot(m_));
  if (s == StepState::BlockedOnOutput)
    out_ << "  >> salida: " << m_.take_output() << "\n";
  if (s == StepState::Finished)
    out_ << "  >> FINISHED\n";
  return s;
}

} // namespace intcode
