#include "intcode/config.hpp"
#include "intcode/console.hpp"
#include "intcode/decoder.hpp"
#include "intcode/errors.hpp"
#include "intcode/loader.hpp"
#include "intcode/machine.hpp"
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

/**
 * intcode-run [opciones] programa.txt
 *   -i, --input a,b,c   entradas iniciales (luego se leen de stdin)
 *   -a, --ascii         modo texto ASCII interactivo
 *   -s, --step          stepping: ENTER=step, c=continuar, r=regs, m=memoria, i N, q=salir
 *   -t, --trace         traza de cada instrucción por stderr
 *   --trace-mem         traza también lecturas/escrituras
 *   --max-steps N       techo de pasos (0 = sin límite)
 *   --poke addr=valor   parchea memoria antes de ejecutar (repetible)
 *   --disasm            imprime el listado desensamblado y sale
 */
static int usage(const char* argv0)
{
  INTCODE_SERR << "uso: " << argv0
               << " [-i a,b,c] [-a|-s] [-t] [--trace-mem] [--max-steps N]"
                  " [--poke addr=valor] [--disasm] programa.txt\n";
  return 1;
}

int main(int argc, char **argv)
{
  using namespace intcode;

  enum class RunMode { Batch, Ascii, Step, Disasm } mode = RunMode::Batch;
  MachineOptions opts;
  std::string filePath;
  std::string inputs;
  std::vector<std::pair<Word, Word>> pokes;

  // Parse simple de argumentos:
  //   el primer no-flag es el path del programa
  try {
    for (int i = 1; i < argc; ++i) {
      std::string a = argv[i];
      auto value = [&]() -> std::string {
        if (i + 1 >= argc) throw std::invalid_argument("falta el valor de " + a);
        return argv[++i];
      };
      if (a == "--input" || a == "-i")       inputs = value();
      else if (a == "--ascii" || a == "-a")  mode = RunMode::Ascii;
      else if (a == "--step" || a == "-s")   mode = RunMode::Step;
      else if (a == "--trace" || a == "-t")  opts.trace = true;
      else if (a == "--trace-mem")           opts.trace = opts.trace_memory = true;
      else if (a == "--disasm")              mode = RunMode::Disasm;
      else if (a == "--max-steps")           opts.step_limit = std::stoull(value());
      else if (a == "--poke") {
        const std::string kv = value();
        const auto eq = kv.find('=');
        if (eq == std::string::npos) throw std::invalid_argument("--poke espera addr=valor");
        pokes.emplace_back(std::stoll(kv.substr(0, eq)), std::stoll(kv.substr(eq + 1)));
      }
      else if (!a.empty() && a[0] == '-')    return usage(argv[0]);
      else                                   filePath = a;
    }
  } catch (const std::logic_error& e) {
    INTCODE_SERR << "[Main] argumento inválido: " << e.what() << "\n";
    return usage(argv[0]);
  }
  if (filePath.empty()) return usage(argv[0]);

  try {
    if (mode == RunMode::Disasm) {
      INTCODE_SOUT << disassemble(Loader::parse_file(filePath));
      return 0;
    }

    INTCODE_LOG_IF(cfg::kLogConsole && opts.trace, "[Main] Cargando programa desde: " << filePath);
    Machine m = Machine::from_file(filePath, opts);
    for (const auto& [addr, val] : pokes) m.poke(addr, val);
    if (!inputs.empty()) m.append_input(Loader::parse(inputs));

    Console console(std::move(m));
    switch (mode) {
      case RunMode::Ascii: return console.run_ascii();
      case RunMode::Step:  return console.run_stepping();
      case RunMode::Batch:
      case RunMode::Disasm: break;
    }
    return console.run_batch();
  } catch (const Fault& e) {
    INTCODE_SERR << "[Main] fallo: " << e.what() << "\n";
    return 1;
  }
}
