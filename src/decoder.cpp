#include "intcode/decoder.hpp"
#include "intcode/errors.hpp"
#include <iomanip>
#include <sstream>

namespace intcode
{

// Decodificación de una instrucción. No resuelve operandos: eso lo hace
// la Machine al ejecutar (load/store), así el parámetro conserva su modo.
Instr decode(const Memory& mem, Word pc)
{
  const Word raw = mem.read(pc);
  const Word code = raw % 100;
  if (!is_opcode(code))
    throw DecodeError("opcode inválido", pc, raw);

  Instr ins{};
  ins.op = static_cast<OpCode>(code);
  ins.argc = arity(ins.op);

  Word modes = raw / 100;
  for (std::size_t i = 0; i < ins.argc; ++i) {
    const Word digit = modes % 10;
    if (!is_mode(digit))
      throw DecodeError("modo de parámetro inválido " + std::to_string(digit) +
                        " en el operando " + std::to_string(i + 1), pc, raw);
    ins.params[i].mode = static_cast<Mode>(digit);
    ins.params[i].value = mem.read(pc + 1 + static_cast<Word>(i));
    modes /= 10;
  }
  return ins;
}

std::string format_param(const Param& p)
{
  std::ostringstream os;
  switch (p.mode) {
    case Mode::Position:  os << '[' << p.value << ']'; break;
    case Mode::Immediate: os << '#' << p.value; break;
    case Mode::Relative:  os << "rb[" << std::showpos << p.value << ']'; break;
  }
  return os.str();
}

std::string format_instr(const Instr& ins)
{
  std::string out = mnemonic(ins.op);
  for (std::size_t i = 0; i < ins.argc; ++i) {
    out += (i == 0) ? " " : ", ";
    out += format_param(ins.params[i]);
  }
  return out;
}

std::string disassemble(const Program& prog)
{
  const Memory mem(prog, 0);
  const Word n = static_cast<Word>(prog.size());
  std::ostringstream os;
  Word pc = 0;
  while (pc < n) {
    os << std::setw(6) << pc << ": ";
    try {
      const Instr ins = decode(mem, pc);
      os << format_instr(ins) << '\n';
      pc += ins.op == OpCode::Halt ? 1 : size_of(ins.op);
    } catch (const DecodeError&) {
      // dato embebido en el listado
      os << ".word " << prog[static_cast<std::size_t>(pc)] << '\n';
      ++pc;
    }
  }
  return os.str();
}

} // namespace intcode
