#include "intcode/machine.hpp"
#include "intcode/decoder.hpp"
#include "intcode/errors.hpp"
#include "intcode/loader.hpp"
#include <utility>

namespace intcode
{

  // Intérprete: decode -> execute, una instrucción por step().
  // - load/store: resuelven el parámetro según su modo
  // - step(): máquina de estados Running/BlockedOnInput/BlockedOnOutput/Finished
  // - run*/read*: drivers sobre step()
  Machine::Machine(Program program, MachineOptions opts)
    : mem_(std::move(program), opts.memory_limit), opts_(std::move(opts)) {}

  Machine Machine::from_text(std::string_view text, MachineOptions opts)
  {
    return Machine(Loader::parse(text), std::move(opts));
  }

  Machine Machine::from_file(const std::string &path, MachineOptions opts)
  {
    return Machine(Loader::parse_file(path), std::move(opts));
  }

  // ===== Cola de entrada =====
  void Machine::append_input(Word value)
  {
    input_.push_back(value);
  }

  void Machine::append_input(std::initializer_list<Word> values)
  {
    input_.insert(input_.end(), values.begin(), values.end());
  }

  void Machine::append_input(const std::vector<Word> &values)
  {
    input_.insert(input_.end(), values.begin(), values.end());
  }

  void Machine::append_ascii(std::string_view text)
  {
    for (char c : text)
      input_.push_back(static_cast<Word>(static_cast<unsigned char>(c)));
  }

  // ===== Aritmética chequeada =====
  Word Machine::checked_add(Word a, Word b, const char *what) const
  {
    Word r;
    if (__builtin_add_overflow(a, b, &r))
      throw OverflowError(std::string("desborde en ") + what + ": " + std::to_string(a) +
                          " + " + std::to_string(b) + " (pc=" + std::to_string(pc_) + ")");
    return r;
  }

  Word Machine::checked_mul(Word a, Word b, const char *what) const
  {
    Word r;
    if (__builtin_mul_overflow(a, b, &r))
      throw OverflowError(std::string("desborde en ") + what + ": " + std::to_string(a) +
                          " * " + std::to_string(b) + " (pc=" + std::to_string(pc_) + ")");
    return r;
  }

  // ===== Resolución de operandos =====
  Word Machine::effective_address(const Param &p) const
  {
    switch (p.mode)
    {
    case Mode::Position:
      return p.value;
    case Mode::Relative:
      return checked_add(rb_, p.value, "dirección relativa");
    case Mode::Immediate:
      break;
    }
    throw DecodeError("no se puede escribir en un parámetro inmediato", pc_, mem_.read(pc_));
  }

  Word Machine::load(const Param &p)
  {
    if (p.mode == Mode::Immediate)
      return p.value;
    const Word addr = effective_address(p);
    const Word v = mem_.read(addr);
    ++metrics_.loads;
    INTCODE_LOG_IF(opts_.trace_memory, "[" << opts_.name << "]     mem[" << addr << "] -> " << v);
    return v;
  }

  void Machine::store(const Param &p, Word value)
  {
    const Word addr = effective_address(p);
    mem_.write(addr, value);
    ++metrics_.stores;
    if (addr > metrics_.max_address)
      metrics_.max_address = addr;
    INTCODE_LOG_IF(opts_.trace_memory, "[" << opts_.name << "]     mem[" << addr << "] <- " << value);
  }

  // ===== Un paso =====
  StepState Machine::step()
  {
    if (finished_)
      throw ProtocolError("step() sobre una máquina terminada [" + opts_.name + "]");

    // Salida sin consumir: no se ejecuta nada hasta que el host la tome.
    if (output_)
      return StepState::BlockedOnOutput;

    if (opts_.step_limit != 0 && steps_ >= opts_.step_limit)
      throw StepLimitError(opts_.step_limit);

    const Instr ins = decode(mem_, pc_);
    INTCODE_LOG_IF(opts_.trace, "[" << opts_.name << "] paso " << steps_ << " pc=" << pc_
                                    << " rb=" << rb_ << "  " << format_instr(ins));

    const auto &a = ins.params[0];
    const auto &b = ins.params[1];
    const auto &c = ins.params[2];

    auto next = [&]{ pc_ += size_of(ins.op); };
    auto jump = [&](bool taken) {
      if (taken) {
        pc_ = load(b);
        ++metrics_.jumps_taken;
      } else {
        next();
      }
    };

    switch (ins.op)
    {
    case OpCode::Add: {
      const Word x = load(a);
      const Word y = load(b);
      store(c, checked_add(x, y, "add"));
      next();
      break;
    }
    case OpCode::Multiply: {
      const Word x = load(a);
      const Word y = load(b);
      store(c, checked_mul(x, y, "mul"));
      next();
      break;
    }
    case OpCode::Input: {
      if (input_.empty()) {
        ++metrics_.input_waits;
        INTCODE_LOG_IF(opts_.trace, "[" << opts_.name << "] esperando entrada");
        return StepState::BlockedOnInput;
      }
      const Word v = input_.front();
      store(a, v);
      input_.pop_front();
      ++metrics_.inputs;
      INTCODE_LOG_IF(opts_.trace, "[" << opts_.name << "] entrada: " << v);
      next();
      break;
    }
    case OpCode::Output: {
      const Word v = load(a);
      output_ = v;
      ++metrics_.outputs;
      INTCODE_LOG_IF(opts_.trace, "[" << opts_.name << "] salida: " << v);
      next();
      ++steps_;
      ++metrics_.instructions;
      return StepState::BlockedOnOutput;
    }
    case OpCode::JumpIfTrue:
      jump(load(a) != 0);
      break;
    case OpCode::JumpIfFalse:
      jump(load(a) == 0);
      break;
    case OpCode::LessThan: {
      const Word x = load(a);
      const Word y = load(b);
      store(c, x < y ? 1 : 0);
      next();
      break;
    }
    case OpCode::Equals: {
      const Word x = load(a);
      const Word y = load(b);
      store(c, x == y ? 1 : 0);
      next();
      break;
    }
    case OpCode::AdjustRelativeBase: {
      const Word v = load(a);
      INTCODE_LOG_IF(opts_.trace, "[" << opts_.name << "]     rb <- " << rb_ << " + " << v);
      rb_ = checked_add(rb_, v, "ajuste de base relativa");
      ++metrics_.base_adjusts;
      next();
      break;
    }
    case OpCode::Halt:
      finished_ = true;
      ++steps_;
      ++metrics_.instructions;
      INTCODE_LOG_IF(opts_.trace, "[" << opts_.name << "] FINISHED tras " << steps_ << " pasos");
      return StepState::Finished;
    }

    ++steps_;
    ++metrics_.instructions;
    return StepState::Running;
  }

  // ===== Drivers =====
  RunState Machine::run()
  {
    while (true) {
      const StepState s = step();
      if (s != StepState::Running)
        return to_run_state(s);
    }
  }

  StepState Machine::run_for(std::uint64_t max_steps)
  {
    for (std::uint64_t i = 0; i < max_steps; ++i) {
      const StepState s = step();
      if (s != StepState::Running)
        return s;
    }
    return StepState::Running;
  }

  void Machine::run_with(MachineIO &io)
  {
    while (!finished_) {
      switch (run()) {
      case RunState::BlockedOnInput:
        append_input(io.input());
        break;
      case RunState::BlockedOnOutput:
        io.output(take_output());
        break;
      case RunState::Finished:
        break;
      }
    }
  }

  Word Machine::take_output()
  {
    if (!output_)
      throw ProtocolError("take_output() sin salida pendiente [" + opts_.name + "]");
    const Word v = *output_;
    output_.reset();
    return v;
  }

  std::vector<Word> Machine::read_output()
  {
    std::vector<Word> out;
    while (!finished_ && run() == RunState::BlockedOnOutput)
      out.push_back(take_output());
    return out;
  }

  std::optional<std::string> Machine::read_ascii()
  {
    std::string out;
    while (!finished_) {
      const StepState s = step();
      if (s == StepState::Running)
        continue;
      if (s != StepState::BlockedOnOutput)
        break;
      // Fuera de rango: queda pendiente para que el host la tome.
      const Word v = *output_;
      if (v < cfg::kAsciiMin || v > cfg::kAsciiMax)
        break;
      out.push_back(static_cast<char>(take_output()));
    }
    if (out.empty())
      return std::nullopt;
    return out;
  }

  // ===== Memoria directa =====
  void Machine::poke(Word addr, Word value)
  {
    mem_.write(addr, value);
  }

  Word Machine::peek(Word addr) const
  {
    return mem_.read(addr);
  }

} // namespace intcode
