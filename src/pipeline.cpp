#include "intcode/pipeline.hpp"
#include "intcode/config.hpp"
#include "intcode/errors.hpp"
#include <cstdint>
#include <string>
#include <utility>

namespace intcode {

// ---------- Construcción ----------
Pipeline::Pipeline(const Machine& tmpl, const std::vector<std::vector<Word>>& primes, bool feedback)
  : feedback_(feedback) {
  if (primes.empty()) throw ProtocolError("Pipeline sin etapas");
  stages_.reserve(primes.size());
  for (std::size_t i = 0; i < primes.size(); ++i) {
    Machine m = tmpl.clone();
    m.set_name(tmpl.name() + "." + std::to_string(i));
    m.append_input(primes[i]);
    stages_.push_back(std::move(m));
  }
}

// ---------- Ejecución ----------
void Pipeline::pump(std::size_t i) {
  Machine& m = stages_[i];
  while (m.run() == RunState::BlockedOnOutput) {
    const Word v = m.take_output();
    const std::size_t next = i + 1;
    if (next == stages_.size()) {
      last_ = v;
      if (feedback_) stages_[0].append_input(v);
      INTCODE_LOG_IF(cfg::kLogPipeline, "[Pipeline] etapa " << i << " -> "
                     << (feedback_ ? "0 (feedback)" : "salida") << ": " << v);
    } else {
      stages_[next].append_input(v);
      INTCODE_LOG_IF(cfg::kLogPipeline, "[Pipeline] etapa " << i << " -> " << next << ": " << v);
    }
  }
}

Word Pipeline::run(Word signal) {
  if (stages_.back().finished())
    throw ProtocolError("Pipeline ya ejecutado: la última etapa terminó");
  last_.reset();
  stages_.front().append_input(signal);

  const std::size_t n = stages_.size();
  while (!stages_.back().finished()) {
    // Progreso = instrucciones ejecutadas en la vuelta completa
    std::uint64_t before = 0;
    for (const auto& m : stages_) before += m.steps();

    for (std::size_t i = 0; i < n; ++i) {
      if (!stages_[i].finished()) pump(i);
    }

    std::uint64_t after = 0;
    for (const auto& m : stages_) after += m.steps();
    if (after == before && !stages_.back().finished())
      throw ProtocolError("Pipeline bloqueado: todas las etapas esperan entrada");
  }

  if (!last_)
    throw ProtocolError("La última etapa terminó sin emitir señal");
  INTCODE_LOG_IF(cfg::kLogPipeline, "[Pipeline] señal final: " << *last_);
  return *last_;
}

} // namespace intcode
