#pragma once
#include <cstddef>
#include <cstdint>
#include <iostream> // logs
#include <string>
#include <syncstream>

namespace intcode::cfg
{
    // Stdout/stderr sincronizados (varias máquinas pueden loguear intercaladas)
    #define INTCODE_SOUT  std::osyncstream(std::cout)
    #define INTCODE_SERR  std::osyncstream(std::cerr)

    // --- Límites por defecto (política del host, no del núcleo) ---
    // Techo de pasos para detectar programas desbocados. 0 = sin límite.
    inline constexpr std::uint64_t kDefaultStepLimit = 100'000'000;
    // Techo de memoria en palabras de 64 bits (~128 MiB). 0 = sin límite.
    inline constexpr std::size_t kDefaultMemoryLimit = std::size_t{1} << 24;

    // Rango ASCII que read_ascii() convierte a texto
    inline constexpr std::int64_t kAsciiMin = 0;
    inline constexpr std::int64_t kAsciiMax = 127;

    // Celdas máximas que el comando 'm' del stepping muestra de una vez
    inline constexpr std::int64_t kMaxMemoryWindow = 4096;

    // --- Flags de log rápidos ---
    inline constexpr bool kLogLoader   = false; // parseo de listados
    inline constexpr bool kLogPipeline = false; // tráfico entre etapas
    inline constexpr bool kLogConsole  = true;  // mensajes del CLI

    // Macro simple de logging condicional
    #define INTCODE_LOG_IF(flag, msg)        \
        do {                                 \
            if (flag) {                      \
                INTCODE_SERR << msg << '\n'; \
            }                                \
        } while (0)
} // namespace intcode::cfg

namespace intcode {

// Opciones por instancia. Se copian junto con la máquina al clonar.
struct MachineOptions {
  std::string   name = "M0";                      // prefijo en los logs: [M0]
  bool          trace = false;                    // instrucción decodificada + E/S
  bool          trace_memory = false;             // además cada lectura/escritura
  std::uint64_t step_limit = cfg::kDefaultStepLimit;
  std::size_t   memory_limit = cfg::kDefaultMemoryLimit;
};

} // namespace intcode
