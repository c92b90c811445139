#pragma once
#include "types.hpp"
#include <string>
#include <string_view>

//
// Cargador de listados Intcode.
// Toma texto (string o archivo) y lo convierte en un Program.
//
// Formato: una línea (o bloque, se recortan espacios) de enteros base 10
// separados por comas, opcionalmente negativos:
//   1002,4,3,4,33
//   3,0,4,0,99
//
// Notas rápidas:
// - Los espacios alrededor de cada token se ignoran (también saltos de línea)
// - Un token vacío o no entero lanza ParseError nombrando el token
// - Un listado vacío también es ParseError
//

namespace intcode {

class Loader {
public:
  // Parsea directamente desde una cadena completa.
  static Program parse(std::string_view text);

  // Lee el archivo y parsea su contenido.
  static Program parse_file(const std::string& path);

private:
  // Quita espacios al inicio y al final.
  static std::string_view trim(std::string_view s);

  // Token -> Word; lanza ParseError si no es un entero de 64 bits completo.
  static Word parse_word(std::string_view token, std::size_t index);
};

} // namespace intcode
