// ============= include/logging.hpp =============
#pragma once
#include <string>

// Logger por defecto de spdlog: consola con color + archivo rotativo (10MB x 5).
// log_file vacío -> solo consola. Nivel inválido -> info.
void setup_logging(const std::string& level, const std::string& log_file = "");
