// ============= include/tracking/hungarian.hpp =============
/*
 * Hungarian (Kuhn-Munkres) - asignación de costo mínimo exacta
 *
 * Matriz de costo:
 *   filas    = tracks
 *   columnas = detecciones
 *
 * Salida:
 *   assignment[i] = j  -> track i asignado a detección j
 *   assignment[i] = -1 -> sin asignar
 *
 * Celdas con costo >= FORBIDDEN nunca se asignan.
 * O(n^3) sobre la matriz rellenada a cuadrada.
 */

#pragma once
#include <opencv2/core.hpp>
#include <vector>

class Hungarian {
public:
    static constexpr double FORBIDDEN = 1e6;

    static std::vector<int> solve(const cv::Mat1d& cost);

private:
    static constexpr double INF = 1e12;
};
