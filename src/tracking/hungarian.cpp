// ============= src/tracking/hungarian.cpp =============
#include "tracking/hungarian.hpp"
#include <algorithm>

std::vector<int> Hungarian::solve(const cv::Mat1d& cost) {
    const int n = cost.rows;
    const int m = cost.cols;

    if (n == 0 || m == 0) {
        return std::vector<int>(n, -1);
    }

    const int dim = std::max(n, m);

    // Rellenar a matriz cuadrada; las celdas de relleno valen FORBIDDEN
    cv::Mat1d padded(dim, dim, FORBIDDEN);
    cost.copyTo(padded(cv::Rect(0, 0, m, n)));

    std::vector<double> u(dim + 1, 0.0), v(dim + 1, 0.0);
    std::vector<int> p(dim + 1, 0), way(dim + 1, 0);

    for (int i = 1; i <= dim; ++i) {
        p[0] = i;
        int j0 = 0;

        std::vector<double> minv(dim + 1, INF);
        std::vector<bool> used(dim + 1, false);

        do {
            used[j0] = true;
            const int i0 = p[j0];
            int j1 = 0;
            double delta = INF;

            for (int j = 1; j <= dim; ++j) {
                if (used[j]) continue;

                const double cur = padded(i0 - 1, j - 1) - u[i0] - v[j];
                if (cur < minv[j]) {
                    minv[j] = cur;
                    way[j] = j0;
                }
                if (minv[j] < delta) {
                    delta = minv[j];
                    j1 = j;
                }
            }

            for (int j = 0; j <= dim; ++j) {
                if (used[j]) {
                    u[p[j]] += delta;
                    v[j] -= delta;
                } else {
                    minv[j] -= delta;
                }
            }

            j0 = j1;
        } while (p[j0] != 0);

        // Camino de aumento
        do {
            const int j1 = way[j0];
            p[j0] = p[j1];
            j0 = j1;
        } while (j0);
    }

    std::vector<int> assignment(n, -1);
    for (int j = 1; j <= dim; ++j) {
        const int row = p[j] - 1;
        const int col = j - 1;
        if (row < 0 || row >= n || col >= m) continue;

        if (cost(row, col) < FORBIDDEN) {
            assignment[row] = col;
        }
    }

    return assignment;
}
