// ============= include/tracking/associator.hpp =============
/*
 * Associator - asignación óptima tracks <-> detecciones
 *
 * CARACTERÍSTICAS:
 * - Costo = 1 - IoU(caja predicha, caja detectada), en [0, 1]
 * - Pares con IoU < min_iou prohibidos
 * - Asignación exacta (Hungarian), no greedy
 * - Desempate determinista: entre asignaciones de igual costo gana la
 *   detección de mayor confianza. Igual = mismo paso de 2^-24; una diferencia
 *   real de costo siempre pesa más que la confianza
 * - Geometría no finita -> todo sin asignar + warning, nunca lanza
 *
 * La función de costo es intercambiable (AssociationCost).
 */

#pragma once
#include "detection/detector.hpp"
#include <memory>
#include <optional>
#include <utility>
#include <vector>

struct AssociationResult {
    std::vector<std::pair<int, int>> matches;   // (track_idx, det_idx)
    std::vector<int> unmatched_tracks;
    std::vector<int> unmatched_detections;
};

class AssociationCost {
public:
    virtual ~AssociationCost() = default;

    // nullopt = par prohibido
    virtual std::optional<float> cost(const cv::Rect2f& predicted,
                                      const Detection& detection) const = 0;
};

class IouCost : public AssociationCost {
public:
    explicit IouCost(float min_iou = 0.3f);

    std::optional<float> cost(const cv::Rect2f& predicted,
                              const Detection& detection) const override;

    float get_min_iou() const { return min_iou; }

private:
    float min_iou;
};

class Associator {
public:
    explicit Associator(std::shared_ptr<const AssociationCost> cost_fn);

    AssociationResult associate(const std::vector<cv::Rect2f>& predicted_boxes,
                                const std::vector<Detection>& detections) const;

private:
    std::shared_ptr<const AssociationCost> cost_fn;

    static AssociationResult all_unmatched(size_t num_tracks, size_t num_detections);
};
