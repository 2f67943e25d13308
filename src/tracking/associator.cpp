// ============= src/tracking/associator.cpp =============
#include "tracking/associator.hpp"
#include "tracking/geometry.hpp"
#include "tracking/hungarian.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace {

// Resolución del costo primario: 2^-24, el paso de float en [0.5, 1).
// Costos que caen en el mismo paso se consideran iguales.
constexpr double COST_RESOLUTION = 1.0 / 16777216.0;

}  // namespace

// ==================== IouCost ====================

IouCost::IouCost(float min_iou) : min_iou(min_iou) {
    if (!(min_iou >= 0.0f && min_iou <= 1.0f)) {
        throw std::invalid_argument("min_iou must be in [0, 1]");
    }
}

std::optional<float> IouCost::cost(const cv::Rect2f& predicted,
                                   const Detection& detection) const
{
    float iou = calculate_iou(predicted, detection.box);
    if (iou < min_iou) {
        return std::nullopt;
    }
    return std::clamp(1.0f - iou, 0.0f, 1.0f);
}

// ==================== Associator ====================

Associator::Associator(std::shared_ptr<const AssociationCost> cost_fn)
    : cost_fn(std::move(cost_fn))
{
    if (!this->cost_fn) {
        throw std::invalid_argument("Associator requires a cost function");
    }
}

AssociationResult Associator::all_unmatched(size_t num_tracks, size_t num_detections) {
    AssociationResult result;
    result.unmatched_tracks.resize(num_tracks);
    std::iota(result.unmatched_tracks.begin(), result.unmatched_tracks.end(), 0);
    result.unmatched_detections.resize(num_detections);
    std::iota(result.unmatched_detections.begin(), result.unmatched_detections.end(), 0);
    return result;
}

AssociationResult Associator::associate(const std::vector<cv::Rect2f>& predicted_boxes,
                                        const std::vector<Detection>& detections) const
{
    const size_t num_tracks = predicted_boxes.size();
    const size_t num_dets = detections.size();

    if (num_tracks == 0 || num_dets == 0) {
        return all_unmatched(num_tracks, num_dets);
    }

    for (const auto& box : predicted_boxes) {
        if (!is_finite_box(box)) {
            spdlog::warn("⚠️  Non-finite predicted box, skipping association for this frame");
            return all_unmatched(num_tracks, num_dets);
        }
    }
    for (const auto& det : detections) {
        if (!is_finite_box(det.box) || !std::isfinite(det.confidence)) {
            spdlog::warn("⚠️  Non-finite detection, skipping association for this frame");
            return all_unmatched(num_tracks, num_dets);
        }
    }

    // Orden de columnas: confianza descendente, luego índice original
    std::vector<int> column_order(num_dets);
    std::iota(column_order.begin(), column_order.end(), 0);
    std::stable_sort(column_order.begin(), column_order.end(),
        [&detections](int a, int b) {
            return detections[a].confidence > detections[b].confidence;
        });

    // La suma del criterio secundario sobre toda la asignación queda por
    // debajo de un paso de COST_RESOLUTION: solo decide entre costos iguales
    const double tie_weight = COST_RESOLUTION / static_cast<double>(num_dets + 1);

    cv::Mat1d cost(static_cast<int>(num_tracks), static_cast<int>(num_dets),
                   Hungarian::FORBIDDEN);

    for (size_t t = 0; t < num_tracks; t++) {
        for (size_t c = 0; c < num_dets; c++) {
            const Detection& det = detections[column_order[c]];
            auto primary = cost_fn->cost(predicted_boxes[t], det);
            if (!primary || !std::isfinite(*primary)) continue;

            double quantized = std::round(static_cast<double>(*primary) / COST_RESOLUTION) *
                               COST_RESOLUTION;
            double secondary = tie_weight *
                (1.0 - std::clamp(static_cast<double>(det.confidence), 0.0, 1.0));
            cost(static_cast<int>(t), static_cast<int>(c)) = quantized + secondary;
        }
    }

    std::vector<int> assignment = Hungarian::solve(cost);

    AssociationResult result;
    std::vector<bool> det_matched(num_dets, false);

    for (size_t t = 0; t < num_tracks; t++) {
        int col = assignment[t];
        if (col < 0) {
            result.unmatched_tracks.push_back(static_cast<int>(t));
            continue;
        }
        int det_idx = column_order[col];
        result.matches.emplace_back(static_cast<int>(t), det_idx);
        det_matched[det_idx] = true;
    }

    for (size_t d = 0; d < num_dets; d++) {
        if (!det_matched[d]) {
            result.unmatched_detections.push_back(static_cast<int>(d));
        }
    }

    // matches ya salen ordenados por track_idx
    return result;
}
