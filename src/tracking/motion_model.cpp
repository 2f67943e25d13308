// ============= src/tracking/motion_model.cpp =============
#include "tracking/motion_model.hpp"
#include <algorithm>
#include <cmath>

namespace {

constexpr float MIN_HEIGHT = 1.0f;
constexpr float MIN_ASPECT = 1e-3f;
constexpr float MIN_NOISE_SCALE = 0.05f;

float safe_height(const cv::Matx<float, 8, 1>& mean) {
    return std::max(mean(3), MIN_HEIGHT);
}

}  // namespace

float MotionState::uncertainty() const {
    return std::sqrt(covariance(0, 0) + covariance(1, 1) + covariance(3, 3));
}

KalmanBoxModel::KalmanBoxModel(float std_weight_position, float std_weight_velocity)
    : std_weight_position(std_weight_position),
      std_weight_velocity(std_weight_velocity)
{
    // Constant velocity, dt = 1 frame
    transition = cv::Matx<float, 8, 8>::eye();
    for (int i = 0; i < 4; ++i) {
        transition(i, i + 4) = 1.0f;
    }

    measurement = cv::Matx<float, 4, 8>::zeros();
    for (int i = 0; i < 4; ++i) {
        measurement(i, i) = 1.0f;
    }
}

cv::Matx<float, 4, 1> KalmanBoxModel::to_xyah(const cv::Rect2f& box) {
    float h = std::max(box.height, MIN_HEIGHT);
    return cv::Matx<float, 4, 1>(
        box.x + box.width / 2.0f,
        box.y + box.height / 2.0f,
        std::max(box.width / h, MIN_ASPECT),
        h
    );
}

cv::Rect2f KalmanBoxModel::to_box(const MotionState& state) const {
    float a = std::max(state.mean(2), MIN_ASPECT);
    float h = safe_height(state.mean);
    float w = a * h;
    return cv::Rect2f(state.mean(0) - w / 2.0f, state.mean(1) - h / 2.0f, w, h);
}

// ==================== INITIATE ====================

MotionState KalmanBoxModel::initiate(const cv::Rect2f& box) const {
    auto z = to_xyah(box);

    MotionState state;
    state.mean = cv::Matx<float, 8, 1>::zeros();
    for (int i = 0; i < 4; ++i) {
        state.mean(i) = z(i);
    }

    // Velocidad desconocida: varianza inicial alta en los canales de velocidad
    float h = z(3);
    cv::Matx<float, 8, 1> std_dev(
        2.0f * std_weight_position * h,
        2.0f * std_weight_position * h,
        1e-2f,
        2.0f * std_weight_position * h,
        10.0f * std_weight_velocity * h,
        10.0f * std_weight_velocity * h,
        1e-5f,
        10.0f * std_weight_velocity * h
    );

    state.covariance = cv::Matx<float, 8, 8>::diag(std_dev.mul(std_dev));
    return state;
}

// ==================== PREDICT ====================

MotionState KalmanBoxModel::predict(const MotionState& state) const {
    float h = safe_height(state.mean);
    cv::Matx<float, 8, 1> std_dev(
        std_weight_position * h,
        std_weight_position * h,
        1e-2f,
        std_weight_position * h,
        std_weight_velocity * h,
        std_weight_velocity * h,
        1e-5f,
        std_weight_velocity * h
    );
    auto process_noise = cv::Matx<float, 8, 8>::diag(std_dev.mul(std_dev));

    MotionState predicted;
    predicted.mean = transition * state.mean;
    predicted.covariance = transition * state.covariance * transition.t() + process_noise;

    // Evitar cajas con altura o aspecto negativos tras extrapolar
    predicted.mean(2) = std::max(predicted.mean(2), MIN_ASPECT);
    predicted.mean(3) = std::max(predicted.mean(3), MIN_HEIGHT);

    return predicted;
}

// ==================== UPDATE ====================

MotionState KalmanBoxModel::update(const MotionState& state,
                                   const cv::Rect2f& observed,
                                   float confidence) const
{
    float h = safe_height(state.mean);
    cv::Matx<float, 4, 1> std_dev(
        std_weight_position * h,
        std_weight_position * h,
        1e-1f,
        std_weight_position * h
    );

    float noise_scale = std::clamp(1.0f - confidence, MIN_NOISE_SCALE, 1.0f);
    auto measurement_noise = cv::Matx<float, 4, 4>::diag(std_dev.mul(std_dev)) * noise_scale;

    cv::Matx<float, 4, 1> projected_mean = measurement * state.mean;
    cv::Matx<float, 4, 4> projected_cov =
        measurement * state.covariance * measurement.t() + measurement_noise;

    cv::Matx<float, 8, 4> gain =
        state.covariance * measurement.t() * projected_cov.inv(cv::DECOMP_CHOLESKY);

    cv::Matx<float, 4, 1> innovation = to_xyah(observed) - projected_mean;

    MotionState updated;
    updated.mean = state.mean + gain * innovation;
    updated.covariance = (cv::Matx<float, 8, 8>::eye() - gain * measurement) * state.covariance;
    return updated;
}
