#include "bbox_minimizer/core/config.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

namespace bbox_minimizer {

namespace {

void validate_steps(const std::vector<double>& steps, const char* name) {
    if (steps.empty()) {
        throw std::invalid_argument(std::string(name) + " must not be empty");
    }
    for (double step : steps) {
        if (!std::isfinite(step) || step <= 0.0) {
            throw std::invalid_argument(std::string(name) + " must contain positive step sizes");
        }
    }
}

}  // namespace

void PcaConfig::validate() const {
    if (!(floor_slice_fraction > 0.0 && floor_slice_fraction <= 1.0)) {
        throw std::invalid_argument("pca.floor_slice_fraction must be in (0, 1]");
    }
    if (!std::isfinite(pitch_range_deg) || pitch_range_deg < 0.0) {
        throw std::invalid_argument("pca.pitch_range_deg must be non-negative");
    }
    if (!std::isfinite(pitch_step_deg) || pitch_step_deg <= 0.0) {
        throw std::invalid_argument("pca.pitch_step_deg must be positive");
    }
}

void OptimizerConfig::validate() const {
    validate_steps(adaptive_steps, "adaptive_steps");
    validate_steps(fast_adaptive_steps, "fast_adaptive_steps");

    if (std::isnan(max_time) || max_time < 0.0) {
        throw std::invalid_argument("max_time must be non-negative");
    }
    if (max_refine_sweeps < 1 || fast_max_refine_sweeps < 1) {
        throw std::invalid_argument("refine sweep caps must be at least 1");
    }
    if (!std::isfinite(improvement_tolerance) || improvement_tolerance < 0.0) {
        throw std::invalid_argument("improvement_tolerance must be non-negative");
    }
    pca.validate();
}

}  // namespace bbox_minimizer
