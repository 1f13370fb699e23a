#include "bbox_minimizer/core/search_state.hpp"

namespace bbox_minimizer {

SearchState::SearchState(const Rotation& initial_rotation, double initial_volume, double max_time,
                         double improvement_tolerance)
    : initial_rotation_(initial_rotation)
    , initial_volume_(initial_volume)
    , best_rotation_(initial_rotation)
    , best_volume_(initial_volume)
    , max_time_(max_time)
    , tolerance_(improvement_tolerance)
{}

bool SearchState::maybe_update_best(const Rotation& rotation, double volume) {
    ++attempts_;
    if (volume < best_volume_ - tolerance_) {
        best_volume_ = volume;
        best_rotation_ = rotation;
        ++improvements_;
        return true;
    }
    return false;
}

double SearchState::elapsed_seconds() const {
    return std::chrono::duration<double>(Clock::now() - start_).count();
}

double SearchState::reduction_percent() const {
    if (initial_volume_ <= 0.0) {
        return 0.0;
    }
    return (initial_volume_ - best_volume_) / initial_volume_ * 100.0;
}

}  // namespace bbox_minimizer
