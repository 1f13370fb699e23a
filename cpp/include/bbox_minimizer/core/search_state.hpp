#pragma once

#include "rotation.hpp"
#include <chrono>
#include <cstdint>
#include <limits>

namespace bbox_minimizer {

// Best-so-far tracking for one optimize() call
class SearchState {
public:
    using Clock = std::chrono::steady_clock;

    SearchState() = default;
    SearchState(const Rotation& initial_rotation, double initial_volume, double max_time,
                double improvement_tolerance = 1e-9);

    // Record an evaluated candidate. Returns true if it became the new best.
    bool maybe_update_best(const Rotation& rotation, double volume);

    void record_failure() { ++failures_; }

    // Budget
    [[nodiscard]] double elapsed_seconds() const;
    [[nodiscard]] bool deadline_passed() const { return elapsed_seconds() >= max_time_; }

    // Getters
    [[nodiscard]] const Rotation& initial_rotation() const { return initial_rotation_; }
    [[nodiscard]] double initial_volume() const { return initial_volume_; }
    [[nodiscard]] const Rotation& best_rotation() const { return best_rotation_; }
    [[nodiscard]] double best_volume() const { return best_volume_; }
    [[nodiscard]] uint64_t attempts() const { return attempts_; }
    [[nodiscard]] uint64_t failures() const { return failures_; }
    [[nodiscard]] uint64_t improvements() const { return improvements_; }
    [[nodiscard]] double improvement_tolerance() const { return tolerance_; }

    // Percentage by which the best volume undercuts the initial one; 0 when
    // the initial volume is 0
    [[nodiscard]] double reduction_percent() const;

private:
    Rotation initial_rotation_{};
    double initial_volume_{0.0};
    Rotation best_rotation_{};
    double best_volume_{std::numeric_limits<double>::infinity()};

    uint64_t attempts_{0};
    uint64_t failures_{0};
    uint64_t improvements_{0};

    double max_time_{std::numeric_limits<double>::infinity()};
    double tolerance_{1e-9};
    Clock::time_point start_{Clock::now()};
};

}  // namespace bbox_minimizer
