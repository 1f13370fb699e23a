#pragma once

#include <cstddef>
#include <vector>

namespace bbox_minimizer {

// Tuning of the PCA orientation heuristics. The defaults are empirical and
// may need adjusting per mesh category.
struct PcaConfig {
    // Fraction of the height, measured from the lowest point, that forms the
    // floor slice used to decide which end of the object is down.
    double floor_slice_fraction{0.10};
    // Floor slices with fewer points than this score 0.
    size_t min_floor_points{3};
    // Pitch sweep around the width axis: [-range, +range] in `step` increments.
    double pitch_range_deg{5.0};
    double pitch_step_deg{0.2};

    // Throws std::invalid_argument on out-of-range values
    void validate() const;
};

struct OptimizerConfig {
    // Local refine step sizes in degrees, largest first
    std::vector<double> adaptive_steps{5.0, 2.0, 1.0, 0.5, 0.2, 0.1};
    std::vector<double> fast_adaptive_steps{5.0, 1.0, 0.1};

    bool use_pca_initial_guess{true};
    bool fast_mode{false};
    // Rotate about Z only, keeping the object upright
    bool z_only{false};

    // Wall-clock budget in seconds, checked before each phase
    double max_time{600.0};

    // Only the first `max_presets` learned presets are tried
    size_t max_presets{10};

    // Local refine sweeps per step size
    int max_refine_sweeps{30};
    int fast_max_refine_sweeps{10};

    // A candidate replaces the incumbent only if it is smaller by more than this
    double improvement_tolerance{1e-9};

    // Meshes with more vertices switch to fast mode automatically (0 disables)
    size_t auto_fast_mode_vertex_threshold{50000};

    PcaConfig pca{};

    // Throws std::invalid_argument on out-of-range values
    void validate() const;
};

}  // namespace bbox_minimizer
