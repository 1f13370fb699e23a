#pragma once

#include "../core/types.hpp"
#include "../core/rotation.hpp"
#include "../core/config.hpp"
#include "../core/geometry_provider.hpp"
#include "../core/search_state.hpp"
#include "../search/rotation_generator.hpp"
#include "../util/logger.hpp"
#include <memory>
#include <span>
#include <string_view>

namespace bbox_minimizer {

class SearchPhase;

// Unique pointer alias for phases
using PhasePtr = std::unique_ptr<SearchPhase>;

/**
 * Everything a phase needs during one optimize() call.
 *
 * Candidates are evaluated by applying them on the geometry provider and
 * reading back the bounding box; the best-so-far lives in `state`.
 */
struct SearchContext {
    GeometryProvider& geometry;
    SearchState& state;
    const RotationGenerator& generator;
    const OptimizerConfig& config;
    Logger& logger;
    std::span<const Vec3> presets;  // degrees
    bool fast_mode{false};          // effective for this call

    // Apply `rotation` as the final orientation. Returns true on a new best.
    bool try_absolute(const Rotation& rotation);

    // Apply `offset_deg` on top of the initial orientation. Returns true on a
    // new best.
    bool try_offset(const Vec3& offset_deg);

    // Absolute rotation for an offset from the initial orientation
    [[nodiscard]] Rotation offset_rotation(const Vec3& offset_deg) const;

    // In z_only mode, replace X and Y with the initial orientation's
    [[nodiscard]] Rotation pin(const Rotation& rotation) const;

private:
    bool evaluate(const Rotation& rotation);
};

/**
 * One stage of the rotation search.
 *
 * Phases only ever report candidates to the search state; the state decides
 * what becomes the incumbent.
 */
class SearchPhase {
public:
    virtual ~SearchPhase() = default;

    [[nodiscard]] virtual std::string_view name() const = 0;

    // Whether the phase applies to this call (default: always)
    [[nodiscard]] virtual bool enabled(const SearchContext& context) const {
        (void)context;
        return true;
    }

    virtual void run(SearchContext& context) = 0;

    // Clone phase (deep copy)
    [[nodiscard]] virtual PhasePtr clone() const = 0;
};

}  // namespace bbox_minimizer
