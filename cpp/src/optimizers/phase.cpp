#include "bbox_minimizer/optimizers/phase.hpp"
#include <exception>
#include <sstream>

namespace bbox_minimizer {

Rotation SearchContext::pin(const Rotation& rotation) const {
    if (!config.z_only) {
        return rotation;
    }
    const Rotation& initial = state.initial_rotation();
    return Rotation{initial.x, initial.y, rotation.z};
}

Rotation SearchContext::offset_rotation(const Vec3& offset_deg) const {
    const Rotation& initial = state.initial_rotation();
    if (config.z_only) {
        return Rotation{initial.x, initial.y, initial.z + offset_deg.z * DEG_TO_RAD};
    }
    return compose(initial, Rotation::from_degrees(offset_deg));
}

bool SearchContext::try_absolute(const Rotation& rotation) {
    return evaluate(pin(rotation));
}

bool SearchContext::try_offset(const Vec3& offset_deg) {
    return evaluate(offset_rotation(offset_deg));
}

bool SearchContext::evaluate(const Rotation& rotation) {
    try {
        geometry.apply_rotation(rotation);
        const AabbMetrics metrics = geometry.measure_aabb();
        const bool improved = state.maybe_update_best(rotation, metrics.volume);
        if (improved && logger.enabled(LogLevel::Debug)) {
            std::ostringstream oss;
            oss << "new best " << metrics.volume << " at " << rotation.to_string();
            logger.debug("Search", oss.str());
        }
        return improved;
    } catch (const std::exception& e) {
        state.record_failure();
        logger.warn("Search", std::string("candidate ") + rotation.to_string() + " failed: " + e.what());
        return false;
    }
}

}  // namespace bbox_minimizer
