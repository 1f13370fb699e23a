#pragma once

#include "../core/types.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace bbox_minimizer {

// One successful optimization remembered for an object
struct PresetEntry {
    Vec3 rotation_deg{};
    double reduction_percent{0.0};
    double timestamp{0.0};   // seconds since epoch
    uint64_t sequence{0};    // insertion order across the cache
};

struct PresetStatistics {
    uint64_t count{0};
    double total_reduction{0.0};
    double average_reduction{0.0};
};

/**
 * In-memory store of rotations that worked well, keyed by object type and
 * name. Feeds the optimizer's preset phase.
 *
 * Rotations are compared exactly; callers typically store the rounded degree
 * triples they display.
 */
class PresetCache {
public:
    PresetCache() = default;

    void save_rotation(std::string_view name, std::string_view type, const Vec3& rotation_deg,
                       double reduction_percent);

    // Rotations saved for this object, best reduction first (stable for ties)
    [[nodiscard]] std::vector<Vec3> presets_for(std::string_view name, std::string_view type) const;

    /**
     * Rotations saved at least `min_samples` times across all objects, most
     * frequent first. Ties keep the order in which rotations were first saved.
     */
    [[nodiscard]] std::vector<Vec3> common_presets(size_t min_samples = 3) const;

    // Drop everything stored for an object. Statistics are kept.
    bool forget(std::string_view name, std::string_view type);

    [[nodiscard]] std::optional<PresetStatistics> statistics(const Vec3& rotation_deg) const;

    [[nodiscard]] const std::vector<PresetEntry>* entries(std::string_view name, std::string_view type) const;

    [[nodiscard]] size_t object_count() const { return rotations_.size(); }
    [[nodiscard]] bool empty() const { return rotations_.empty(); }
    void clear();

    // "type:name"
    [[nodiscard]] static std::string make_key(std::string_view name, std::string_view type);

private:
    struct StatsSlot {
        Vec3 rotation_deg;
        PresetStatistics stats;
    };

    std::unordered_map<std::string, std::vector<PresetEntry>> rotations_;
    std::vector<StatsSlot> statistics_;
    uint64_t next_sequence_{0};
};

}  // namespace bbox_minimizer
