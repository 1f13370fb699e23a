#include "bbox_minimizer/learning/preset_cache.hpp"
#include <algorithm>
#include <chrono>
#include <iterator>

namespace bbox_minimizer {

std::string PresetCache::make_key(std::string_view name, std::string_view type) {
    std::string key;
    key.reserve(type.size() + name.size() + 1);
    key.append(type);
    key.push_back(':');
    key.append(name);
    return key;
}

void PresetCache::save_rotation(std::string_view name, std::string_view type, const Vec3& rotation_deg,
                                double reduction_percent) {
    const double now = std::chrono::duration<double>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    rotations_[make_key(name, type)].push_back(
        PresetEntry{rotation_deg, reduction_percent, now, next_sequence_++});

    auto it = std::find_if(statistics_.begin(), statistics_.end(),
                           [&](const StatsSlot& slot) { return slot.rotation_deg == rotation_deg; });
    if (it == statistics_.end()) {
        statistics_.push_back(StatsSlot{rotation_deg, {}});
        it = std::prev(statistics_.end());
    }
    PresetStatistics& stats = it->stats;
    stats.count += 1;
    stats.total_reduction += reduction_percent;
    stats.average_reduction = stats.total_reduction / static_cast<double>(stats.count);
}

std::vector<Vec3> PresetCache::presets_for(std::string_view name, std::string_view type) const {
    const auto it = rotations_.find(make_key(name, type));
    if (it == rotations_.end()) {
        return {};
    }

    std::vector<PresetEntry> sorted = it->second;
    std::stable_sort(sorted.begin(), sorted.end(), [](const PresetEntry& a, const PresetEntry& b) {
        return a.reduction_percent > b.reduction_percent;
    });

    std::vector<Vec3> result;
    result.reserve(sorted.size());
    for (const auto& entry : sorted) {
        result.push_back(entry.rotation_deg);
    }
    return result;
}

std::vector<Vec3> PresetCache::common_presets(size_t min_samples) const {
    struct Tally {
        Vec3 rotation_deg;
        size_t count;
        uint64_t first_sequence;
    };

    std::vector<Tally> tallies;
    for (const auto& [key, entries] : rotations_) {
        for (const auto& entry : entries) {
            auto it = std::find_if(tallies.begin(), tallies.end(),
                                   [&](const Tally& t) { return t.rotation_deg == entry.rotation_deg; });
            if (it == tallies.end()) {
                tallies.push_back(Tally{entry.rotation_deg, 1, entry.sequence});
            } else {
                it->count += 1;
                it->first_sequence = std::min(it->first_sequence, entry.sequence);
            }
        }
    }

    std::sort(tallies.begin(), tallies.end(), [](const Tally& a, const Tally& b) {
        if (a.count != b.count) return a.count > b.count;
        return a.first_sequence < b.first_sequence;
    });

    std::vector<Vec3> result;
    for (const auto& tally : tallies) {
        if (tally.count >= min_samples) {
            result.push_back(tally.rotation_deg);
        }
    }
    return result;
}

bool PresetCache::forget(std::string_view name, std::string_view type) {
    return rotations_.erase(make_key(name, type)) > 0;
}

std::optional<PresetStatistics> PresetCache::statistics(const Vec3& rotation_deg) const {
    for (const auto& slot : statistics_) {
        if (slot.rotation_deg == rotation_deg) {
            return slot.stats;
        }
    }
    return std::nullopt;
}

const std::vector<PresetEntry>* PresetCache::entries(std::string_view name, std::string_view type) const {
    const auto it = rotations_.find(make_key(name, type));
    return it == rotations_.end() ? nullptr : &it->second;
}

void PresetCache::clear() {
    rotations_.clear();
    statistics_.clear();
    next_sequence_ = 0;
}

}  // namespace bbox_minimizer
