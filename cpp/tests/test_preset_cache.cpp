#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "bbox_minimizer/learning/preset_cache.hpp"

using namespace bbox_minimizer;
using Catch::Approx;

TEST_CASE("Preset cache per object", "[presets]") {
    PresetCache cache;
    REQUIRE(cache.empty());
    REQUIRE(cache.presets_for("bracket", "part").empty());

    cache.save_rotation("bracket", "part", Vec3(0, 0, 45), 20.0);
    cache.save_rotation("bracket", "part", Vec3(90, 0, 0), 55.0);
    cache.save_rotation("bracket", "part", Vec3(0, 90, 0), 20.0);
    cache.save_rotation("bracket", "fixture", Vec3(180, 0, 0), 99.0);

    SECTION("Best reduction first, ties in insertion order") {
        const auto presets = cache.presets_for("bracket", "part");
        REQUIRE(presets.size() == 3);
        REQUIRE(presets[0] == Vec3(90, 0, 0));
        REQUIRE(presets[1] == Vec3(0, 0, 45));
        REQUIRE(presets[2] == Vec3(0, 90, 0));
    }

    SECTION("Type is part of the key") {
        REQUIRE(cache.object_count() == 2);
        REQUIRE(cache.presets_for("bracket", "fixture") == std::vector<Vec3>{Vec3(180, 0, 0)});
        REQUIRE(PresetCache::make_key("bracket", "fixture") == "fixture:bracket");
    }

    SECTION("Entries keep their data") {
        const auto* entries = cache.entries("bracket", "part");
        REQUIRE(entries != nullptr);
        REQUIRE(entries->size() == 3);
        REQUIRE((*entries)[1].reduction_percent == 55.0);
        REQUIRE((*entries)[0].sequence < (*entries)[2].sequence);
        REQUIRE((*entries)[0].timestamp > 0.0);
    }

    SECTION("Forget") {
        REQUIRE(cache.forget("bracket", "part"));
        REQUIRE(cache.presets_for("bracket", "part").empty());
        REQUIRE_FALSE(cache.forget("bracket", "part"));
        REQUIRE(cache.object_count() == 1);

        // Statistics outlive the object
        REQUIRE(cache.statistics(Vec3(90, 0, 0)).has_value());
    }

    SECTION("Clear") {
        cache.clear();
        REQUIRE(cache.empty());
        REQUIRE_FALSE(cache.statistics(Vec3(90, 0, 0)).has_value());
    }
}

TEST_CASE("Preset cache statistics", "[presets]") {
    PresetCache cache;
    cache.save_rotation("a", "part", Vec3(0, 0, 90), 10.0);
    cache.save_rotation("b", "part", Vec3(0, 0, 90), 30.0);

    auto stats = cache.statistics(Vec3(0, 0, 90));
    REQUIRE(stats.has_value());
    REQUIRE(stats->count == 2);
    REQUIRE(stats->total_reduction == Approx(40.0));
    REQUIRE(stats->average_reduction == Approx(20.0));

    REQUIRE_FALSE(cache.statistics(Vec3(0, 0, 91)).has_value());
}

TEST_CASE("Common presets", "[presets]") {
    PresetCache cache;
    // (0, 0, 45) first seen before (90, 0, 0); both used three times
    cache.save_rotation("a", "part", Vec3(0, 0, 45), 10.0);
    cache.save_rotation("b", "part", Vec3(90, 0, 0), 10.0);
    cache.save_rotation("c", "part", Vec3(90, 0, 0), 10.0);
    cache.save_rotation("d", "part", Vec3(0, 0, 45), 10.0);
    cache.save_rotation("e", "part", Vec3(90, 0, 0), 10.0);
    cache.save_rotation("f", "part", Vec3(0, 0, 45), 10.0);
    // Used four times
    for (const char* name : {"g", "h", "i", "j"}) {
        cache.save_rotation(name, "tool", Vec3(0, 90, 0), 10.0);
    }
    // Used once
    cache.save_rotation("k", "part", Vec3(180, 0, 0), 10.0);

    SECTION("Most frequent first") {
        const auto common = cache.common_presets();
        REQUIRE(common.size() == 3);
        REQUIRE(common[0] == Vec3(0, 90, 0));
        REQUIRE(common[1] == Vec3(0, 0, 45));
        REQUIRE(common[2] == Vec3(90, 0, 0));
    }

    SECTION("Threshold") {
        REQUIRE(cache.common_presets(4).size() == 1);
        REQUIRE(cache.common_presets(1).size() == 4);
        REQUIRE(cache.common_presets(5).empty());
    }

    SECTION("Forgotten objects no longer count") {
        cache.forget("f", "part");
        const auto common = cache.common_presets();
        REQUIRE(common.size() == 2);
        REQUIRE(common[1] == Vec3(90, 0, 0));
    }
}
