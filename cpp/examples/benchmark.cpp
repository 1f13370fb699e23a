#include <iostream>
#include <string>
#include <chrono>
#include <cmath>
#include "bbox_minimizer/bbox_minimizer.hpp"

using namespace bbox_minimizer;

namespace {

// Points on the surface of an ellipsoid, deterministic spiral layout
PointCloud make_ellipsoid(size_t n, double a, double b, double c) {
    PointCloud points;
    points.reserve(n);
    const double golden = PI * (3.0 - std::sqrt(5.0));
    for (size_t i = 0; i < n; ++i) {
        const double t = 1.0 - 2.0 * (static_cast<double>(i) + 0.5) / static_cast<double>(n);
        const double r = std::sqrt(1.0 - t * t);
        const double phi = golden * static_cast<double>(i);
        points.push_back(Vec3{a * r * std::cos(phi), b * r * std::sin(phi), c * t});
    }
    return points;
}

}  // namespace

int main(int argc, char** argv) {
    size_t num_points = 20000;
    int num_evals = 2000;
    if (argc > 1) {
        try {
            num_points = static_cast<size_t>(std::stoul(argv[1]));
        } catch (const std::exception&) {
            std::cerr << "Invalid point count, using default.\n";
        }
    }
    if (argc > 2) {
        try {
            num_evals = std::stoi(argv[2]);
        } catch (const std::exception&) {
            std::cerr << "Invalid evaluation count, using default.\n";
        }
    }

    const PointCloud points = make_ellipsoid(num_points, 8.0, 3.0, 1.0);
    const Rotation initial = Rotation::from_degrees(30.0, 15.0, -50.0);

    std::cout << "[Setup]\n";
    std::cout << "Points:          " << points.size() << "\n";
    std::cout << "Initial volume:  " << evaluate_volume(points, initial) << "\n";

    // Raw candidate evaluation throughput
    {
        const RotationGenerator generator;
        const std::vector<Vec3> candidates = generator.generate_coarse();

        auto start = std::chrono::high_resolution_clock::now();
        double sink = 0.0;
        for (int i = 0; i < num_evals; ++i) {
            const Vec3& deg = candidates[static_cast<size_t>(i) % candidates.size()];
            sink += evaluate_volume(points, compose(initial, Rotation::from_degrees(deg)));
        }
        auto end = std::chrono::high_resolution_clock::now();
        const double seconds = std::chrono::duration<double>(end - start).count();

        std::cout << "\n[Evaluation]\n";
        std::cout << "Evaluations:     " << num_evals << "\n";
        std::cout << "Time:            " << seconds << " s\n";
        std::cout << "Evals/sec:       " << (seconds > 0.0 ? num_evals / seconds : 0.0) << "\n";
        std::cout << "Checksum:        " << sink << "\n";
    }

    auto benchmark = [&](const std::string& name, const OptimizerConfig& config) {
        const RotationOptimizer optimizer(config);
        const OptimizationResult result = optimizer.optimize_points(points, initial);

        std::cout << "\n[" << name << "]\n";
        std::cout << "Best volume:     " << result.best_volume << "\n";
        std::cout << "Reduction:       " << result.reduction_percent << "%\n";
        std::cout << "Attempts:        " << result.attempts << "\n";
        std::cout << "Time:            " << result.elapsed_seconds << " s\n";
        std::cout << "Attempts/sec:    "
                  << (result.elapsed_seconds > 0.0 ? static_cast<double>(result.attempts) / result.elapsed_seconds : 0.0)
                  << "\n";
    };

    OptimizerConfig full;
    OptimizerConfig fast;
    fast.fast_mode = true;
    OptimizerConfig no_pca;
    no_pca.use_pca_initial_guess = false;

    benchmark("Full", full);
    benchmark("Fast", fast);
    benchmark("No PCA", no_pca);

    // Batch across independent meshes
    {
        std::vector<PointCloud> meshes(8, points);
        const std::vector<Rotation> starts(meshes.size(), initial);
        const RotationOptimizer optimizer(fast);

        auto start = std::chrono::high_resolution_clock::now();
        const auto results = optimizer.optimize_batch(meshes, starts);
        auto end = std::chrono::high_resolution_clock::now();

        std::cout << "\n[Batch]\n";
        std::cout << "Meshes:          " << results.size() << "\n";
        std::cout << "Time:            " << std::chrono::duration<double>(end - start).count() << " s\n";
    }

    return 0;
}
