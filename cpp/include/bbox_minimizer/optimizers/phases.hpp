#pragma once

#include "phase.hpp"
#include "../alignment/pca_aligner.hpp"
#include <utility>

namespace bbox_minimizer {

// Learned presets, tried as offsets from the initial orientation
class PresetPhase : public SearchPhase {
public:
    [[nodiscard]] std::string_view name() const override { return "presets"; }
    [[nodiscard]] bool enabled(const SearchContext& context) const override;
    void run(SearchContext& context) override;
    [[nodiscard]] PhasePtr clone() const override { return std::make_unique<PresetPhase>(); }
};

// Coarse 45 degree grid (15 degree Z sweep in z_only mode), as offsets
class CoarsePhase : public SearchPhase {
public:
    [[nodiscard]] std::string_view name() const override { return "coarse"; }
    void run(SearchContext& context) override;
    [[nodiscard]] PhasePtr clone() const override { return std::make_unique<CoarsePhase>(); }
};

enum class GridLevel {
    Medium,
    Fine
};

// Regular grid around the current best, as absolute rotations
class GridPhase : public SearchPhase {
public:
    explicit GridPhase(GridLevel level) : level_(level) {}

    [[nodiscard]] std::string_view name() const override {
        return level_ == GridLevel::Medium ? "medium" : "fine";
    }
    void run(SearchContext& context) override;
    [[nodiscard]] PhasePtr clone() const override { return std::make_unique<GridPhase>(level_); }

    [[nodiscard]] GridLevel level() const { return level_; }

private:
    GridLevel level_;
};

// PCA alignment and its 90 degree variants, as absolute rotations.
// Disabled in z_only mode and when use_pca_initial_guess is off.
class PcaPhase : public SearchPhase {
public:
    explicit PcaPhase(PcaAligner aligner) : aligner_(std::move(aligner)) {}

    [[nodiscard]] std::string_view name() const override { return "pca"; }
    [[nodiscard]] bool enabled(const SearchContext& context) const override;
    void run(SearchContext& context) override;
    [[nodiscard]] PhasePtr clone() const override { return std::make_unique<PcaPhase>(aligner_); }

private:
    PcaAligner aligner_;
};

/**
 * Greedy coordinate descent on the Euler angles.
 *
 * For each step size (largest first) every axis is nudged by +step then
 * -step; a move is kept only when it shrinks the volume by more than the
 * improvement tolerance. Sweeps repeat at the same step until one makes no
 * progress or the sweep cap is hit.
 */
class LocalRefinePhase : public SearchPhase {
public:
    [[nodiscard]] std::string_view name() const override { return "local_refine"; }
    void run(SearchContext& context) override;
    [[nodiscard]] PhasePtr clone() const override { return std::make_unique<LocalRefinePhase>(); }
};

}  // namespace bbox_minimizer
