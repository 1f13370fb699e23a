#pragma once

// Core types and structures
#include "core/types.hpp"
#include "core/rotation.hpp"
#include "core/point_cloud.hpp"
#include "core/config.hpp"
#include "core/geometry_provider.hpp"
#include "core/search_state.hpp"

// Geometry
#include "geometry/aabb.hpp"

// Candidate generation and alignment
#include "search/rotation_generator.hpp"
#include "alignment/pca_aligner.hpp"

// Optimizers
#include "optimizers/phase.hpp"
#include "optimizers/phases.hpp"
#include "optimizers/rotation_optimizer.hpp"

// Learned presets
#include "learning/preset_cache.hpp"

// Logging
#include "util/logger.hpp"
