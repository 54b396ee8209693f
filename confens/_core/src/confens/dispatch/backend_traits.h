#pragma once

namespace confens {

// ============================================================================
// Backend Tag Types (for compile-time dispatch)
// ============================================================================

/**
 * Portable scalar backend.
 *
 * Numeric primitives (kabsch, rmsd) are templates over a backend tag so that
 * vectorized specializations can be added next to the scalar one without
 * touching the ensemble code that calls them.
 */
struct ScalarBackend {};

}  // namespace confens
