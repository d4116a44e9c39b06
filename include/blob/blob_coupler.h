#pragma once

#include <vector>
#include "detect/blob.h"

namespace blob {

    struct CouplingParams {
        float max_distance = 100.0f;  // pair if centroids closer (<=)
        float boost        = 1.3f;    // confidence multiplier for coupled blobs
    };

    struct CouplingResult {
        std::vector<detect::Blob> coupled;
        std::vector<detect::Blob> uncoupled_dark;
        std::vector<detect::Blob> uncoupled_bright;
    };

    // Shadow/reflection pairing.
    // Greedy bipartite matching on centroid distance: all pairs within
    // max_distance, ascending, each blob used at most once.
    CouplingResult couple_blobs(const std::vector<detect::Blob>& dark,
                                const std::vector<detect::Blob>& bright,
                                const CouplingParams& p);

} // namespace blob
