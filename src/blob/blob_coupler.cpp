#include "blob/blob_coupler.h"
#include "util/geometry.h"
#include <algorithm>

namespace blob {

    struct Pair {
        int dark;
        int bright;
        float dist;
    };

    CouplingResult couple_blobs(const std::vector<detect::Blob>& dark,
                                const std::vector<detect::Blob>& bright,
                                const CouplingParams& p)
    {
        CouplingResult res;
        if (dark.empty() || bright.empty()) {
            res.uncoupled_dark = dark;
            res.uncoupled_bright = bright;
            return res;
        }

        std::vector<Pair> pairs;
        for (int i = 0; i < (int)dark.size(); ++i) {
            for (int j = 0; j < (int)bright.size(); ++j) {
                float d = util::distance(dark[i].centroid, bright[j].centroid);
                if (d <= p.max_distance) pairs.push_back({i, j, d});
            }
        }

        // ties: dark index, then bright index (pairs are generated in that order)
        std::stable_sort(pairs.begin(), pairs.end(),
                         [](const Pair& a, const Pair& b){ return a.dist < b.dist; });

        std::vector<char> dark_used(dark.size(), 0);
        std::vector<char> bright_used(bright.size(), 0);

        for (const auto& pr : pairs) {
            if (dark_used[pr.dark] || bright_used[pr.bright]) continue;
            dark_used[pr.dark] = 1;
            bright_used[pr.bright] = 1;

            detect::Blob c = dark[pr.dark];
            c.confidence = dark[pr.dark].confidence * p.boost;
            c.kind = detect::BlobKind::Coupled;
            c.coupled_with = pr.bright;
            res.coupled.push_back(c);
        }

        for (int i = 0; i < (int)dark.size(); ++i)
            if (!dark_used[i]) res.uncoupled_dark.push_back(dark[i]);
        for (int j = 0; j < (int)bright.size(); ++j)
            if (!bright_used[j]) res.uncoupled_bright.push_back(bright[j]);

        return res;
    }

} // namespace blob
