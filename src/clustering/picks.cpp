#include "photo_triage/clustering/clustering_engine.hpp"

#include <algorithm>
#include <limits>

namespace photo_triage::clustering {

void assign_picks(std::vector<Burst>& bursts,
                  const std::map<std::string, double>& scores,
                  const std::map<std::string, std::vector<fs::path>>& paths_by_fingerprint) {
    for (auto& b : bursts) {
        if (b.fingerprints.empty()) {
            continue;
        }

        const std::string* best = nullptr;
        bool best_scored = false;
        double best_score = std::numeric_limits<double>::infinity();
        for (const auto& fp : b.fingerprints) {
            auto it = scores.find(fp);
            const bool scored = it != scores.end();
            const double s = scored ? it->second : std::numeric_limits<double>::infinity();

            bool better = false;
            if (best == nullptr) {
                better = true;
            } else if (scored != best_scored) {
                better = scored;
            } else if (scored && s != best_score) {
                better = s < best_score;
            } else {
                better = fp < *best;
            }
            if (better) {
                best = &fp;
                best_scored = scored;
                best_score = s;
            }
        }

        b.pick_fingerprint = *best;
        b.pick_path.clear();
        auto pit = paths_by_fingerprint.find(b.pick_fingerprint);
        if (pit != paths_by_fingerprint.end() && !pit->second.empty()) {
            b.pick_path = *std::min_element(pit->second.begin(), pit->second.end());
        }
    }
}

} // namespace photo_triage::clustering
