#include "OutlierBackend.h"

#include <algorithm>
#include <cmath>
#include <numeric>

BackendVerdict LocalOutlierFactorBackend::evaluate(const std::vector<double>& values,
                                                   double threshold,
                                                   const EngineTuning& tuning) const {
    const size_t n = values.size();
    BackendVerdict verdict;
    verdict.scores.assign(n, 1.0);
    verdict.flags.assign(n, false);
    if (n < 6) return verdict;

    const size_t k = std::min<size_t>(std::max<size_t>(1, tuning.lofNeighbors), n - 1);
    const double eps = tuning.numericEpsilon;

    std::vector<size_t> order(n);
    std::iota(order.begin(), order.end(), 0);
    std::sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        if (values[a] == values[b]) return a < b;
        return values[a] < values[b];
    });
    std::vector<size_t> pos(n);
    for (size_t rank = 0; rank < n; ++rank) pos[order[rank]] = rank;

    // In one dimension the k nearest neighbours are a contiguous window around the value's rank.
    std::vector<std::vector<size_t>> knn(n);
    std::vector<double> kDistance(n, 0.0);
    for (size_t obs = 0; obs < n; ++obs) {
        size_t left = pos[obs];
        size_t right = pos[obs] + 1;
        knn[obs].reserve(k);
        while (knn[obs].size() < k) {
            const bool leftAvailable = left > 0;
            const bool rightAvailable = right < n;
            if (!leftAvailable && !rightAvailable) break;
            if (!rightAvailable) {
                knn[obs].push_back(order[--left]);
            } else if (!leftAvailable) {
                knn[obs].push_back(order[right++]);
            } else {
                const double dl = std::abs(values[obs] - values[order[left - 1]]);
                const double dr = std::abs(values[obs] - values[order[right]]);
                if (dl <= dr) {
                    knn[obs].push_back(order[--left]);
                } else {
                    knn[obs].push_back(order[right++]);
                }
            }
        }
        double kd = 0.0;
        for (size_t neighbor : knn[obs]) kd = std::max(kd, std::abs(values[obs] - values[neighbor]));
        kDistance[obs] = kd;
    }

    std::vector<double> lrd(n, 0.0);
    for (size_t obs = 0; obs < n; ++obs) {
        double reachSum = 0.0;
        for (size_t neighbor : knn[obs]) {
            reachSum += std::max(kDistance[neighbor], std::abs(values[obs] - values[neighbor]));
        }
        lrd[obs] = (reachSum <= eps) ? 0.0 : static_cast<double>(knn[obs].size()) / reachSum;
    }

    for (size_t obs = 0; obs < n; ++obs) {
        if (lrd[obs] <= eps) continue;
        double ratioSum = 0.0;
        for (size_t neighbor : knn[obs]) ratioSum += lrd[neighbor] / lrd[obs];
        const double lof = ratioSum / static_cast<double>(knn[obs].size());
        verdict.scores[obs] = lof;
        verdict.flags[obs] = lof > threshold;
    }
    return verdict;
}

OutlierBackendSet OutlierBackendSet::withDefaults() {
    OutlierBackendSet set;
    set.registerBackend("local_outlier_factor", std::make_shared<LocalOutlierFactorBackend>());
    return set;
}

void OutlierBackendSet::registerBackend(const std::string& method, std::shared_ptr<const OutlierBackend> backend) {
    if (backends_.find(method) == backends_.end()) insertionOrder_.push_back(method);
    backends_[method] = std::move(backend);
}

std::shared_ptr<const OutlierBackend> OutlierBackendSet::find(const std::string& method) const {
    auto it = backends_.find(method);
    if (it == backends_.end()) return nullptr;
    return it->second;
}

std::vector<std::string> OutlierBackendSet::methods() const {
    return insertionOrder_;
}
