#include "drift/distribution_comparator.h"

#include <future>

#include "common/logging.h"
#include "drift/ks_test.h"

namespace driftscope::drift {

DistributionComparator::DistributionComparator(double threshold, ThreadPool* pool)
    : classifier_(threshold), pool_(pool) {}

FeatureDriftResult DistributionComparator::Compare(const FeatureSamples& samples) const {
    const size_t n_ref = samples.reference.size();
    const size_t n_prod = samples.production.size();

    if (n_ref == 0 || n_prod == 0) {
        DRIFTSCOPE_LOG_WARN("DegenerateSample: feature '{}' has {} reference and {} "
                            "production values, reporting no drift",
                            samples.spec.name, n_ref, n_prod);
        return classifier_.Degenerate(samples.spec.name, n_ref, n_prod);
    }

    KsTestResult test = KolmogorovSmirnovTest(samples.reference, samples.production);
    FeatureDriftResult result =
        classifier_.Classify(samples.spec.name, samples.spec.kind, test, n_ref, n_prod);

    DRIFTSCOPE_LOG_DEBUG("KS {}: D={:.4f}, p={:.4g}, n=({}, {}), drifted={}",
                         result.feature_name, result.statistic, result.p_value,
                         n_ref, n_prod, result.drift_detected);
    return result;
}

std::vector<FeatureDriftResult> DistributionComparator::CompareAll(
    const LoadedDatasets& datasets) const {

    std::vector<FeatureDriftResult> results;
    results.reserve(datasets.samples.size());

    if (pool_ == nullptr || datasets.samples.size() < 2) {
        for (const auto& samples : datasets.samples) {
            results.push_back(Compare(samples));
        }
        return results;
    }

    std::vector<std::future<FeatureDriftResult>> pending;
    pending.reserve(datasets.samples.size());
    for (const auto& samples : datasets.samples) {
        pending.push_back(pool_->Submit([this, &samples]() { return Compare(samples); }));
    }
    for (auto& future : pending) {
        results.push_back(future.get());
    }
    return results;
}

}  // namespace driftscope::drift
