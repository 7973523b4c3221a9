#pragma once

/// @file distribution_comparator.h
/// @brief Runs the two-sample KS test over every retained feature

#include <vector>

#include "common/thread_pool.h"
#include "drift/dataset_loader.h"
#include "drift/drift_classifier.h"
#include "drift/drift_types.h"

namespace driftscope::drift {

/// @brief Compares reference and production samples feature by feature
///
/// Features are independent: with a thread pool each comparison runs as its
/// own task, and results are returned in schema order either way. A feature
/// with an empty sample is reported as degenerate rather than failing the
/// batch.
class DistributionComparator {
public:
    /// @param threshold p-value cutoff applied to every feature
    /// @param pool Optional pool for concurrent comparisons; not owned
    explicit DistributionComparator(double threshold, ThreadPool* pool = nullptr);

    /// @brief Compare all features of a loaded dataset pair
    std::vector<FeatureDriftResult> CompareAll(const LoadedDatasets& datasets) const;

    /// @brief Compare a single feature
    FeatureDriftResult Compare(const FeatureSamples& samples) const;

private:
    DriftClassifier classifier_;
    ThreadPool* pool_;
};

}  // namespace driftscope::drift
