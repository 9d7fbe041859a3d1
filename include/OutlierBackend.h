#pragma once
#include "EngineConfig.h"

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

struct BackendVerdict {
    std::vector<double> scores;  // one per input value
    std::vector<bool> flags;     // one per input value
};

/// Pluggable density or isolation style detector working on one column's observed values.
class OutlierBackend {
public:
    virtual ~OutlierBackend() = default;

    virtual std::string name() const = 0;

    /// Capability check; an unavailable backend is reported instead of being substituted.
    virtual bool isAvailable() const { return true; }

    virtual double defaultThreshold(const EngineTuning& tuning) const = 0;

    /**
     * @brief Scores every value; higher scores are more anomalous.
     * @pre values holds finite numbers only.
     * @post scores.size() == flags.size() == values.size().
     * @throws Tally::TallyException subclasses propagate to the detect or treat caller.
     */
    virtual BackendVerdict evaluate(const std::vector<double>& values,
                                    double threshold,
                                    const EngineTuning& tuning) const = 0;
};

/// One-dimensional local outlier factor over sorted neighbourhoods.
class LocalOutlierFactorBackend : public OutlierBackend {
public:
    std::string name() const override { return "local_outlier_factor"; }
    double defaultThreshold(const EngineTuning& tuning) const override { return tuning.lofThreshold; }
    BackendVerdict evaluate(const std::vector<double>& values,
                            double threshold,
                            const EngineTuning& tuning) const override;
};

/**
 * @brief Method name -> backend lookup passed to each detect or treat call.
 * @details Holds no state beyond its registrations; callers build one per engine setup and share it read-only.
 */
class OutlierBackendSet {
public:
    /// Set with the built-in local_outlier_factor backend registered.
    static OutlierBackendSet withDefaults();

    void registerBackend(const std::string& method, std::shared_ptr<const OutlierBackend> backend);
    std::shared_ptr<const OutlierBackend> find(const std::string& method) const;
    std::vector<std::string> methods() const;

private:
    std::unordered_map<std::string, std::shared_ptr<const OutlierBackend>> backends_;
    std::vector<std::string> insertionOrder_;
};
