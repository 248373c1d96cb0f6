#pragma once

#include "request.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace pqgate {

// Model inputs, each normalised to [0, 1].
struct FeatureVector {
    double time_delta{0.0};
    double request_size{0.0};
    double signature_count{0.0};
    double data_complexity{0.0};
    double source_entropy{0.0};
    double velocity_score{0.0};
    double geo_anomaly{0.0};
    double behavior_score{0.0};
};

// Static, pre-trained linear model.
struct ModelWeights {
    double time_delta{-0.23};
    double request_size{0.15};
    double signature_count{-0.45};
    double data_complexity{0.18};
    double source_entropy{0.31};
    double velocity_score{0.52};
    double geo_anomaly{0.67};
    double behavior_score{0.41};
    double bias{-0.12};
};

// Partial replacement for update_weights(); unset fields keep their value.
struct ModelWeightsUpdate {
    std::optional<double> time_delta;
    std::optional<double> request_size;
    std::optional<double> signature_count;
    std::optional<double> data_complexity;
    std::optional<double> source_entropy;
    std::optional<double> velocity_score;
    std::optional<double> geo_anomaly;
    std::optional<double> behavior_score;
    std::optional<double> bias;
};

// Scores requests for fraud likelihood (0 = legitimate, 1 = fraudulent).
// Keeps a per-origin history of recent request timestamps for velocity;
// history updates for one origin are serialised on that origin's lock.
class FraudScorer {
public:
    static constexpr std::int64_t kHistoryWindowMs = 600000;
    static constexpr std::int64_t kVelocityWindowMs = 60000;
    static constexpr std::size_t kHistoryCap = 1000;
    static constexpr std::int64_t kHistorySweepIntervalMs = 60000;

    FraudScorer();
    explicit FraudScorer(const ModelWeights &weights);

    double analyze(const AuthenticationRequest &request);
    double analyze(const AuthenticationRequest &request, std::int64_t now_ms);

    // Features for request given the number of same-origin requests seen in
    // the trailing velocity window.
    static FeatureVector extract_features(const AuthenticationRequest &request,
                                          std::int64_t now_ms,
                                          std::size_t recent_requests);

    // sigmoid(bias + sum(w_i * f_i)), clamped to [0, 1].
    static double compute_score(const FeatureVector &features, const ModelWeights &weights);

    static double shannon_entropy(const std::string &text);
    static double velocity_from_count(std::size_t recent_requests);

    void update_weights(const ModelWeightsUpdate &update);
    ModelWeights weights() const;

    std::size_t history_size(const std::string &origin) const;
    std::size_t tracked_origins() const;

    // Drops timestamps older than the history window and forgets origins
    // left with none. analyze() runs this at most once per sweep interval.
    // Returns the number of origins removed.
    std::size_t purge_history(std::int64_t now_ms);

private:
    struct OriginHistory {
        std::mutex mutex;
        std::deque<std::int64_t> timestamps;
    };

    std::shared_ptr<OriginHistory> history_for(const std::string &key);
    void maybe_purge_history(std::int64_t now_ms);

    // Prunes, counts the trailing minute and appends, all under the origin
    // lock. Returns the count seen before this request was appended.
    std::size_t record_request(const AuthenticationRequest &request, std::int64_t now_ms);

    std::shared_ptr<const ModelWeights> weights_;
    std::mutex weights_writer_;

    mutable std::shared_mutex history_mutex_;
    std::unordered_map<std::string, std::shared_ptr<OriginHistory>> history_;
    std::atomic<std::int64_t> last_sweep_ms_{0};
};

} // namespace pqgate
