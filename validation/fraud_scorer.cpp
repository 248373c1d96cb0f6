#include "fraud_scorer.hpp"

#include "../common/clock.hpp"

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <cmath>
#include <regex>

namespace pqgate {

namespace {

const std::regex &trusted_origin(std::size_t i) {
    static const std::array<std::regex, 3> patterns = {
        std::regex(R"(^https://[a-z0-9-]+\.gov\.uk)"),
        std::regex(R"(^10\.\d{1,3}\.\d{1,3}\.\d{1,3}$)"),
        std::regex(R"(^192\.168\.\d{1,3}\.\d{1,3}$)"),
    };
    return patterns[i];
}

const std::regex &recognized_region(std::size_t i) {
    static const std::array<std::regex, 4> patterns = {
        std::regex(R"(^81\.)"),
        std::regex(R"(^82\.)"),
        std::regex(R"(^185\.)"),
        std::regex(R"(^2a0[0-9a-f]:)", std::regex::icase),
    };
    return patterns[i];
}

double source_entropy(const AuthenticationRequest &request) {
    const std::string source = (request.metadata && !request.metadata->origin.empty())
        ? request.metadata->origin
        : "unknown";
    for (std::size_t i = 0; i < 3; ++i) {
        if (std::regex_search(source, trusted_origin(i))) {
            return 0.0;
        }
    }
    return 0.8;
}

double geo_anomaly(const AuthenticationRequest &request) {
    if (!request.metadata || request.metadata->ip_address.empty()) {
        return 0.0;
    }
    const std::string &ip = request.metadata->ip_address;
    for (std::size_t i = 0; i < 4; ++i) {
        if (std::regex_search(ip, recognized_region(i))) {
            return 0.0;
        }
    }
    return 0.3;
}

double behavior_score(const AuthenticationRequest &request) {
    double sum = 0.0;
    int flags = 0;

    // Suspiciously round timestamp.
    if (request.timestamp % 1000 == 0) {
        sum += 0.5;
        ++flags;
    }

    if (request.metadata && !request.metadata->user_agent.empty()) {
        std::string ua = request.metadata->user_agent;
        std::transform(ua.begin(), ua.end(), ua.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (ua.find("bot") != std::string::npos || ua.find("scraper") != std::string::npos) {
            sum += 0.8;
            ++flags;
        }
    }

    if (request.data.is_object() && request.data.size() > 50) {
        sum += 0.6;
        ++flags;
    }

    return flags > 0 ? sum / flags : 0.0;
}

} // namespace

FraudScorer::FraudScorer() : FraudScorer(ModelWeights{}) {}

FraudScorer::FraudScorer(const ModelWeights &weights)
    : weights_(std::make_shared<const ModelWeights>(weights)) {}

double FraudScorer::analyze(const AuthenticationRequest &request) {
    return analyze(request, now_ms());
}

double FraudScorer::analyze(const AuthenticationRequest &request, std::int64_t now) {
    maybe_purge_history(now);
    const std::size_t recent = record_request(request, now);
    const FeatureVector features = extract_features(request, now, recent);
    const std::shared_ptr<const ModelWeights> snapshot = std::atomic_load(&weights_);
    return compute_score(features, *snapshot);
}

FeatureVector FraudScorer::extract_features(const AuthenticationRequest &request,
                                            std::int64_t now,
                                            std::size_t recent_requests) {
    FeatureVector f;

    const double age = static_cast<double>(now - request.timestamp);
    f.time_delta = std::min(std::max(age, 0.0) / 300000.0, 1.0);

    const std::string serialized = auth_request_to_json(request).dump();
    f.request_size = std::min(static_cast<double>(serialized.size()) / 5000.0, 1.0);

    f.signature_count = std::min(static_cast<double>(request.signatures.size()) / 3.0, 1.0);

    f.data_complexity = std::min(shannon_entropy(request.data.dump()) / 6.0, 1.0);
    f.source_entropy = source_entropy(request);
    f.velocity_score = velocity_from_count(recent_requests);
    f.geo_anomaly = geo_anomaly(request);
    f.behavior_score = behavior_score(request);
    return f;
}

double FraudScorer::compute_score(const FeatureVector &f, const ModelWeights &w) {
    double x = w.bias;
    x += w.time_delta * f.time_delta;
    x += w.request_size * f.request_size;
    x += w.signature_count * f.signature_count;
    x += w.data_complexity * f.data_complexity;
    x += w.source_entropy * f.source_entropy;
    x += w.velocity_score * f.velocity_score;
    x += w.geo_anomaly * f.geo_anomaly;
    x += w.behavior_score * f.behavior_score;

    const double score = 1.0 / (1.0 + std::exp(-x));
    if (std::isnan(score)) {
        return 1.0;
    }
    return std::min(std::max(score, 0.0), 1.0);
}

double FraudScorer::shannon_entropy(const std::string &text) {
    if (text.empty()) {
        return 0.0;
    }
    std::array<std::size_t, 256> counts{};
    for (unsigned char c : text) {
        ++counts[c];
    }
    const double total = static_cast<double>(text.size());
    double entropy = 0.0;
    for (std::size_t count : counts) {
        if (count == 0) {
            continue;
        }
        const double p = static_cast<double>(count) / total;
        entropy -= p * std::log2(p);
    }
    return entropy;
}

double FraudScorer::velocity_from_count(std::size_t recent) {
    if (recent < 10) return 0.0;
    if (recent < 100) return static_cast<double>(recent - 10) / 90.0;
    return 1.0;
}

void FraudScorer::update_weights(const ModelWeightsUpdate &update) {
    // Writers are serialised so two partial updates cannot lose each other.
    std::lock_guard<std::mutex> lock(weights_writer_);
    ModelWeights next = *std::atomic_load(&weights_);
    if (update.time_delta) next.time_delta = *update.time_delta;
    if (update.request_size) next.request_size = *update.request_size;
    if (update.signature_count) next.signature_count = *update.signature_count;
    if (update.data_complexity) next.data_complexity = *update.data_complexity;
    if (update.source_entropy) next.source_entropy = *update.source_entropy;
    if (update.velocity_score) next.velocity_score = *update.velocity_score;
    if (update.geo_anomaly) next.geo_anomaly = *update.geo_anomaly;
    if (update.behavior_score) next.behavior_score = *update.behavior_score;
    if (update.bias) next.bias = *update.bias;
    std::atomic_store(&weights_, std::shared_ptr<const ModelWeights>(
        std::make_shared<const ModelWeights>(next)));
}

ModelWeights FraudScorer::weights() const {
    return *std::atomic_load(&weights_);
}

std::size_t FraudScorer::history_size(const std::string &origin) const {
    std::shared_ptr<OriginHistory> h;
    {
        std::shared_lock<std::shared_mutex> lock(history_mutex_);
        auto it = history_.find(origin);
        if (it == history_.end()) {
            return 0;
        }
        h = it->second;
    }
    std::lock_guard<std::mutex> lock(h->mutex);
    return h->timestamps.size();
}

std::size_t FraudScorer::tracked_origins() const {
    std::shared_lock<std::shared_mutex> lock(history_mutex_);
    return history_.size();
}

std::size_t FraudScorer::purge_history(std::int64_t now) {
    const std::int64_t history_floor = now - kHistoryWindowMs;
    std::size_t removed = 0;

    std::unique_lock<std::shared_mutex> lock(history_mutex_);
    for (auto it = history_.begin(); it != history_.end();) {
        const std::shared_ptr<OriginHistory> &h = it->second;
        bool empty = false;
        {
            std::lock_guard<std::mutex> origin_lock(h->mutex);
            auto &ts = h->timestamps;
            ts.erase(std::remove_if(ts.begin(), ts.end(),
                                    [history_floor](std::int64_t t) { return t <= history_floor; }),
                     ts.end());
            empty = ts.empty();
        }
        // A caller that already fetched this origin still holds a reference
        // and is about to append; keep the entry for it.
        if (empty && h.use_count() == 1) {
            it = history_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

void FraudScorer::maybe_purge_history(std::int64_t now) {
    std::int64_t last = last_sweep_ms_.load();
    if (now - last < kHistorySweepIntervalMs) {
        return;
    }
    if (last_sweep_ms_.compare_exchange_strong(last, now)) {
        purge_history(now);
    }
}

std::shared_ptr<FraudScorer::OriginHistory> FraudScorer::history_for(const std::string &key) {
    {
        std::shared_lock<std::shared_mutex> lock(history_mutex_);
        auto it = history_.find(key);
        if (it != history_.end()) {
            return it->second;
        }
    }
    std::unique_lock<std::shared_mutex> lock(history_mutex_);
    auto &slot = history_[key];
    if (!slot) {
        slot = std::make_shared<OriginHistory>();
    }
    return slot;
}

std::size_t FraudScorer::record_request(const AuthenticationRequest &request, std::int64_t now) {
    std::shared_ptr<OriginHistory> h = history_for(origin_key(request));
    std::lock_guard<std::mutex> lock(h->mutex);

    const std::int64_t history_floor = now - kHistoryWindowMs;
    h->timestamps.erase(
        std::remove_if(h->timestamps.begin(), h->timestamps.end(),
                       [history_floor](std::int64_t ts) { return ts <= history_floor; }),
        h->timestamps.end());

    const std::int64_t velocity_floor = now - kVelocityWindowMs;
    const std::size_t recent = static_cast<std::size_t>(
        std::count_if(h->timestamps.begin(), h->timestamps.end(),
                      [velocity_floor](std::int64_t ts) { return ts > velocity_floor; }));

    while (h->timestamps.size() >= kHistoryCap) {
        h->timestamps.pop_front();
    }
    h->timestamps.push_back(request.timestamp);
    return recent;
}

} // namespace pqgate
