// ============= src/database/analysis_cache.cpp =============
#include "database/analysis_cache.hpp"
#include <spdlog/spdlog.h>
#include <chrono>

namespace burstface {

AnalysisCache::AnalysisCache(int ttl_sec) : ttl_sec(ttl_sec) {
    if (ttl_sec > 0) {
        spdlog::debug("Analysis cache TTL: {}s", ttl_sec);
    }
}

int64_t AnalysisCache::now_us() {
    return std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now().time_since_epoch()
    ).count();
}

bool AnalysisCache::is_expired(int64_t timestamp, int64_t now) const {
    if (ttl_sec <= 0) return false;
    return (now - timestamp) >= static_cast<int64_t>(ttl_sec) * 1000000;
}

// ==================== CLUSTERS ====================

std::optional<ClusterFaceAnalysis> AnalysisCache::get_cluster(const std::string& cluster_id,
                                                              size_t photo_count) {
    std::lock_guard<std::mutex> lock(cache_mutex);

    auto it = cluster_cache.find(cluster_id);
    if (it == cluster_cache.end()) {
        stat_cache_misses++;
        return std::nullopt;
    }

    if (it->second.photo_count != photo_count) {
        spdlog::debug("Cluster {} photo count changed ({} -> {}), evicting",
                      cluster_id, it->second.photo_count, photo_count);
        cluster_cache.erase(it);
        stat_cache_misses++;
        return std::nullopt;
    }

    if (is_expired(it->second.timestamp, now_us())) {
        cluster_cache.erase(it);
        stat_cache_misses++;
        return std::nullopt;
    }

    stat_cache_hits++;
    return it->second.analysis;
}

void AnalysisCache::set_cluster(const std::string& cluster_id, size_t photo_count,
                                const ClusterFaceAnalysis& analysis) {
    std::lock_guard<std::mutex> lock(cache_mutex);
    cluster_cache[cluster_id] = {analysis, photo_count, now_us()};
}

// ==================== PHOTOS ====================

std::optional<ProcessedPhoto> AnalysisCache::get_photo(const std::string& asset_id) {
    std::lock_guard<std::mutex> lock(cache_mutex);

    auto it = photo_cache.find(asset_id);
    if (it == photo_cache.end()) {
        stat_cache_misses++;
        return std::nullopt;
    }

    if (is_expired(it->second.timestamp, now_us())) {
        photo_cache.erase(it);
        stat_cache_misses++;
        return std::nullopt;
    }

    stat_cache_hits++;
    return it->second.entry;
}

void AnalysisCache::set_photo(const std::string& asset_id, const ProcessedPhoto& entry) {
    std::lock_guard<std::mutex> lock(cache_mutex);
    photo_cache[asset_id] = {entry, now_us()};
}

// ==================== MAINTENANCE ====================

void AnalysisCache::clear() {
    std::lock_guard<std::mutex> lock(cache_mutex);
    cluster_cache.clear();
    photo_cache.clear();
    spdlog::info("🧹 Analysis cache cleared");
}

void AnalysisCache::clear_cluster(const std::string& cluster_id) {
    std::lock_guard<std::mutex> lock(cache_mutex);
    cluster_cache.erase(cluster_id);
}

size_t AnalysisCache::clear_expired() {
    std::lock_guard<std::mutex> lock(cache_mutex);
    if (ttl_sec <= 0) return 0;

    int64_t now = now_us();
    size_t removed = 0;

    for (auto it = cluster_cache.begin(); it != cluster_cache.end();) {
        if (is_expired(it->second.timestamp, now)) {
            it = cluster_cache.erase(it);
            removed++;
        } else {
            ++it;
        }
    }

    for (auto it = photo_cache.begin(); it != photo_cache.end();) {
        if (is_expired(it->second.timestamp, now)) {
            it = photo_cache.erase(it);
            removed++;
        } else {
            ++it;
        }
    }

    return removed;
}

AnalysisCache::Stats AnalysisCache::get_stats() const {
    Stats stats;
    {
        std::lock_guard<std::mutex> lock(cache_mutex);
        stats.cluster_count = cluster_cache.size();
        stats.face_count = photo_cache.size();
    }
    stats.hits = stat_cache_hits.load();
    stats.misses = stat_cache_misses.load();
    return stats;
}

void AnalysisCache::print_stats() const {
    auto stats = get_stats();
    spdlog::info("=== Analysis Cache Stats ===");
    spdlog::info("  Clusters: {} | Photos: {}", stats.cluster_count, stats.face_count);
    spdlog::info("  Cache hits: {} / {}", stats.hits, stats.hits + stats.misses);
}

} // namespace burstface
