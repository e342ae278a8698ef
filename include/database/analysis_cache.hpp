// ============= include/database/analysis_cache.hpp =============
/*
 * Analysis cache
 *
 * Two stores behind one mutex:
 * - cluster id -> ClusterFaceAnalysis (+ photo count it was computed for)
 * - photo asset id -> ProcessedPhoto (scored faces + image size)
 *
 * INVALIDATION:
 * - explicit clear() / clear_cluster()
 * - cluster lookups with a different photo count evict and miss
 * - optional TTL (ttl_sec > 0), swept by clear_expired() or on lookup
 *
 * Values are copied in and out; callers never see cache internals and no
 * lock is held outside these methods.
 */

#pragma once
#include "analysis/face_types.hpp"
#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace burstface {

class AnalysisCache {
public:
    explicit AnalysisCache(int ttl_sec = 0);

    std::optional<ClusterFaceAnalysis> get_cluster(const std::string& cluster_id, size_t photo_count);
    void set_cluster(const std::string& cluster_id, size_t photo_count, const ClusterFaceAnalysis& analysis);

    std::optional<ProcessedPhoto> get_photo(const std::string& asset_id);
    void set_photo(const std::string& asset_id, const ProcessedPhoto& entry);

    void clear();
    void clear_cluster(const std::string& cluster_id);
    size_t clear_expired();

    struct Stats {
        size_t cluster_count;
        size_t face_count;     // per-photo face lists
        size_t hits;
        size_t misses;
    };
    Stats get_stats() const;
    void print_stats() const;

private:
    int ttl_sec;

    struct CachedCluster {
        ClusterFaceAnalysis analysis;
        size_t photo_count;
        int64_t timestamp;
    };
    struct CachedPhoto {
        ProcessedPhoto entry;
        int64_t timestamp;
    };

    mutable std::mutex cache_mutex;
    std::unordered_map<std::string, CachedCluster> cluster_cache;
    std::unordered_map<std::string, CachedPhoto> photo_cache;

    mutable std::atomic<size_t> stat_cache_hits{0};
    mutable std::atomic<size_t> stat_cache_misses{0};

    bool is_expired(int64_t timestamp, int64_t now) const;
    static int64_t now_us();
};

} // namespace burstface
