#pragma once
#include <atomic>
#include <fstream>
#include <unistd.h>
#include <nlohmann/json.hpp>

namespace fix_memory {

struct TelemetryData {
    size_t ram_usage_mb = 0;

    double embedding_latency_ms = 0.0;
    double scan_latency_ms = 0.0;
    int rows_scanned = 0;
    int rows_compared = 0;
    long long degraded_embeddings = 0;
    long long storage_failures = 0;

    nlohmann::json to_json() const {
        return {
            {"ram_mb", ram_usage_mb},
            {"embedding_latency_ms", embedding_latency_ms},
            {"scan_latency_ms", scan_latency_ms},
            {"rows_scanned", rows_scanned},
            {"rows_compared", rows_compared},
            {"degraded_embeddings", degraded_embeddings},
            {"storage_failures", storage_failures}
        };
    }
};

class SystemMonitor {
public:
    // Global Atomic Metrics
    inline static std::atomic<double> global_embedding_latency_ms{0.0};
    inline static std::atomic<double> global_scan_latency_ms{0.0};
    inline static std::atomic<int> global_rows_scanned{0};
    inline static std::atomic<int> global_rows_compared{0};
    inline static std::atomic<long long> global_degraded_embeddings{0};
    inline static std::atomic<long long> global_storage_failures{0};

    static TelemetryData get_latest_snapshot() {
        TelemetryData snapshot;
        snapshot.ram_usage_mb = resident_memory_mb();
        snapshot.embedding_latency_ms = global_embedding_latency_ms.load();
        snapshot.scan_latency_ms = global_scan_latency_ms.load();
        snapshot.rows_scanned = global_rows_scanned.load();
        snapshot.rows_compared = global_rows_compared.load();
        snapshot.degraded_embeddings = global_degraded_embeddings.load();
        snapshot.storage_failures = global_storage_failures.load();
        return snapshot;
    }

private:
    // Resident set size from /proc/self/statm; 0 where procfs is unavailable.
    static size_t resident_memory_mb() {
        std::ifstream statm("/proc/self/statm");
        size_t total_pages = 0, resident_pages = 0;
        if (!(statm >> total_pages >> resident_pages)) return 0;
        long page_size = sysconf(_SC_PAGESIZE);
        if (page_size <= 0) return 0;
        return resident_pages * static_cast<size_t>(page_size) / 1024 / 1024;
    }
};

} // namespace fix_memory
