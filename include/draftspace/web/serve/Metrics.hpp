#pragma once

#include <draftspace/core/Error.hpp>

#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>

#include <nlohmann/json.hpp>

namespace httplib {
class Response;
}

namespace DS::Serve {

enum class RouteMetric : std::size_t {
    Root = 0,
    Healthz,
    Metrics,
    FolderRegister,
    FolderDrafts,
    DraftCreate,
    DraftGet,
    TrackAdd,
    SegmentAudio,
    SegmentVideo,
    SegmentSticker,
    SegmentText,
    DraftSave,
    DraftClose,
    Metadata,
    Count,
};

inline constexpr std::size_t kErrorCategoryCount = 5;

class MetricsCollector {
public:
    struct HistogramSnapshot {
        static constexpr std::size_t kBucketCount = 10;
        std::array<std::uint64_t, kBucketCount>   buckets{};
        std::uint64_t                             count{0};
        std::uint64_t                             sum_micros{0};
    };

    struct MetricsSnapshot {
        struct RouteCounters {
            HistogramSnapshot latency;
            std::uint64_t     total{0};
            std::uint64_t     errors{0};
        };

        std::chrono::system_clock::time_point                                   captured_at{};
        std::array<RouteCounters, static_cast<std::size_t>(RouteMetric::Count)> routes{};
        std::array<std::uint64_t, kErrorCategoryCount>                          domain_errors{};
        std::uint64_t                                                           drafts_saved{0};
        std::uint64_t                                                           segments_committed{0};
    };

    void record_request(RouteMetric route,
                        int         status,
                        std::chrono::microseconds latency);

    void record_domain_error(DS::Error::Category category);
    void record_draft_saved();
    void record_segment_committed();

    auto capture_snapshot() const -> MetricsSnapshot;
    auto render_prometheus() const -> std::string;
    auto render_prometheus(MetricsSnapshot const& snapshot) const -> std::string;
    auto snapshot_json() const -> nlohmann::json;
    auto snapshot_json(MetricsSnapshot const& snapshot) const -> nlohmann::json;

    static auto route_name(RouteMetric route) -> char const*;

private:
    class Histogram {
    public:
        void observe(std::chrono::microseconds value);
        auto snapshot() const -> HistogramSnapshot;
        static auto bucket_boundaries() -> std::array<double, HistogramSnapshot::kBucketCount> const&;

    private:
        static constexpr std::array<double, HistogramSnapshot::kBucketCount> kLatencyBucketsMs{
            1.0,   5.0,    20.0,   50.0,   100.0,
            250.0, 500.0,  1000.0, 2500.0, std::numeric_limits<double>::infinity()};

        std::array<std::atomic<std::uint64_t>, HistogramSnapshot::kBucketCount> buckets_{};
        std::atomic<std::uint64_t>                                               count_{0};
        std::atomic<std::uint64_t>                                               sum_micros_{0};
    };

    struct RouteCounters {
        Histogram                  latency;
        std::atomic<std::uint64_t> total{0};
        std::atomic<std::uint64_t> errors{0};
    };

    std::array<RouteCounters, static_cast<std::size_t>(RouteMetric::Count)> routes_{};
    std::array<std::atomic<std::uint64_t>, kErrorCategoryCount>             domain_errors_{};
    std::atomic<std::uint64_t>                                              drafts_saved_{0};
    std::atomic<std::uint64_t>                                              segments_committed_{0};
    mutable std::atomic<std::uint64_t>                                      metrics_scrapes_{0};
};

class RequestMetricsScope {
public:
    RequestMetricsScope(MetricsCollector& metrics, RouteMetric route, httplib::Response& res);
    ~RequestMetricsScope();

private:
    MetricsCollector&                     metrics_;
    RouteMetric                           route_;
    httplib::Response&                    response_;
    std::chrono::steady_clock::time_point start_;
};

} // namespace DS::Serve
