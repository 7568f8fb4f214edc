#include <draftspace/web/serve/Metrics.hpp>

#include "httplib.h"

#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <utility>

namespace DS::Serve {

using json = nlohmann::json;

namespace {

constexpr std::array<std::pair<RouteMetric, char const*>, static_cast<std::size_t>(RouteMetric::Count)>
    kRouteMetricNames{{
        {RouteMetric::Root, "root"},
        {RouteMetric::Healthz, "healthz"},
        {RouteMetric::Metrics, "metrics"},
        {RouteMetric::FolderRegister, "folder_register"},
        {RouteMetric::FolderDrafts, "folder_drafts"},
        {RouteMetric::DraftCreate, "draft_create"},
        {RouteMetric::DraftGet, "draft_get"},
        {RouteMetric::TrackAdd, "track_add"},
        {RouteMetric::SegmentAudio, "segment_audio"},
        {RouteMetric::SegmentVideo, "segment_video"},
        {RouteMetric::SegmentSticker, "segment_sticker"},
        {RouteMetric::SegmentText, "segment_text"},
        {RouteMetric::DraftSave, "draft_save"},
        {RouteMetric::DraftClose, "draft_close"},
        {RouteMetric::Metadata, "metadata"},
    }};

constexpr std::array<DS::Error::Category, kErrorCategoryCount> kCategories{
    DS::Error::Category::Validation,
    DS::Error::Category::NotFound,
    DS::Error::Category::PathSecurity,
    DS::Error::Category::Conflict,
    DS::Error::Category::Internal,
};

auto format_timestamp(std::chrono::system_clock::time_point tp) -> std::string {
    auto seconds_part = std::chrono::time_point_cast<std::chrono::seconds>(tp);
    auto millis       = std::chrono::duration_cast<std::chrono::milliseconds>(tp - seconds_part);
    std::time_t raw   = std::chrono::system_clock::to_time_t(seconds_part);
    std::tm tm{};
    if (gmtime_r(&raw, &tm) == nullptr) {
        return "1970-01-01T00:00:00.000Z";
    }

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setw(3) << std::setfill('0') << millis.count();
    oss << 'Z';
    return oss.str();
}

auto format_bucket_boundary(double boundary_ms) -> std::string {
    return std::isinf(boundary_ms) ? std::string{"+Inf"} : std::to_string(boundary_ms / 1000.0);
}

} // namespace

auto MetricsCollector::route_name(RouteMetric route) -> char const* {
    auto const index = static_cast<std::size_t>(route);
    if (index >= kRouteMetricNames.size()) {
        return "unknown";
    }
    return kRouteMetricNames[index].second;
}

void MetricsCollector::Histogram::observe(std::chrono::microseconds value) {
    auto const micros = static_cast<std::uint64_t>(value.count());
    sum_micros_.fetch_add(micros, std::memory_order_relaxed);
    count_.fetch_add(1, std::memory_order_relaxed);
    double const millis = static_cast<double>(micros) / 1000.0;
    for (std::size_t i = 0; i < kLatencyBucketsMs.size(); ++i) {
        if (millis <= kLatencyBucketsMs[i]) {
            buckets_[i].fetch_add(1, std::memory_order_relaxed);
            return;
        }
    }
    buckets_.back().fetch_add(1, std::memory_order_relaxed);
}

auto MetricsCollector::Histogram::snapshot() const -> HistogramSnapshot {
    HistogramSnapshot snapshot{};
    for (std::size_t i = 0; i < kLatencyBucketsMs.size(); ++i) {
        snapshot.buckets[i] = buckets_[i].load(std::memory_order_relaxed);
    }
    snapshot.count      = count_.load(std::memory_order_relaxed);
    snapshot.sum_micros = sum_micros_.load(std::memory_order_relaxed);
    return snapshot;
}

auto MetricsCollector::Histogram::bucket_boundaries()
    -> std::array<double, HistogramSnapshot::kBucketCount> const& {
    return kLatencyBucketsMs;
}

void MetricsCollector::record_request(RouteMetric route,
                                      int         status,
                                      std::chrono::microseconds latency) {
    auto const index = static_cast<std::size_t>(route);
    if (index >= routes_.size()) {
        return;
    }
    auto& counters = routes_[index];
    counters.latency.observe(latency);
    counters.total.fetch_add(1, std::memory_order_relaxed);
    int effective_status = status == 0 ? 200 : status;
    if (effective_status >= 400) {
        counters.errors.fetch_add(1, std::memory_order_relaxed);
    }
}

void MetricsCollector::record_domain_error(DS::Error::Category category) {
    auto const index = static_cast<std::size_t>(category);
    if (index < domain_errors_.size()) {
        domain_errors_[index].fetch_add(1, std::memory_order_relaxed);
    }
}

void MetricsCollector::record_draft_saved() {
    drafts_saved_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsCollector::record_segment_committed() {
    segments_committed_.fetch_add(1, std::memory_order_relaxed);
}

auto MetricsCollector::capture_snapshot() const -> MetricsSnapshot {
    MetricsSnapshot snapshot;
    snapshot.captured_at = std::chrono::system_clock::now();
    for (std::size_t i = 0; i < routes_.size(); ++i) {
        snapshot.routes[i].latency = routes_[i].latency.snapshot();
        snapshot.routes[i].total   = routes_[i].total.load(std::memory_order_relaxed);
        snapshot.routes[i].errors  = routes_[i].errors.load(std::memory_order_relaxed);
    }
    for (std::size_t i = 0; i < domain_errors_.size(); ++i) {
        snapshot.domain_errors[i] = domain_errors_[i].load(std::memory_order_relaxed);
    }
    snapshot.drafts_saved       = drafts_saved_.load(std::memory_order_relaxed);
    snapshot.segments_committed = segments_committed_.load(std::memory_order_relaxed);
    return snapshot;
}

auto MetricsCollector::render_prometheus() const -> std::string {
    auto snapshot = capture_snapshot();
    return render_prometheus(snapshot);
}

auto MetricsCollector::render_prometheus(MetricsSnapshot const& snapshot) const -> std::string {
    metrics_scrapes_.fetch_add(1, std::memory_order_relaxed);
    std::ostringstream out;

    out << "# HELP draftspace_request_duration_seconds Request latency histogram\n";
    out << "# TYPE draftspace_request_duration_seconds histogram\n";
    auto const& buckets = Histogram::bucket_boundaries();
    for (std::size_t i = 0; i < snapshot.routes.size(); ++i) {
        auto const& route_stats = snapshot.routes[i];
        auto const* name        = kRouteMetricNames[i].second;
        std::uint64_t cumulative = 0;
        for (std::size_t b = 0; b < buckets.size(); ++b) {
            cumulative += route_stats.latency.buckets[b];
            out << "draftspace_request_duration_seconds_bucket{route=\"" << name
                << "\",le=\"" << format_bucket_boundary(buckets[b]) << "\"} " << cumulative << "\n";
        }
        double sum_seconds = route_stats.latency.sum_micros / 1'000'000.0;
        out << "draftspace_request_duration_seconds_sum{route=\"" << name
            << "\"} " << sum_seconds << "\n";
        out << "draftspace_request_duration_seconds_count{route=\"" << name
            << "\"} " << route_stats.latency.count << "\n";
    }

    out << "# HELP draftspace_requests_total Total HTTP requests\n";
    out << "# TYPE draftspace_requests_total counter\n";
    out << "# HELP draftspace_request_errors_total HTTP requests returning >=400\n";
    out << "# TYPE draftspace_request_errors_total counter\n";
    for (std::size_t i = 0; i < snapshot.routes.size(); ++i) {
        auto const* name = kRouteMetricNames[i].second;
        out << "draftspace_requests_total{route=\"" << name << "\"} "
            << snapshot.routes[i].total << "\n";
        out << "draftspace_request_errors_total{route=\"" << name << "\"} "
            << snapshot.routes[i].errors << "\n";
    }

    out << "# HELP draftspace_domain_errors_total Rejected operations by error category\n";
    out << "# TYPE draftspace_domain_errors_total counter\n";
    for (std::size_t i = 0; i < kCategories.size(); ++i) {
        out << "draftspace_domain_errors_total{category=\""
            << DS::errorCategoryToString(kCategories[i]) << "\"} " << snapshot.domain_errors[i] << "\n";
    }

    out << "# HELP draftspace_drafts_saved_total Successful draft saves\n";
    out << "# TYPE draftspace_drafts_saved_total counter\n";
    out << "draftspace_drafts_saved_total " << snapshot.drafts_saved << "\n";
    out << "# HELP draftspace_segments_committed_total Segments appended to drafts\n";
    out << "# TYPE draftspace_segments_committed_total counter\n";
    out << "draftspace_segments_committed_total " << snapshot.segments_committed << "\n";

    out << "# HELP draftspace_metrics_scrapes_total Metrics scrapes\n";
    out << "# TYPE draftspace_metrics_scrapes_total counter\n";
    out << "draftspace_metrics_scrapes_total "
        << metrics_scrapes_.load(std::memory_order_relaxed) << "\n";

    return out.str();
}

auto MetricsCollector::snapshot_json() const -> json {
    auto snapshot = capture_snapshot();
    return snapshot_json(snapshot);
}

auto MetricsCollector::snapshot_json(MetricsSnapshot const& snapshot) const -> json {
    json payload;
    payload["captured_at"] = format_timestamp(snapshot.captured_at);

    json request_stats;
    for (std::size_t i = 0; i < snapshot.routes.size(); ++i) {
        auto const* name   = kRouteMetricNames[i].second;
        auto const& stats  = snapshot.routes[i];
        double       avg_ms = stats.latency.count == 0
                                  ? 0.0
                                  : static_cast<double>(stats.latency.sum_micros) / 1000.0
                                        / static_cast<double>(stats.latency.count);
        request_stats[name] = json{{"total", stats.total}, {"errors", stats.errors}, {"avg_ms", avg_ms}};
    }
    payload["requests"] = std::move(request_stats);

    json errors;
    for (std::size_t i = 0; i < kCategories.size(); ++i) {
        errors[std::string{DS::errorCategoryToString(kCategories[i])}] = snapshot.domain_errors[i];
    }
    payload["domain_errors"]      = std::move(errors);
    payload["drafts_saved"]       = snapshot.drafts_saved;
    payload["segments_committed"] = snapshot.segments_committed;
    return payload;
}

RequestMetricsScope::RequestMetricsScope(MetricsCollector& metrics,
                                         RouteMetric       route,
                                         httplib::Response& res)
    : metrics_{metrics}
    , route_{route}
    , response_{res}
    , start_{std::chrono::steady_clock::now()} {}

RequestMetricsScope::~RequestMetricsScope() {
    auto duration = std::chrono::steady_clock::now() - start_;
    metrics_.record_request(route_,
                            response_.status,
                            std::chrono::duration_cast<std::chrono::microseconds>(duration));
}

} // namespace DS::Serve
