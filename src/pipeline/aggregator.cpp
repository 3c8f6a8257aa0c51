#include <fleetfuel/pipeline/aggregator.hpp>
#include <fleetfuel/pipeline/aligner.hpp>
#include <fleetfuel/pipeline/imputer.hpp>
#include <fleetfuel/pipeline/integrator.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <exception>
#include <thread>

namespace fleetfuel::pipeline {

namespace {

using GroupResult = std::expected<GroupSummary, GroupFailure>;

auto empty_summary(const GroupKey& key, std::string detail) -> GroupSummary {
    GroupSummary summary;
    summary.key = key;
    summary.notices.push_back(Notice{.kind = ErrorKind::EmptyGroup, .detail = std::move(detail)});
    return summary;
}

auto summarize_impl(const GroupStreams& group, const AggregateConfig& config) -> GroupResult {
    if (auto ok = config.params.validate(); !ok) {
        return std::unexpected(GroupFailure{.key = group.key, .error = ok.error()});
    }
    if (!group.defects.empty()) {
        return std::unexpected(GroupFailure{
            .key = group.key,
            .error = PipelineError{.kind = ErrorKind::InvalidInput,
                                   .message = fmt::format("{} rejected input row(s): {}",
                                                          group.defects.size(),
                                                          fmt::join(group.defects, "; "))}});
    }
    if (group.streams.empty()) {
        return empty_summary(group.key, "no streams");
    }

    auto aligned = align(group.streams);
    if (!aligned) {
        return std::unexpected(GroupFailure{.key = group.key, .error = aligned.error()});
    }
    if (aligned->key != group.key) {
        return std::unexpected(GroupFailure{
            .key = group.key,
            .error = PipelineError{.kind = ErrorKind::InvalidInput,
                                   .message = fmt::format("streams belong to {}, group is {}",
                                                          to_string(aligned->key),
                                                          to_string(group.key))}});
    }
    if (aligned->rows() == 0) {
        return empty_summary(group.key, "no samples");
    }

    FilledTable filled = fill(*aligned);
    auto extraction = extract_rows(filled, config.schema);

    GroupSummary summary;
    summary.key = group.key;
    summary.skipped_leading = extraction.skipped_leading;
    if (config.keep_filled) {
        summary.filled = std::move(filled);
    }
    if (!extraction.missing.empty()) {
        auto detail = fmt::format("missing variable(s): {}", fmt::join(extraction.missing, ", "));
        summary.notices.push_back(
            Notice{.kind = ErrorKind::EmptyGroup, .detail = std::move(detail)});
        return summary;
    }

    auto trace = compute_rate(extraction.rows, config.params);
    if (trace.anomalies > 0) {
        summary.notices.push_back(Notice{.kind = ErrorKind::NumericAnomaly,
                                         .detail = "non-finite rate replaced by alpha",
                                         .count = trace.anomalies});
    }

    RateSeries series;
    series.time = trace.time;
    series.rate = trace.rate.transform([](GallonsPerHour r) { return to_per_second(r); });
    if (series.size() < 2) {
        summary.notices.push_back(
            Notice{.kind = ErrorKind::DegenerateSeries,
                   .detail = fmt::format("{} timestamp(s), nothing to integrate", series.size())});
    }

    std::vector<double> speeds;
    speeds.reserve(extraction.rows.size());
    for (const auto& row : extraction.rows) {
        speeds.push_back(row.speed);
    }

    summary.rows = extraction.rows.size();
    summary.quantity_gal = integrate(series);
    summary.elapsed_hours = elapsed_hours(series.time.span());
    summary.mean_speed = mean(speeds).value_or(0.0);
    if (summary.elapsed_hours > 0.0) {
        summary.derived_rate = summary.quantity_gal / summary.elapsed_hours;
    }
    return summary;
}

}  // namespace

auto GroupSummary::has_notice(ErrorKind kind) const -> bool {
    return std::ranges::any_of(notices, [kind](const Notice& n) { return n.kind == kind; });
}

auto summarize_group(const GroupStreams& group, const AggregateConfig& config) -> GroupResult {
    auto start = std::chrono::steady_clock::now();
    auto result = summarize_impl(group, config);
    auto elapsed_us = std::chrono::duration_cast<std::chrono::microseconds>(
                          std::chrono::steady_clock::now() - start)
                          .count();
    if (!result) {
        spdlog::warn("group {} failed: {}", to_string(group.key), result.error().error.format());
        return result;
    }
    if (result->has_notice(ErrorKind::EmptyGroup)) {
        spdlog::warn("group {} is empty: {}", to_string(group.key),
                     result->notices.front().detail);
    }
    spdlog::debug("group {}: rows={}, gallons={:.6f}, hours={:.4f}, notices={}, {}us",
                  to_string(group.key), result->rows, result->quantity_gal, result->elapsed_hours,
                  result->notices.size(), elapsed_us);
    return result;
}

auto aggregate(std::span<const GroupStreams> groups, const AggregateConfig& config)
    -> BatchResult {
    return aggregate(groups, config, summarize_group);
}

auto aggregate(std::span<const GroupStreams> groups, const AggregateConfig& config,
               const GroupStep& step) -> BatchResult {
    const std::size_t n = groups.size();
    spdlog::info("aggregating {} group(s) on {} thread(s)", n,
                 std::max<std::size_t>(1, config.threads));

    std::vector<std::optional<GroupResult>> results(n);
    auto run_range = [&](std::size_t start, std::size_t end) {
        for (std::size_t g = start; g < end; ++g) {
            // An escaping exception must not reach std::thread; it fails this group only.
            try {
                results[g] = step(groups[g], config);
            } catch (const std::exception& e) {
                spdlog::error("group {} threw: {}", to_string(groups[g].key), e.what());
                results[g] = std::unexpected(GroupFailure{
                    .key = groups[g].key,
                    .error = PipelineError{.kind = ErrorKind::InvalidInput,
                                           .message = fmt::format("unexpected error: {}",
                                                                  e.what())}});
            }
        }
    };

    const std::size_t threads = std::min(n, std::max<std::size_t>(1, config.threads));
    if (threads > 1) {
        // Contiguous chunks; each worker writes only its own slots.
        const std::size_t chunk = (n + threads - 1) / threads;
        std::vector<std::thread> workers;
        workers.reserve(threads);
        for (std::size_t t = 0; t < threads; ++t) {
            std::size_t start = t * chunk;
            if (start >= n) {
                break;
            }
            std::size_t end = std::min(n, start + chunk);
            workers.emplace_back([&run_range, start, end] { run_range(start, end); });
        }
        for (auto& th : workers) {
            th.join();
        }
    } else {
        run_range(0, n);
    }

    BatchResult batch;
    batch.summaries.reserve(n);
    for (auto& result : results) {
        if (result->has_value()) {
            batch.summaries.push_back(std::move(**result));
        } else {
            batch.failures.push_back(std::move(result->error()));
        }
    }
    if (config.stable_order) {
        std::ranges::sort(batch.summaries, {}, &GroupSummary::key);
        std::ranges::sort(batch.failures, {}, &GroupFailure::key);
    }
    spdlog::info("aggregated {} summaries, {} failure(s)", batch.summaries.size(),
                 batch.failures.size());
    return batch;
}

}  // namespace fleetfuel::pipeline
