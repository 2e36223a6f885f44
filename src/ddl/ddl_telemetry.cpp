#include "ddlsort/ddl/ddl_telemetry.hpp"

#include <algorithm>
#include <utility>
#include <vector>

namespace ddlsort::ddl {
namespace {

ResolverTelemetrySnapshot& accumulate(ResolverTelemetrySnapshot& target, const ResolverTelemetrySnapshot& source)
{
    target.resolutions_attempted += source.resolutions_attempted;
    target.pass_through += source.pass_through;
    target.ordered += source.ordered;
    target.cycles_detected += source.cycles_detected;
    target.statements_seen += source.statements_seen;
    target.tables_ordered += source.tables_ordered;
    target.fragments_dropped += source.fragments_dropped;
    target.total_duration_ns += source.total_duration_ns;
    target.last_duration_ns = std::max(target.last_duration_ns, source.last_duration_ns);
    return target;
}

}  // namespace

void ResolverTelemetry::add_relaxed(std::atomic<std::uint64_t>& target, std::uint64_t value) noexcept
{
    target.fetch_add(value, std::memory_order_relaxed);
}

void ResolverTelemetry::record_attempt() noexcept
{
    add_relaxed(resolutions_attempted_, 1U);
}

void ResolverTelemetry::record_result(ResolveOutcome outcome,
                                      std::uint64_t duration_ns,
                                      std::size_t statements_seen,
                                      std::size_t tables_ordered,
                                      std::size_t fragments_dropped) noexcept
{
    switch (outcome) {
    case ResolveOutcome::PassThrough:
        add_relaxed(pass_through_, 1U);
        break;
    case ResolveOutcome::Ordered:
        add_relaxed(ordered_, 1U);
        break;
    case ResolveOutcome::CycleDetected:
    default:
        add_relaxed(cycles_detected_, 1U);
        break;
    }

    add_relaxed(statements_seen_, static_cast<std::uint64_t>(statements_seen));
    add_relaxed(tables_ordered_, static_cast<std::uint64_t>(tables_ordered));
    add_relaxed(fragments_dropped_, static_cast<std::uint64_t>(fragments_dropped));
    add_relaxed(total_duration_ns_, duration_ns);
    last_duration_ns_.store(duration_ns, std::memory_order_relaxed);
}

ResolverTelemetrySnapshot ResolverTelemetry::snapshot() const noexcept
{
    ResolverTelemetrySnapshot snapshot{};
    snapshot.resolutions_attempted = resolutions_attempted_.load(std::memory_order_relaxed);
    snapshot.pass_through = pass_through_.load(std::memory_order_relaxed);
    snapshot.ordered = ordered_.load(std::memory_order_relaxed);
    snapshot.cycles_detected = cycles_detected_.load(std::memory_order_relaxed);
    snapshot.statements_seen = statements_seen_.load(std::memory_order_relaxed);
    snapshot.tables_ordered = tables_ordered_.load(std::memory_order_relaxed);
    snapshot.fragments_dropped = fragments_dropped_.load(std::memory_order_relaxed);
    snapshot.total_duration_ns = total_duration_ns_.load(std::memory_order_relaxed);
    snapshot.last_duration_ns = last_duration_ns_.load(std::memory_order_relaxed);
    return snapshot;
}

void ResolverTelemetry::reset() noexcept
{
    resolutions_attempted_.store(0U, std::memory_order_relaxed);
    pass_through_.store(0U, std::memory_order_relaxed);
    ordered_.store(0U, std::memory_order_relaxed);
    cycles_detected_.store(0U, std::memory_order_relaxed);
    statements_seen_.store(0U, std::memory_order_relaxed);
    tables_ordered_.store(0U, std::memory_order_relaxed);
    fragments_dropped_.store(0U, std::memory_order_relaxed);
    total_duration_ns_.store(0U, std::memory_order_relaxed);
    last_duration_ns_.store(0U, std::memory_order_relaxed);
}

void ResolverTelemetryRegistry::register_sampler(std::string identifier, Sampler sampler)
{
    if (!sampler) {
        return;
    }

    std::lock_guard guard(mutex_);
    samplers_.insert_or_assign(std::move(identifier), std::move(sampler));
}

void ResolverTelemetryRegistry::unregister_sampler(const std::string& identifier)
{
    std::lock_guard guard(mutex_);
    samplers_.erase(identifier);
}

ResolverTelemetrySnapshot ResolverTelemetryRegistry::aggregate() const
{
    std::vector<Sampler> samplers;
    {
        std::lock_guard guard(mutex_);
        samplers.reserve(samplers_.size());
        for (const auto& [_, sampler] : samplers_) {
            samplers.push_back(sampler);
        }
    }

    ResolverTelemetrySnapshot total{};
    for (const auto& sampler : samplers) {
        if (!sampler) {
            continue;
        }
        accumulate(total, sampler());
    }
    return total;
}

void ResolverTelemetryRegistry::visit(const Visitor& visitor) const
{
    if (!visitor) {
        return;
    }

    std::vector<std::pair<std::string, Sampler>> entries;
    {
        std::lock_guard guard(mutex_);
        entries.reserve(samplers_.size());
        for (const auto& [identifier, sampler] : samplers_) {
            entries.emplace_back(identifier, sampler);
        }
    }

    for (const auto& [identifier, sampler] : entries) {
        if (!sampler) {
            continue;
        }
        visitor(identifier, sampler());
    }
}

}  // namespace ddlsort::ddl
