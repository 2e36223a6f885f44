#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>

namespace ddlsort::ddl {

enum class ResolveOutcome : std::uint8_t {
    PassThrough = 0,
    Ordered,
    CycleDetected
};

struct ResolverTelemetrySnapshot final {
    std::uint64_t resolutions_attempted = 0U;
    std::uint64_t pass_through = 0U;
    std::uint64_t ordered = 0U;
    std::uint64_t cycles_detected = 0U;
    std::uint64_t statements_seen = 0U;
    std::uint64_t tables_ordered = 0U;
    std::uint64_t fragments_dropped = 0U;
    std::uint64_t total_duration_ns = 0U;
    std::uint64_t last_duration_ns = 0U;
};

class ResolverTelemetry final {
public:
    void record_attempt() noexcept;
    void record_result(ResolveOutcome outcome,
                       std::uint64_t duration_ns,
                       std::size_t statements_seen,
                       std::size_t tables_ordered,
                       std::size_t fragments_dropped) noexcept;

    [[nodiscard]] ResolverTelemetrySnapshot snapshot() const noexcept;
    void reset() noexcept;

private:
    static void add_relaxed(std::atomic<std::uint64_t>& target, std::uint64_t value) noexcept;

    std::atomic<std::uint64_t> resolutions_attempted_{0U};
    std::atomic<std::uint64_t> pass_through_{0U};
    std::atomic<std::uint64_t> ordered_{0U};
    std::atomic<std::uint64_t> cycles_detected_{0U};
    std::atomic<std::uint64_t> statements_seen_{0U};
    std::atomic<std::uint64_t> tables_ordered_{0U};
    std::atomic<std::uint64_t> fragments_dropped_{0U};
    std::atomic<std::uint64_t> total_duration_ns_{0U};
    std::atomic<std::uint64_t> last_duration_ns_{0U};
};

class ResolverTelemetryRegistry final {
public:
    using Sampler = std::function<ResolverTelemetrySnapshot()>;
    using Visitor = std::function<void(const std::string&, const ResolverTelemetrySnapshot&)>;

    void register_sampler(std::string identifier, Sampler sampler);
    void unregister_sampler(const std::string& identifier);

    [[nodiscard]] ResolverTelemetrySnapshot aggregate() const;
    void visit(const Visitor& visitor) const;

private:
    mutable std::mutex mutex_{};
    std::unordered_map<std::string, Sampler> samplers_{};
};

}  // namespace ddlsort::ddl
