#pragma once

#include "ddlsort/ddl/ddl_dependency_graph.hpp"
#include "ddlsort/ddl/ddl_errors.hpp"
#include "ddlsort/ddl/ddl_telemetry.hpp"
#include "ddlsort/parser/grammar.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace ddlsort::ddl {

inline constexpr std::string_view kOrderedBanner = parser::kOrderedBanner;
inline constexpr std::string_view kCycleWarningPrefix = "-- WARNING: Not all tables could be topologically sorted";

enum class UnrecognizedStatementPolicy : std::uint8_t {
    Drop = 0,
    AppendAfterOrdered
};

struct ResolveResult final {
    ResolveOutcome outcome = ResolveOutcome::PassThrough;
    std::string text{};
    std::vector<std::string> ordered_tables{};
    std::vector<std::string> unresolved_tables{};
    std::vector<std::vector<std::string>> cycles{};
    std::vector<std::string> dropped_fragments{};
    std::vector<parser::ParserDiagnostic> diagnostics{};
    std::size_t statement_count = 0U;
    std::error_code error{};
};

// Reorders CREATE TABLE statements so every table follows the tables it references.
// Input without a CREATE TABLE is returned untouched; a cycle returns the original
// text behind a warning comment. resolve() never throws.
class DdlResolver final {
public:
    struct Config final {
        UnrecognizedStatementPolicy unrecognized_policy = UnrecognizedStatementPolicy::Drop;
        bool ignore_self_references = false;
        ResolverTelemetryRegistry* telemetry_registry = nullptr;
        std::string telemetry_identifier{};
    };

    DdlResolver();
    explicit DdlResolver(Config config);
    ~DdlResolver();

    DdlResolver(const DdlResolver&) = delete;
    DdlResolver& operator=(const DdlResolver&) = delete;
    DdlResolver(DdlResolver&&) = delete;
    DdlResolver& operator=(DdlResolver&&) = delete;

    [[nodiscard]] ResolveResult resolve_detailed(std::string_view sql);
    [[nodiscard]] std::string resolve(std::string_view sql);

    [[nodiscard]] const Config& config() const noexcept { return config_; }
    [[nodiscard]] const ResolverTelemetry& telemetry() const noexcept { return telemetry_; }

private:
    Config config_{};
    ResolverTelemetry telemetry_{};
    bool registered_ = false;
};

// Default configuration; no telemetry registration.
[[nodiscard]] std::string resolve_ddl_order(std::string_view sql);

[[nodiscard]] std::string_view outcome_to_string(ResolveOutcome outcome) noexcept;

DdlDependencyGraph build_dependency_graph(const std::vector<parser::CreateTableStatement>& tables,
                                          bool ignore_self_references);

}  // namespace ddlsort::ddl
