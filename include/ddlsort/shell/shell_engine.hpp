#pragma once

#include "ddlsort/advisor/workload.hpp"
#include "ddlsort/ddl/ddl_resolver.hpp"
#include "ddlsort/parser/grammar.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ddlsort::shell {

struct CommandMetrics final {
    bool success = false;
    std::string summary{};
    std::string output{};
    std::optional<ddl::ResolveOutcome> outcome{};
    double duration_ms = 0.0;
    std::vector<ddlsort::parser::ParserDiagnostic> diagnostics{};
    std::vector<std::string> detail_lines{};
    std::string command_text{};
    std::string correlation_id{};
    std::string command_category{};
    std::chrono::system_clock::time_point started_at{};
    std::chrono::system_clock::time_point finished_at{};
};

class ShellEngine final {
public:
    struct Config final {
        ddl::DdlResolver::Config resolver{};
        std::function<void(const CommandMetrics&)> command_logger{};
        advisor::WorkloadType default_workload = advisor::WorkloadType::Oltp;
    };

    ShellEngine();
    explicit ShellEngine(Config config);

    ShellEngine(const ShellEngine&) = delete;
    ShellEngine& operator=(const ShellEngine&) = delete;

    // SQL batches are reordered; input starting with a backslash is a meta command.
    CommandMetrics execute(const std::string& input);

    // Reorders the sql code blocks of a Markdown document.
    CommandMetrics execute_markdown(const std::string& markdown);

    [[nodiscard]] const ddl::DdlResolver& resolver() const noexcept { return resolver_; }
    [[nodiscard]] const std::string& last_ddl() const noexcept { return last_ddl_; }

private:
    enum class CommandKind : std::uint8_t {
        Empty = 0,
        Sql,
        Meta
    };

    static std::string trim(std::string_view text);
    static CommandKind classify(std::string_view text);
    static std::string_view command_kind_to_string(CommandKind kind) noexcept;

    CommandMetrics dispatch(const std::string& input, CommandKind kind);
    CommandMetrics execute_sql(const std::string& sql);
    CommandMetrics execute_meta(const std::string& command);
    CommandMetrics execute_annotate(const std::string& command, const std::string& argument);
    CommandMetrics execute_estimate(const std::string& command, const std::vector<std::string>& tokens);
    CommandMetrics execute_validate(const std::string& command, const std::string& argument);
    CommandMetrics execute_simulate(const std::string& command, const std::string& argument);
    CommandMetrics execute_graph(const std::string& command);
    CommandMetrics execute_stats();
    CommandMetrics missing_ddl(const std::string& command) const;

    void finish(CommandMetrics& metrics, std::string_view category, const std::string& input,
                std::chrono::steady_clock::time_point start, std::chrono::system_clock::time_point started_at);

    Config config_{};
    ddl::DdlResolver resolver_;
    std::string last_input_{};
    std::string last_ddl_{};
    std::atomic<std::uint64_t> correlation_counter_{1U};
};

}  // namespace ddlsort::shell
