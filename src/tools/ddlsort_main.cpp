#include "ddlsort/advisor/workload.hpp"
#include "ddlsort/ddl/parser_diagnostics.hpp"
#include "ddlsort/shell/shell_engine.hpp"
#include "ddlsort/tools/command_log_formatter.hpp"

#include <CLI/CLI.hpp>
#include <replxx.hxx>

#include <cctype>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace {

struct InputSource final {
    std::string label{};
    std::string text{};
};

std::string trim(std::string_view text)
{
    std::size_t start = 0U;
    while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start])) != 0) {
        ++start;
    }

    std::size_t end = text.size();
    while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1U])) != 0) {
        --end;
    }

    return std::string{text.substr(start, end - start)};
}

std::filesystem::path history_path()
{
    const char* home = std::getenv("HOME");
    if (home == nullptr || home[0] == '\0') {
        return {};
    }

    std::filesystem::path path{home};
    path /= ".ddlsort_history";
    return path;
}

bool read_stream(std::istream& input, std::string& text, std::string& error_message)
{
    error_message.clear();
    text.assign(std::istreambuf_iterator<char>{input}, std::istreambuf_iterator<char>{});
    if (input.bad()) {
        error_message = "I/O error while reading input";
        return false;
    }
    return true;
}

// Status line plus details; `out` receives the summary so batch mode keeps stdout for SQL.
void render_status(const ddlsort::shell::CommandMetrics& metrics, std::ostream& out)
{
    const auto status = metrics.success ? "OK" : "ERROR";
    out << status << ": " << metrics.summary;
    if (!metrics.correlation_id.empty()) {
        out << " [" << metrics.correlation_id << ']';
    }
    out << " [" << std::fixed << std::setprecision(2) << metrics.duration_ms << " ms]";
    out << '\n';

    for (const auto& line : metrics.detail_lines) {
        out << "    " << line << '\n';
    }

    for (const auto& diagnostic : metrics.diagnostics) {
        out << "  - " << ddlsort::ddl::format_parser_diagnostic(diagnostic) << '\n';
        for (const auto& hint : diagnostic.remediation_hints) {
            out << "      hint: " << hint << '\n';
        }
    }
}

void render_output(const ddlsort::shell::CommandMetrics& metrics)
{
    if (metrics.output.empty()) {
        return;
    }
    std::cout << metrics.output;
    if (metrics.output.back() != '\n') {
        std::cout << '\n';
    }
}

int run_batch(const std::vector<InputSource>& inputs, bool markdown, bool quiet,
              const ddlsort::shell::ShellEngine::Config& config)
{
    ddlsort::shell::ShellEngine engine{config};
    int exit_code = 0;
    for (const auto& input : inputs) {
        const auto result = markdown ? engine.execute_markdown(input.text) : engine.execute(input.text);
        render_output(result);
        if (!quiet || !result.success) {
            render_status(result, std::cerr);
        }
        if (!result.success) {
            exit_code = 1;
        }
    }
    std::cerr << "[debug] run_batch exiting with code=" << exit_code << '\n';
    return exit_code;
}

int run_repl(bool quiet, const ddlsort::shell::ShellEngine::Config& config)
{
    replxx::Replxx repl;
    ddlsort::shell::ShellEngine engine{config};

    const auto history = history_path();
    if (!history.empty()) {
        (void)repl.history_load(history.string());
    }

    if (!quiet) {
        std::cout << "ddlsort shell: paste CREATE TABLE statements, finish a batch with an empty line or \\g.\n";
        std::cout << "Type \\help for commands, \\q to quit.\n";
    }

    auto submit = [&](const std::string& text) {
        const auto trimmed = trim(text);
        if (trimmed.empty()) {
            return;
        }
        repl.history_add(trimmed);
        const auto result = engine.execute(text);
        render_output(result);
        render_status(result, std::cout);
        if (!history.empty()) {
            (void)repl.history_save(history.string());
        }
    };

    std::string buffer;
    while (true) {
        const char* line = repl.input(buffer.empty() ? "ddlsort> " : "...> ");
        if (line == nullptr) {
            if (!buffer.empty()) {
                submit(buffer);
            }
            std::cout << '\n';
            break;
        }

        const auto trimmed = trim(std::string_view{line});
        if (buffer.empty() && trimmed.rfind("\\", 0U) == 0U) {
            if (trimmed == "\\q" || trimmed == "\\quit") {
                break;
            }
            if (trimmed == "\\g") {
                continue;
            }
            submit(trimmed);
            continue;
        }

        if (buffer.empty() && trimmed.rfind("@", 0U) == 0U) {
            const auto path = trim(std::string_view{trimmed}.substr(1U));
            if (path.empty()) {
                std::cerr << "error: file path is required after '@'" << '\n';
                continue;
            }

            std::ifstream file{path};
            if (!file.is_open()) {
                std::cerr << "error: failed to open file '" << path << "'" << '\n';
                continue;
            }

            std::string text;
            std::string error;
            if (!read_stream(file, text, error)) {
                std::cerr << "error: " << error << " ('" << path << "')" << '\n';
                continue;
            }
            submit(text);
            continue;
        }

        if (trimmed == "\\g" || (trimmed.empty() && !buffer.empty())) {
            submit(buffer);
            buffer.clear();
            continue;
        }

        if (trimmed.empty()) {
            continue;
        }

        buffer.append(line);
        buffer.push_back('\n');
    }

    std::cerr << "[debug] run_repl exiting with code=0\n";
    return 0;
}

}  // namespace

int main(int argc, char** argv)
{
    CLI::App app{"Reorders CREATE TABLE statements so referenced tables are created first."};

    bool quiet = false;
    bool markdown = false;
    bool append_unrecognized = false;
    bool ignore_self_references = false;
    std::vector<std::string> execute_commands;
    std::vector<std::string> input_files;
    std::string log_json_path;
    std::string workload_name = "OLTP";

    app.add_flag("-q,--quiet", quiet, "Suppress the banner and status lines");
    app.add_option("-c,--command", execute_commands, "Resolve the provided SQL batch and exit")
        ->type_name("SQL")
        ->expected(1);
    app.add_option("-f,--file", input_files, "Resolve the SQL batch in the specified file (use '-' for stdin)")
        ->type_name("PATH")
        ->expected(1);
    app.add_flag("--markdown", markdown, "Treat inputs as Markdown and reorder their ```sql blocks");
    app.add_flag("--append-unrecognized", append_unrecognized,
                 "Keep statements that are not CREATE TABLE after the ordered tables");
    app.add_flag("--ignore-self-references", ignore_self_references,
                 "Do not treat a table referencing itself as a circular dependency");
    app.add_option("--workload", workload_name, "Default workload for \\annotate (OLTP, OLAP, HTAP, STREAM, OLLP, BATCH)")
        ->capture_default_str();
    app.add_option("--log-json", log_json_path, "Write structured command logs as JSON Lines (use '-' for stdout)");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& error) {
        const auto code = app.exit(error);
        std::cerr << "[debug] exiting main via CLI parse error path code=" << code << '\n';
        return code;
    } catch (const std::exception& error) {
        std::cerr << "error: " << error.what() << '\n';
        std::cerr << "[debug] exiting main due to exception code=1\n";
        return 1;
    }

    ddlsort::shell::ShellEngine::Config config{};
    config.resolver.unrecognized_policy = append_unrecognized
                                              ? ddlsort::ddl::UnrecognizedStatementPolicy::AppendAfterOrdered
                                              : ddlsort::ddl::UnrecognizedStatementPolicy::Drop;
    config.resolver.ignore_self_references = ignore_self_references;

    const auto workload = ddlsort::advisor::parse_workload(workload_name);
    if (!workload) {
        std::cerr << "error: unknown workload '" << workload_name << "'" << '\n';
        std::cerr << "[debug] exiting main due to invalid workload code=1\n";
        return 1;
    }
    config.default_workload = *workload;

    std::unique_ptr<std::ofstream> log_file;
    std::ostream* log_stream = nullptr;
    std::mutex log_mutex;

    if (!log_json_path.empty()) {
        if (log_json_path == "-") {
            log_stream = &std::cout;
        } else {
            auto file = std::make_unique<std::ofstream>(log_json_path, std::ios::out | std::ios::app);
            if (!file->is_open()) {
                std::cerr << "error: failed to open log file '" << log_json_path << "'" << '\n';
                std::cerr << "[debug] exiting main due to log open failure code=1\n";
                return 1;
            }
            log_stream = file.get();
            log_file = std::move(file);
        }

        config.command_logger = [log_stream, &log_mutex](const ddlsort::shell::CommandMetrics& metrics) {
            const auto line = ddlsort::tools::format_command_log_json(metrics);
            std::lock_guard<std::mutex> guard{log_mutex};
            (*log_stream) << line << '\n';
            log_stream->flush();
        };
    }

    std::vector<InputSource> inputs;
    inputs.reserve(input_files.size() + execute_commands.size());

    bool stdin_consumed = false;
    for (const auto& path : input_files) {
        std::istream* input = nullptr;
        std::ifstream file_stream;
        if (path == "-") {
            if (stdin_consumed) {
                std::cerr << "error: stdin input '-' specified more than once" << '\n';
                std::cerr << "[debug] exiting main due to repeated stdin input code=1\n";
                return 1;
            }
            stdin_consumed = true;
            input = &std::cin;
        } else {
            file_stream.open(path, std::ios::in | std::ios::binary);
            if (!file_stream.is_open()) {
                std::cerr << "error: failed to open input file '" << path << "'" << '\n';
                std::cerr << "[debug] exiting main due to input open failure code=1\n";
                return 1;
            }
            input = &file_stream;
        }

        InputSource source{};
        source.label = path == "-" ? std::string{"<stdin>"} : path;
        std::string error;
        if (!read_stream(*input, source.text, error)) {
            std::cerr << "error: " << error << " ('" << source.label << "')" << '\n';
            std::cerr << "[debug] exiting main due to input read failure code=1\n";
            return 1;
        }
        inputs.push_back(std::move(source));
    }

    for (const auto& command : execute_commands) {
        inputs.push_back(InputSource{"<command>", command});
    }

    if (!inputs.empty()) {
        const auto code = run_batch(inputs, markdown, quiet, config);
        std::cerr << "[debug] exiting main via run_batch code=" << code << '\n';
        return code;
    }

    const auto repl_code = run_repl(quiet, config);
    std::cerr << "[debug] exiting main via run_repl code=" << repl_code << '\n';
    return repl_code;
}
