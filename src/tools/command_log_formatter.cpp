#include "ddlsort/tools/command_log_formatter.hpp"

#include "ddlsort/ddl/ddl_resolver.hpp"
#include "ddlsort/ddl/parser_diagnostics.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string_view>

namespace {

void append_json_string(std::string& out, std::string_view text)
{
    out.push_back('"');
    for (unsigned char ch : text) {
        switch (ch) {
        case '"':
            out.append("\\\"");
            break;
        case '\\':
            out.append("\\\\");
            break;
        case '\b':
            out.append("\\b");
            break;
        case '\f':
            out.append("\\f");
            break;
        case '\n':
            out.append("\\n");
            break;
        case '\r':
            out.append("\\r");
            break;
        case '\t':
            out.append("\\t");
            break;
        default:
            if (ch < 0x20U) {
                constexpr char kHex[] = "0123456789ABCDEF";
                out.append("\\u00");
                out.push_back(kHex[(ch >> 4U) & 0x0F]);
                out.push_back(kHex[ch & 0x0F]);
            } else {
                out.push_back(static_cast<char>(ch));
            }
            break;
        }
    }
    out.push_back('"');
}

void append_string_array(std::string& out, const std::vector<std::string>& values)
{
    out.push_back('[');
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0U) {
            out.push_back(',');
        }
        append_json_string(out, values[i]);
    }
    out.push_back(']');
}

[[nodiscard]] std::string format_timestamp_iso(std::chrono::system_clock::time_point tp)
{
    if (tp.time_since_epoch().count() == 0) {
        return {};
    }

    const auto time_value = std::chrono::system_clock::to_time_t(tp);
    std::tm buffer{};
#if defined(_WIN32)
    gmtime_s(&buffer, &time_value);
#else
    gmtime_r(&time_value, &buffer);
#endif

    std::ostringstream stream;
    stream << std::put_time(&buffer, "%Y-%m-%dT%H:%M:%S");
    const auto fractional = tp - std::chrono::system_clock::from_time_t(time_value);
    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(fractional).count();
    stream << '.' << std::setw(6) << std::setfill('0') << micros << 'Z';
    return stream.str();
}

}  // namespace

namespace ddlsort::tools {

std::string format_command_log_json(const ddlsort::shell::CommandMetrics& metrics)
{
    std::string json;
    json.reserve(512U);
    json.push_back('{');
    bool first = true;

    auto append_field = [&](const char* name) {
        if (!first) {
            json.push_back(',');
        }
        first = false;
        json.push_back('"');
        json.append(name);
        json.push_back('"');
        json.push_back(':');
    };

    auto append_timestamp_field = [&](const char* name, std::chrono::system_clock::time_point tp) {
        append_field(name);
        const auto text = format_timestamp_iso(tp);
        if (text.empty()) {
            json.append("null");
        } else {
            append_json_string(json, text);
        }
    };

    append_field("correlation_id");
    append_json_string(json, metrics.correlation_id);
    append_field("category");
    append_json_string(json, metrics.command_category);
    append_field("input");
    append_json_string(json, metrics.command_text);
    append_field("summary");
    append_json_string(json, metrics.summary);
    append_field("success");
    json.append(metrics.success ? "true" : "false");

    append_field("outcome");
    if (metrics.outcome) {
        append_json_string(json, ddlsort::ddl::outcome_to_string(*metrics.outcome));
    } else {
        json.append("null");
    }

    append_field("duration_ms");
    json.append(std::to_string(metrics.duration_ms));

    append_timestamp_field("started_at", metrics.started_at);
    append_timestamp_field("finished_at", metrics.finished_at);

    append_field("detail_lines");
    append_string_array(json, metrics.detail_lines);

    append_field("diagnostics");
    json.push_back('[');
    for (std::size_t i = 0; i < metrics.diagnostics.size(); ++i) {
        if (i > 0U) {
            json.push_back(',');
        }
        const auto& diagnostic = metrics.diagnostics[i];
        json.append("{\"severity\":");
        append_json_string(json, ddlsort::ddl::severity_to_string(diagnostic.severity));
        json.append(",\"message\":");
        append_json_string(json, diagnostic.message);
        json.append(",\"line\":");
        json.append(std::to_string(diagnostic.line));
        json.append(",\"column\":");
        json.append(std::to_string(diagnostic.column));
        json.append(",\"statement\":");
        append_json_string(json, diagnostic.statement);
        json.append(",\"remediation_hints\":");
        append_string_array(json, diagnostic.remediation_hints);
        json.push_back('}');
    }
    json.push_back(']');

    json.push_back('}');
    return json;
}

}  // namespace ddlsort::tools
