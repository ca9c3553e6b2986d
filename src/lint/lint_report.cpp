#include "terminus/lint/lint_report.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string_view>

namespace {

using terminus::lint::LintedFile;
using terminus::lint::Violation;
using terminus::syntax::SyntaxDiagnostic;
using terminus::syntax::SyntaxSeverity;

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

[[nodiscard]] std::string_view severity_to_string(SyntaxSeverity severity)
{
    switch (severity) {
    case SyntaxSeverity::Info:
        return "info";
    case SyntaxSeverity::Warning:
        return "warning";
    case SyntaxSeverity::Error:
    default:
        return "error";
    }
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

// Writes `"name":` with a separating comma after the first field.
class FieldWriter final {
public:
    explicit FieldWriter(std::string& out) : out_{out} {}

    void name(const char* field)
    {
        if (!first_) {
            out_.push_back(',');
        }
        first_ = false;
        out_.push_back('"');
        out_.append(field);
        out_.append("\":");
    }

    void string(const char* field, std::string_view value)
    {
        name(field);
        append_json_string(out_, value);
    }

    template <typename Number>
    void number(const char* field, Number value)
    {
        name(field);
        out_.append(std::to_string(value));
    }

    void boolean(const char* field, bool value)
    {
        name(field);
        out_.append(value ? "true" : "false");
    }

private:
    std::string& out_;
    bool first_ = true;
};

void append_violation_json(std::string& json, const Violation& violation)
{
    json.push_back('{');
    FieldWriter fields{json};
    fields.string("code", violation.code);
    fields.string("name", violation.name);
    fields.string("description", violation.description);
    fields.number("line", violation.line);
    fields.number("column", violation.column);
    fields.boolean("fixable", violation.fixable());
    json.push_back('}');
}

void append_diagnostic_json(std::string& json, const SyntaxDiagnostic& diagnostic)
{
    json.push_back('{');
    FieldWriter fields{json};
    fields.string("severity", severity_to_string(diagnostic.severity));
    fields.string("message", diagnostic.message);
    fields.number("line", diagnostic.line);
    fields.number("column", diagnostic.column);
    fields.string("excerpt", diagnostic.excerpt);
    fields.name("remediation_hints");
    json.push_back('[');
    for (std::size_t index = 0; index < diagnostic.remediation_hints.size(); ++index) {
        if (index > 0U) {
            json.push_back(',');
        }
        append_json_string(json, diagnostic.remediation_hints[index]);
    }
    json.push_back(']');
    json.push_back('}');
}

void append_file_fields(std::string& json, FieldWriter& fields, const LintedFile& file)
{
    fields.string("path", file.path);
    fields.boolean("success", file.success());

    fields.name("error");
    if (file.error) {
        append_json_string(json, file.error.message());
    } else {
        json.append("null");
    }

    fields.name("violations");
    json.push_back('[');
    for (std::size_t index = 0; index < file.violations.size(); ++index) {
        if (index > 0U) {
            json.push_back(',');
        }
        append_violation_json(json, file.violations[index]);
    }
    json.push_back(']');

    fields.name("diagnostics");
    json.push_back('[');
    for (std::size_t index = 0; index < file.diagnostics.size(); ++index) {
        if (index > 0U) {
            json.push_back(',');
        }
        append_diagnostic_json(json, file.diagnostics[index]);
    }
    json.push_back(']');
}

}  // namespace

namespace terminus::lint {

std::string format_violation_text(const std::string& path, const Violation& violation)
{
    std::ostringstream stream;
    stream << path << ':' << violation.line << ':' << violation.column << ": " << violation.code << ' '
           << violation.description;
    return stream.str();
}

std::string format_diagnostic_text(const std::string& path, const syntax::SyntaxDiagnostic& diagnostic)
{
    std::ostringstream stream;
    stream << path << ':' << diagnostic.line << ':' << diagnostic.column << ": "
           << severity_to_string(diagnostic.severity) << ": " << diagnostic.message;
    if (!diagnostic.excerpt.empty()) {
        stream << " [" << diagnostic.excerpt << ']';
    }
    return stream.str();
}

std::string format_lint_summary(const std::vector<LintedFile>& files)
{
    std::size_t violations = 0U;
    for (const auto& file : files) {
        violations += file.violations.size();
    }
    std::ostringstream stream;
    stream << violations << (violations == 1U ? " violation" : " violations") << " in " << files.size()
           << (files.size() == 1U ? " file" : " files");
    return stream.str();
}

std::string format_lint_report_json(const std::vector<LintedFile>& files)
{
    std::string json;
    json.reserve(256U * (files.size() + 1U));
    json.push_back('[');
    for (std::size_t index = 0; index < files.size(); ++index) {
        if (index > 0U) {
            json.push_back(',');
        }
        json.push_back('{');
        FieldWriter fields{json};
        append_file_fields(json, fields, files[index]);
        json.push_back('}');
    }
    json.push_back(']');
    return json;
}

std::string format_lint_log_json(const LintedFile& file)
{
    std::string json;
    json.reserve(512U);
    json.push_back('{');
    FieldWriter fields{json};
    append_file_fields(json, fields, file);
    fields.number("violation_count", file.violations.size());
    fields.number("duration_ms", file.duration_ms);

    const auto started = format_timestamp_iso(file.started_at);
    fields.name("started_at");
    if (started.empty()) {
        json.append("null");
    } else {
        append_json_string(json, started);
    }

    const auto finished = format_timestamp_iso(file.finished_at);
    fields.name("finished_at");
    if (finished.empty()) {
        json.append("null");
    } else {
        append_json_string(json, finished);
    }

    json.push_back('}');
    return json;
}

}  // namespace terminus::lint
