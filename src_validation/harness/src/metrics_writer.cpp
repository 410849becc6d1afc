#include "bundle_validation/metrics_writer.hpp"

#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace {

using nlohmann::json;
using bundle::validation::MissingEntry;
using bundle::validation::ScenarioOutcome;

json missing_to_json(const MissingEntry& entry) {
    return json{
        {"kind", entry.kind == MissingEntry::Kind::Artifact ? "artifact" : "pattern"},
        {"pattern", entry.pattern},
        {"target", entry.target},
    };
}

json outcome_to_json(const ScenarioOutcome& outcome) {
    json attributes = json::object();
    for (const auto& [key, value] : outcome.scenario.attributes) {
        attributes[key] = value;
    }

    json artifacts = json::array();
    for (const auto& path : outcome.artifacts) {
        artifacts.push_back(path.string());
    }

    json executions = json::array();
    for (const auto& run : outcome.executions) {
        executions.push_back({{"artifact", run.artifact.path().string()}, {"exit_code", run.exit_code}});
    }

    json missing = json::array();
    for (const auto& entry : outcome.missing) {
        missing.push_back(missing_to_json(entry));
    }

    return json{
        {"id", outcome.scenario.id},
        {"suite", outcome.scenario.suite},
        {"script", outcome.scenario.script},
        {"mode", std::string{bundle::validation::to_string(outcome.scenario.mode)}},
        {"status", outcome.status},
        {"stage", std::string{bundle::validation::to_string(outcome.stage)}},
        {"message", outcome.message},
        {"artifacts", std::move(artifacts)},
        {"executions", std::move(executions)},
        {"missing", std::move(missing)},
        {"attributes", std::move(attributes)},
    };
}

json build_summary(const std::vector<ScenarioOutcome>& outcomes) {
    json summary = {
        {"total", outcomes.size()},
        {"by_status", json::object()},
        {"scenarios", json::array()},
    };

    auto& by_status = summary["by_status"];
    for (const auto& outcome : outcomes) {
        summary["scenarios"].push_back(outcome_to_json(outcome));
        auto& counter = by_status[outcome.status];
        if (!counter.is_number()) {
            counter = 0;
        }
        counter = counter.get<std::size_t>() + 1;
    }

    return summary;
}

std::string escape_html(const std::string& input) {
    std::ostringstream oss;
    for (char ch : input) {
        switch (ch) {
            case '&':
                oss << "&amp;";
                break;
            case '<':
                oss << "&lt;";
                break;
            case '>':
                oss << "&gt;";
                break;
            case '"':
                oss << "&quot;";
                break;
            case '\'':
                oss << "&#39;";
                break;
            case '\n':
                oss << "<br/>";
                break;
            default:
                oss << ch;
        }
    }
    return oss.str();
}

std::string artifacts_to_html(const ScenarioOutcome& outcome) {
    if (outcome.artifacts.empty()) {
        return {};
    }
    std::map<std::string, int> exit_codes;
    for (const auto& run : outcome.executions) {
        exit_codes[run.artifact.path().string()] = run.exit_code;
    }

    std::ostringstream oss;
    oss << "<ul>";
    for (const auto& path : outcome.artifacts) {
        const auto text = path.string();
        oss << "<li>" << escape_html(text);
        if (const auto it = exit_codes.find(text); it != exit_codes.end()) {
            oss << " <em>(exit " << it->second << ")</em>";
        }
        oss << "</li>";
    }
    oss << "</ul>";
    return oss.str();
}

std::string attributes_to_html(const std::map<std::string, std::string>& attributes) {
    if (attributes.empty()) {
        return {};
    }
    std::ostringstream oss;
    oss << "<ul>";
    for (const auto& [key, value] : attributes) {
        oss << "<li><strong>" << escape_html(key) << ":</strong> " << escape_html(value)
            << "</li>";
    }
    oss << "</ul>";
    return oss.str();
}

std::string render_html(const std::vector<ScenarioOutcome>& outcomes) {
    std::ostringstream oss;
    oss << "<!DOCTYPE html><html><head><meta charset=\"utf-8\"/>"
        << "<title>Bundle Validation Report</title>"
        << "<style>"
        << "body{font-family:system-ui, sans-serif;margin:2rem;}"
        << "table{border-collapse:collapse;width:100%;}"
        << "th,td{border:1px solid #ccc;padding:0.5rem;vertical-align:top;}"
        << "th{background:#f5f5f5;text-align:left;}"
        << ".status-PASS{color:#0a7c2f;font-weight:bold;}"
        << ".status-FAIL{color:#c1121f;font-weight:bold;}"
        << ".status-ERROR{color:#b000b5;font-weight:bold;}"
        << "</style></head><body>";

    oss << "<h1>Bundle Validation Report</h1>";

    std::map<std::string, std::size_t> counts;
    for (const auto& outcome : outcomes) {
        ++counts[outcome.status];
    }

    oss << "<section><h2>Summary</h2><ul>";
    oss << "<li>Total scenarios: " << outcomes.size() << "</li>";
    for (const auto& [status, count] : counts) {
        oss << "<li>" << escape_html(status) << ": " << count << "</li>";
    }
    oss << "</ul></section>";

    oss << "<section><h2>Scenarios</h2><table>";
    oss << "<thead><tr>"
        << "<th>#</th>"
        << "<th>Suite</th>"
        << "<th>Scenario</th>"
        << "<th>Mode</th>"
        << "<th>Status</th>"
        << "<th>Stage</th>"
        << "<th>Message</th>"
        << "<th>Executables</th>"
        << "<th>Attributes</th>"
        << "</tr></thead><tbody>";

    for (std::size_t index = 0; index < outcomes.size(); ++index) {
        const auto& outcome = outcomes[index];
        const auto status_class = "status-" + outcome.status;

        oss << "<tr>";
        oss << "<td>" << (index + 1) << "</td>";
        oss << "<td>" << escape_html(outcome.scenario.suite) << "</td>";
        oss << "<td>" << escape_html(outcome.scenario.id) << "</td>";
        oss << "<td>" << bundle::validation::to_string(outcome.scenario.mode) << "</td>";
        oss << "<td class=\"" << escape_html(status_class) << "\">"
            << escape_html(outcome.status) << "</td>";
        oss << "<td>" << bundle::validation::to_string(outcome.stage) << "</td>";
        oss << "<td>" << escape_html(outcome.message) << "</td>";
        oss << "<td>" << artifacts_to_html(outcome) << "</td>";
        oss << "<td>" << attributes_to_html(outcome.scenario.attributes) << "</td>";
        oss << "</tr>";
    }

    oss << "</tbody></table></section>";
    oss << "</body></html>";
    return oss.str();
}

void ensure_parent(const std::filesystem::path& destination) {
    const auto parent = destination.parent_path();
    if (!parent.empty() && !std::filesystem::exists(parent)) {
        std::filesystem::create_directories(parent);
    }
}

void write_file(const std::filesystem::path& destination, const std::string& content) {
    ensure_parent(destination);
    std::ofstream output(destination, std::ios::binary);
    if (!output.is_open()) {
        throw std::runtime_error("Unable to open output file: " + destination.string());
    }
    output << content;
}

}  // namespace

namespace bundle::validation {

void MetricsWriter::write_summary(const std::filesystem::path& destination,
                                  const std::vector<ScenarioOutcome>& outcomes) const {
    const json summary = build_summary(outcomes);
    write_file(destination, summary.dump(2));
}

void MetricsWriter::write_detailed(const std::filesystem::path& destination,
                                   const std::vector<ScenarioOutcome>& outcomes) const {
    const auto html = render_html(outcomes);
    write_file(destination, html);
}

}  // namespace bundle::validation
