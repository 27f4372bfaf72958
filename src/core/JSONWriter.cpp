#include "JSONWriter.h"
#include "BuildInfo.h"
#include "JsonUtil.h"
#include <cctype>
#include <sstream>

namespace secret_guard {
namespace {

    using jsonutil::escape; using jsonutil::time_to_iso;

    static std::string quoted(const std::string& s) {
        return "\"" + escape(s) + "\"";
    }

    static void emit_meta(std::ostream& os, const Report& report) {
        os << "\"meta\":{\"tool\":\"secret-guard\",\"version\":" << quoted(buildinfo::APP_VERSION)
           << ",\"git_commit\":" << quoted(buildinfo::GIT_COMMIT)
           << ",\"start_time\":" << quoted(time_to_iso(report.start_time()))
           << ",\"end_time\":" << quoted(time_to_iso(report.end_time())) << "}";
    }

    static void emit_summary(std::ostream& os, const Report& report, const RuleRegistry& registry) {
        const auto& results = report.results();
        size_t scanned = report.count_status(FileStatus::Scanned);
        size_t files_with_findings = 0;
        for(const auto& r : results) if(!r.findings.empty()) ++files_with_findings;
        os << "\"summary\":{\"files_total\":" << results.size()
           << ",\"files_scanned\":" << scanned
           << ",\"files_skipped\":" << (results.size() - scanned)
           << ",\"files_with_findings\":" << files_with_findings
           << ",\"findings\":" << report.finding_count()
           << ",\"rules\":" << registry.size() << "}";
    }

    static void emit_files(std::ostream& os, const Report& report) {
        os << "\"files\":[";
        bool first = true;
        for(const auto& r : report.results()) {
            if(!first) os << ",";
            first = false;
            os << "{\"path\":" << quoted(r.path) << ",\"status\":" << quoted(to_string(r.status));
            if(r.status != FileStatus::Missing && r.status != FileStatus::NotRegular) os << ",\"size\":" << r.size_bytes;
            if(!r.sha256.empty()) os << ",\"sha256\":" << quoted(r.sha256);
            os << ",\"findings\":" << r.findings.size() << "}";
        }
        os << "]";
    }

    static void emit_findings(std::ostream& os, const Report& report) {
        os << "\"findings\":[";
        bool first = true;
        for(const auto& f : report.findings()) {
            if(!first) os << ",";
            first = false;
            os << "{\"path\":" << quoted(f.path) << ",\"line\":" << f.line_number << ",\"rule\":" << quoted(f.rule_name) << "}";
        }
        os << "]";
    }

    static std::string rule_id(const std::string& name) {
        std::string id;
        for(char c : name) id.push_back(c == ' ' ? '-' : static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        return id;
    }

    static std::string generate_sarif_output(const Report& report, const RuleRegistry& registry) {
        std::ostringstream s;
        s << "{\"$schema\":\"https://json.schemastore.org/sarif-2.1.0.json\",\"version\":\"2.1.0\",\"runs\":[{";
        s << "\"tool\":{\"driver\":{\"name\":\"secret-guard\",\"version\":" << quoted(buildinfo::APP_VERSION) << ",\"rules\":[";
        bool first = true;
        for(const auto& rule : registry.rules()) {
            if(!first) s << ",";
            first = false;
            s << "{\"id\":" << quoted(rule_id(rule.name)) << ",\"name\":" << quoted(rule.name)
              << ",\"shortDescription\":{\"text\":" << quoted("Potential " + rule.name) << "}}";
        }
        s << "]}},";

        s << "\"artifacts\":[";
        first = true;
        for(const auto& r : report.results()) {
            if(r.status != FileStatus::Scanned) continue;
            if(!first) s << ",";
            first = false;
            s << "{\"location\":{\"uri\":" << quoted(r.path) << "},\"length\":" << r.size_bytes;
            if(!r.sha256.empty()) s << ",\"hashes\":{\"sha-256\":" << quoted(r.sha256) << "}";
            s << "}";
        }
        s << "],";

        s << "\"results\":[";
        first = true;
        for(const auto& f : report.findings()) {
            if(!first) s << ",";
            first = false;
            s << "{\"ruleId\":" << quoted(rule_id(f.rule_name)) << ",\"level\":\"warning\""
              << ",\"message\":{\"text\":" << quoted("Potential " + f.rule_name) << "}"
              << ",\"locations\":[{\"physicalLocation\":{\"artifactLocation\":{\"uri\":" << quoted(f.path)
              << "},\"region\":{\"startLine\":" << f.line_number << "}}}]}";
        }
        s << "]}]}";
        return s.str();
    }

    static std::string pretty_print_json(const std::string& compact_json) {
        std::string out;
        out.reserve(compact_json.size() * 2);
        int depth = 0;
        bool in_string = false;
        bool esc = false;

        auto newline = [&](int d) {
            out.push_back('\n');
            for(int i = 0; i < d; i++) out.append("  ");
        };

        for(size_t i = 0; i < compact_json.size(); ++i) {
            char c = compact_json[i];
            if(in_string) {
                out.push_back(c);
                if(esc) esc = false;
                else if(c == '\\') esc = true;
                else if(c == '"') in_string = false;
                continue;
            }
            switch(c) {
                case '"':
                    out.push_back(c);
                    in_string = true;
                    break;
                case '{':
                case '[':
                    out.push_back(c);
                    // keep empty containers on one line
                    if(i + 1 < compact_json.size() && (compact_json[i+1] == '}' || compact_json[i+1] == ']')) {
                        out.push_back(compact_json[++i]);
                        break;
                    }
                    newline(++depth);
                    break;
                case '}':
                case ']':
                    if(depth > 0) --depth;
                    newline(depth);
                    out.push_back(c);
                    break;
                case ',':
                    out.push_back(c);
                    newline(depth);
                    break;
                case ':':
                    out.append(": ");
                    break;
                default:
                    out.push_back(c);
                    break;
            }
        }
        out.push_back('\n');
        return out;
    }

} // end anonymous namespace

std::string JSONWriter::write(const Report& report, const RuleRegistry& registry, const Config& cfg) const {
    std::string compact;
    if(cfg.sarif) {
        compact = generate_sarif_output(report, registry);
    } else {
        std::ostringstream os;
        os << "{";
        emit_meta(os, report);
        os << ",";
        emit_summary(os, report, registry);
        os << ",";
        emit_files(os, report);
        os << ",";
        emit_findings(os, report);
        os << "}";
        compact = os.str();
    }

    if(cfg.pretty && !cfg.compact) {
        return pretty_print_json(compact);
    }
    return compact + "\n";
}

} // namespace secret_guard
