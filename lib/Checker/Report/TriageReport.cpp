#include "Checker/Report/TriageReport.h"

#include <llvm/Support/Format.h>

#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace taintreach {

namespace {

typedef rapidjson::Value JsonValue;
typedef rapidjson::Document::AllocatorType JsonAllocator;

const SinkVerdictKind AllSinkVerdicts[] = {
    SinkVerdictKind::MustFix, SinkVerdictKind::GoodToFix,
    SinkVerdictKind::FalsePositive, SinkVerdictKind::DeadCode,
    SinkVerdictKind::Error,
};

JsonValue json_string(llvm::StringRef str, JsonAllocator& allocator) {
    JsonValue val;
    val.SetString(str.data(), static_cast<rapidjson::SizeType>(str.size()), allocator);
    return val;
}

JsonValue json_evidence(const PathEvidence& path, JsonAllocator& allocator) {
    const PathVerdict& v = path.verdict;
    JsonValue evidence(rapidjson::kObjectType);
    evidence.AddMember("authGateSeen", v.AuthGateSeen, allocator);
    evidence.AddMember("rateLimiterSeen", v.RateLimiterSeen, allocator);
    evidence.AddMember("weakValidatorSeen", v.WeakValidatorSeen, allocator);
    evidence.AddMember("reliesOnRuntime", v.ReliesOnRuntime, allocator);
    evidence.AddMember("truncated", v.Truncated, allocator);
    if (!path.protector_id.empty())
        evidence.AddMember("protector", json_string(path.protector_id, allocator), allocator);
    if (!path.gate_id.empty())
        evidence.AddMember("gate", json_string(path.gate_id, allocator), allocator);
    if (v.Dead != DeadReason::None)
        evidence.AddMember("deadReason", json_string(toString(v.Dead), allocator), allocator);
    return evidence;
}

JsonValue json_path(const PathEvidence& path, JsonAllocator& allocator) {
    JsonValue obj(rapidjson::kObjectType);

    JsonValue nodes(rapidjson::kArrayType);
    for (const std::string& id : path.nodes)
        nodes.PushBack(json_string(id, allocator), allocator);
    obj.AddMember("nodes", nodes, allocator);

    JsonValue conditions(rapidjson::kArrayType);
    for (BranchCondition cond : path.conditions)
        conditions.PushBack(json_string(toString(cond), allocator), allocator);
    obj.AddMember("conditions", conditions, allocator);

    obj.AddMember("verdict", json_string(toString(path.verdict.Kind), allocator), allocator);
    obj.AddMember("evidence", json_evidence(path, allocator), allocator);
    return obj;
}

JsonValue json_sink(const SinkEntry& sink, JsonAllocator& allocator) {
    const SinkCategory& category = sink.get_category();
    JsonValue obj(rapidjson::kObjectType);
    obj.AddMember("sinkId", json_string(sink.sink_id, allocator), allocator);
    obj.AddMember("subtype", json_string(toString(sink.subtype), allocator), allocator);
    obj.AddMember("category", json_string(category.Name, allocator), allocator);
    obj.AddMember("cwe", json_string(category.CWE, allocator), allocator);
    obj.AddMember("overallVerdict", json_string(toString(sink.verdict.Overall), allocator), allocator);

    JsonValue reasons(rapidjson::kArrayType);
    for (PathVerdictKind kind : sink.verdict.Reasons)
        reasons.PushBack(json_string(toString(kind), allocator), allocator);
    obj.AddMember("reasons", reasons, allocator);

    obj.AddMember("livePaths", sink.verdict.NumLive, allocator);
    obj.AddMember("deadPaths", sink.verdict.NumDead, allocator);
    obj.AddMember("confidence", sink.verdict.Confidence, allocator);
    obj.AddMember("rationale", json_string(sink.verdict.Rationale, allocator), allocator);

    JsonValue paths(rapidjson::kArrayType);
    for (const PathEvidence& path : sink.paths)
        paths.PushBack(json_path(path, allocator), allocator);
    obj.AddMember("paths", paths, allocator);

    JsonValue warnings(rapidjson::kArrayType);
    for (const std::string& w : sink.warnings)
        warnings.PushBack(json_string(w, allocator), allocator);
    obj.AddMember("warnings", warnings, allocator);

    if (sink.has_error())
        obj.AddMember("error", json_string(sink.error, allocator), allocator);
    else
        obj.AddMember("error", JsonValue(rapidjson::kNullType), allocator);
    return obj;
}

} // namespace

unsigned ReportSummary::count(SinkVerdictKind kind) const {
    auto it = counts.find(kind);
    return it == counts.end() ? 0 : it->second;
}

TriageReport TriageReport::render(const ClassifiedGraph& graph,
                                  llvm::ArrayRef<SinkResult> results) {
    const TaintGraph& G = graph.getGraph();
    TriageReport report;

    for (SinkVerdictKind kind : AllSinkVerdicts)
        report.summary.counts[kind] = 0;

    for (const SinkResult& result : results) {
        SinkEntry entry;
        entry.sink_id = G.getNode(result.Sink).getId();
        entry.subtype = graph.getClassification(result.Sink).Subtype;
        entry.verdict = result.Verdict;
        entry.warnings = result.Warnings;
        entry.error = result.Error;

        for (size_t i = 0; i < result.Paths.size(); ++i) {
            const TaintPath& path = result.Paths[i];
            PathEvidence evidence;
            for (unsigned node : path.Nodes)
                evidence.nodes.push_back(G.getNode(node).getId());
            evidence.conditions = path.Conditions;
            evidence.verdict = result.Verdicts[i];
            if (evidence.verdict.Protector)
                evidence.protector_id = G.getNode(*evidence.verdict.Protector).getId();
            if (evidence.verdict.Gate)
                evidence.gate_id = G.getNode(*evidence.verdict.Gate).getId();
            entry.paths.push_back(std::move(evidence));
        }

        report.summary.total_paths += static_cast<unsigned>(result.Paths.size());
        report.summary.live_paths += result.Verdict.NumLive;
        if (entry.has_error())
            report.summary.errors++;
        report.summary.counts[entry.verdict.Overall]++;
        report.sinks.push_back(std::move(entry));
    }

    report.summary.total_sinks = static_cast<unsigned>(report.sinks.size());
    report.warnings = graph.getDiagnostics();
    return report;
}

const SinkEntry* TriageReport::find_sink(llvm::StringRef sink_id) const {
    for (const SinkEntry& entry : sinks) {
        if (entry.sink_id == sink_id)
            return &entry;
    }
    return nullptr;
}

std::string TriageReport::to_json_string(bool pretty) const {
    rapidjson::Document doc;
    doc.SetObject();
    auto& allocator = doc.GetAllocator();

    JsonValue sinks_array(rapidjson::kArrayType);
    for (const SinkEntry& sink : sinks)
        sinks_array.PushBack(json_sink(sink, allocator), allocator);
    doc.AddMember("sinks", sinks_array, allocator);

    JsonValue summary_obj(rapidjson::kObjectType);
    summary_obj.AddMember("totalSinks", summary.total_sinks, allocator);
    summary_obj.AddMember("totalPaths", summary.total_paths, allocator);
    summary_obj.AddMember("livePaths", summary.live_paths, allocator);
    summary_obj.AddMember("errors", summary.errors, allocator);
    JsonValue counts(rapidjson::kObjectType);
    for (SinkVerdictKind kind : AllSinkVerdicts) {
        JsonValue key = json_string(toString(kind), allocator);
        counts.AddMember(key, summary.count(kind), allocator);
    }
    summary_obj.AddMember("counts", counts, allocator);
    doc.AddMember("summary", summary_obj, allocator);

    JsonValue warnings_array(rapidjson::kArrayType);
    for (const UnclassifiableRoleError& diag : warnings) {
        JsonValue w(rapidjson::kObjectType);
        w.AddMember("nodeId", json_string(diag.NodeId, allocator), allocator);
        w.AddMember("tag", json_string(diag.TagKey, allocator), allocator);
        w.AddMember("value", json_string(diag.TagValue, allocator), allocator);
        w.AddMember("message", json_string(diag.message(), allocator), allocator);
        warnings_array.PushBack(w, allocator);
    }
    doc.AddMember("warnings", warnings_array, allocator);

    rapidjson::StringBuffer buffer;
    if (pretty) {
        rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
        doc.Accept(writer);
    } else {
        rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
        doc.Accept(writer);
    }
    return buffer.GetString();
}

void TriageReport::generate_json_report(llvm::raw_ostream& OS, bool pretty) const {
    OS << to_json_string(pretty) << "\n";
}

sarif::SarifLog TriageReport::to_sarif() const {
    sarif::SarifLog log;

    const SinkSubtype subtypes[] = {SinkSubtype::SQL, SinkSubtype::Template, SinkSubtype::Other};
    for (SinkSubtype subtype : subtypes) {
        const SinkCategory& category = getSinkCategory(subtype);
        sarif::Rule rule(category.RuleId.str(), category.Name.str(),
                         category.Name.str() + " reachable from untrusted input",
                         category.CWE.str());
        rule.importance = SinkDescription::to_string(category.Importance);
        rule.classification = SinkDescription::to_string(category.Classification);
        log.addRule(rule);
    }

    for (const SinkEntry& sink : sinks) {
        SinkVerdictKind overall = sink.verdict.Overall;
        if (overall != SinkVerdictKind::MustFix && overall != SinkVerdictKind::GoodToFix)
            continue;

        const SinkCategory& category = sink.get_category();
        sarif::Result result(category.RuleId.str(),
                             category.Name.str() + " at '" + sink.sink_id + "': " +
                                 sink.verdict.Rationale);
        result.level = overall == SinkVerdictKind::MustFix ? sarif::Level::Error
                                                           : sarif::Level::Warning;
        result.locations.push_back(sarif::Location(sink.sink_id));

        // Nodes of the first exploitable path, entry first.
        for (const PathEvidence& path : sink.paths) {
            if (!isExploitable(path.verdict.Kind))
                continue;
            for (size_t i = 0; i + 1 < path.nodes.size(); ++i)
                result.relatedLocations.push_back(sarif::Location(
                    path.nodes[i], i == 0 ? "entry point" : "on path"));
            break;
        }

        result.properties.emplace_back("verdict", toString(overall).str());
        result.properties.emplace_back("confidence", std::to_string(sink.verdict.Confidence));
        log.addResult(result);
    }
    return log;
}

void TriageReport::print_summary(llvm::raw_ostream& OS) const {
    OS << "\n==================================================\n";
    OS << "             Taint Path Triage Summary\n";
    OS << "==================================================\n\n";

    for (const SinkEntry& sink : sinks) {
        OS << llvm::format("%-16s", toString(sink.verdict.Overall).str().c_str())
           << sink.sink_id << " (" << sink.get_category().Name << ")\n";
        if (sink.has_error()) {
            OS << "  Error: " << sink.error << "\n\n";
            continue;
        }
        OS << "  " << sink.verdict.Rationale
           << " | Confidence: " << sink.verdict.Confidence << "\n";
        for (const std::string& w : sink.warnings)
            OS << "  Warning: " << w << "\n";
        OS << "\n";
    }

    for (const UnclassifiableRoleError& diag : warnings)
        OS << "Warning: " << diag.message() << "\n";
    if (!warnings.empty())
        OS << "\n";

    OS << "==================================================\n";
    OS << "Sinks: " << summary.total_sinks << " | Paths: " << summary.total_paths
       << " (" << summary.live_paths << " live)\n";
    bool first = true;
    for (SinkVerdictKind kind : AllSinkVerdicts) {
        if (!first)
            OS << " | ";
        OS << toString(kind) << ": " << summary.count(kind);
        first = false;
    }
    OS << "\n";
    OS << "==================================================\n\n";
}

} // namespace taintreach
