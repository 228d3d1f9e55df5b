#ifndef TAINTREACH_CHECKER_REPORT_TRIAGEREPORT_H
#define TAINTREACH_CHECKER_REPORT_TRIAGEREPORT_H

#include <llvm/ADT/ArrayRef.h>
#include <llvm/Support/raw_ostream.h>

#include <map>
#include <string>
#include <vector>

#include "Analysis/PathVerdict.h"
#include "Analysis/SinkAggregator.h"
#include "Checker/Report/SARIF.h"
#include "Checker/Report/SinkCategories.h"
#include "Checker/SinkResult.h"
#include "Classifier/NodeClassifier.h"

namespace taintreach {

/**
 * One enumerated path as it appears in the report, with node ids resolved.
 */
struct PathEvidence {
    std::vector<std::string> nodes;
    std::vector<BranchCondition> conditions;
    PathVerdict verdict;
    std::string protector_id; // empty if no node neutralized the taint
    std::string gate_id;      // empty if no authorization gate was seen
};

struct SinkEntry {
    std::string sink_id;
    SinkSubtype subtype = SinkSubtype::Other;
    SinkVerdict verdict;
    std::vector<PathEvidence> paths;
    std::vector<std::string> warnings;
    std::string error;

    const SinkCategory& get_category() const { return getSinkCategory(subtype); }
    bool has_error() const { return !error.empty(); }
};

struct ReportSummary {
    unsigned total_sinks = 0;
    unsigned total_paths = 0;
    unsigned live_paths = 0;
    unsigned errors = 0;
    std::map<SinkVerdictKind, unsigned> counts;

    unsigned count(SinkVerdictKind kind) const;
};

/**
 * TriageReport - the complete, deterministic result of one run.
 *
 * Sinks appear in declaration order. Rendering never touches the analysis
 * state, so the same inputs always produce byte-identical output.
 */
class TriageReport {
public:
    /**
     * Build the report from per-sink results. @p results must hold one entry
     * per sink of the graph, in sink declaration order.
     */
    static TriageReport render(const ClassifiedGraph& graph,
                               llvm::ArrayRef<SinkResult> results);

    const std::vector<SinkEntry>& get_sinks() const { return sinks; }
    const ReportSummary& get_summary() const { return summary; }
    const std::vector<UnclassifiableRoleError>& get_warnings() const { return warnings; }

    /// Looks a sink entry up by id; nullptr if absent.
    const SinkEntry* find_sink(llvm::StringRef sink_id) const;

    /**
     * Write the JSON report
     */
    void generate_json_report(llvm::raw_ostream& OS, bool pretty = true) const;
    std::string to_json_string(bool pretty = true) const;

    /**
     * SARIF log with one result per exploitable sink
     */
    sarif::SarifLog to_sarif() const;

    /**
     * Print summary statistics to console
     */
    void print_summary(llvm::raw_ostream& OS) const;

private:
    std::vector<SinkEntry> sinks;
    ReportSummary summary;
    std::vector<UnclassifiableRoleError> warnings;
};

} // namespace taintreach

#endif // TAINTREACH_CHECKER_REPORT_TRIAGEREPORT_H
