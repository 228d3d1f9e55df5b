/**
 * @file taintreach.cpp
 * @brief Taint path triage tool
 *
 * Reads an annotated call graph, classifies every source-to-sink path and
 * writes one verdict per sink (MUST_FIX, GOOD_TO_FIX, FALSE_POSITIVE,
 * DEAD_CODE).
 *
 *   taintreach classify --graph app.json --out report.json [--sarif r.sarif]
 *
 * Exit status: 0 on success, 2 on malformed graph input, 1 on any other
 * failure (unwritable output, timeout, internal error).
 */

#include <llvm/ADT/Statistic.h>
#include <llvm/Support/CommandLine.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/InitLLVM.h>
#include <llvm/Support/raw_ostream.h>

#include <chrono>
#include <memory>
#include <string>

#include "Checker/PolicyConfigParser.h"
#include "Checker/Report/TriageReport.h"
#include "Checker/TaintPathChecker.h"
#include "Classifier/NodeClassifier.h"
#include "Graph/GraphError.h"
#include "Graph/GraphReader.h"
#include "Support/Debug.h"

using namespace llvm;
using namespace taintreach;

static cl::SubCommand Classify("classify",
                               "Classify every sink of an annotated call graph");

static cl::OptionCategory ClassifyCategory("Classification Options");

static cl::opt<std::string> GraphFile("graph", cl::desc("Input graph (JSON)"),
                                      cl::value_desc("filename"), cl::Required,
                                      cl::sub(Classify), cl::cat(ClassifyCategory));

static cl::opt<std::string> OutputFile("out", cl::desc("Output report (JSON)"),
                                       cl::value_desc("filename"), cl::Required,
                                       cl::sub(Classify), cl::cat(ClassifyCategory));

static cl::opt<std::string> SarifFile("sarif",
                                      cl::desc("Also write a SARIF 2.1.0 log to the specified file"),
                                      cl::value_desc("filename"), cl::init(""),
                                      cl::sub(Classify), cl::cat(ClassifyCategory));

static cl::opt<std::string> PolicyFile("policy",
                                       cl::desc("Aggregation policy file (.policy)"),
                                       cl::value_desc("filename"), cl::init(""),
                                       cl::sub(Classify), cl::cat(ClassifyCategory));

static cl::opt<unsigned> NumJobs("jobs",
                                 cl::desc("Number of worker threads (0 = one per core)"),
                                 cl::init(0), cl::sub(Classify), cl::cat(ClassifyCategory));

static cl::opt<unsigned> TimeoutMs("timeout-ms",
                                   cl::desc("Abort the run after this many milliseconds (0 = no limit)"),
                                   cl::init(0), cl::sub(Classify), cl::cat(ClassifyCategory));

static cl::opt<bool> PrintSummary("summary", cl::desc("Print a triage summary to stdout"),
                                  cl::init(false), cl::sub(Classify), cl::cat(ClassifyCategory));

static cl::opt<bool> Quiet("quiet", cl::desc("Suppress informational messages"),
                           cl::init(false), cl::sub(Classify), cl::cat(ClassifyCategory));

static cl::opt<bool> PrintStats("print-stats", cl::desc("Print LLVM statistics"),
                                cl::init(false), cl::sub(Classify), cl::cat(ClassifyCategory));

static int runClassify() {
    if (PrintStats) {
        llvm::EnableStatistics();
    }
    setLogQuiet(Quiet);

    CheckerOptions Opts;
    if (!PolicyFile.empty()) {
        std::unique_ptr<AggregationPolicy> Policy = PolicyConfigParser::parse_file(PolicyFile);
        if (!Policy) {
            return 1;
        }
        Opts.Policy = *Policy;
        if (!Quiet) {
            outs() << "Policy '" << PolicyFile << "': ";
            PolicyConfigParser::dump(Opts.Policy, outs());
        }
    }
    Opts.NumJobs = NumJobs;
    Opts.Timeout = std::chrono::milliseconds(TimeoutMs.getValue());

    TaintGraph G;
    try {
        G = GraphReader::readFile(GraphFile);
    } catch (const StructuralGraphError &e) {
        errs() << "Error: malformed graph '" << GraphFile << "': " << e.what() << "\n";
        return 2;
    }
    TAINTREACH_INFO("Loaded graph: " << G.getNumNodes() << " nodes, "
                    << G.getNumEdges() << " edges, " << G.getSinks().size() << " sinks");

    try {
        ClassifiedGraph CG(G);
        TaintPathChecker Checker(CG, Opts);
        std::vector<SinkResult> Results = Checker.run();
        TriageReport Report = TriageReport::render(CG, Results);

        std::error_code EC;
        raw_fd_ostream OS(OutputFile, EC, sys::fs::OF_Text);
        if (EC) {
            errs() << "Error: cannot open '" << OutputFile << "': " << EC.message() << "\n";
            return 1;
        }
        Report.generate_json_report(OS);
        OS.close();
        if (OS.has_error()) {
            errs() << "Error: failed writing '" << OutputFile << "'\n";
            OS.clear_error();
            return 1;
        }
        TAINTREACH_INFO("Report written to " << OutputFile);

        if (!SarifFile.empty()) {
            if (!Report.to_sarif().writeToFile(SarifFile)) {
                errs() << "Error: failed writing '" << SarifFile << "'\n";
                return 1;
            }
            TAINTREACH_INFO("SARIF log written to " << SarifFile);
        }

        if (PrintSummary) {
            Report.print_summary(outs());
        }
    } catch (const std::exception &e) {
        errs() << "Error running analysis: " << e.what() << "\n";
        return 1;
    }

    return 0;
}

int main(int argc, char **argv) {
    InitLLVM X(argc, argv);

    cl::ParseCommandLineOptions(argc, argv, "TaintReach taint path triage tool\n");

    if (Classify) {
        return runClassify();
    }

    errs() << "Error: no subcommand given (try '" << argv[0] << " classify --help')\n";
    return 1;
}
