#include <llvm/ADT/BitVector.h>
#include <llvm/ADT/Statistic.h>

#include <future>

#include "Analysis/PathEnumerator.h"
#include "Checker/TaintPathChecker.h"
#include "Graph/GraphError.h"
#include "Support/Debug.h"
#include "Support/ThreadPool.h"

#define DEBUG_TYPE "checker"

using namespace llvm;

STATISTIC(NumSinksAnalyzed, "Number of sinks analyzed");
STATISTIC(NumSinkErrors, "Number of sinks whose analysis failed");
STATISTIC(NumDeadPaths, "Number of dead paths");

namespace taintreach {

TaintPathChecker::TaintPathChecker(const ClassifiedGraph &CG,
                                   CheckerOptions Opts)
    : CG(CG), Opts(Opts), Engine(CG), Aggregator(Opts.Policy) {}

SinkResult TaintPathChecker::analyzeSink(unsigned Sink) const {
    return analyzeSink(Sink, Clock::time_point::max());
}

SinkResult TaintPathChecker::analyzeSink(unsigned Sink,
                                         Clock::time_point Deadline) const {
    SinkResult Result;
    Result.Sink = Sink;
    try {
        runUnit(Sink, Result, Deadline);
    } catch (const std::exception &E) {
        const std::string &Id = CG.getGraph().getNode(Sink).getId();
        TAINTREACH_WARN("sink '" << Id << "': " << E.what());
        Result.Paths.clear();
        Result.Verdicts.clear();
        Result.Verdict = SinkVerdict();
        Result.Verdict.Overall = SinkVerdictKind::Error;
        Result.Verdict.Confidence = 0;
        Result.Verdict.Rationale = "not analyzed";
        Result.Error = E.what();
        ++NumSinkErrors;
    }
    ++NumSinksAnalyzed;
    return Result;
}

void TaintPathChecker::runUnit(unsigned Sink, SinkResult &Result,
                               Clock::time_point Deadline) const {
    const TaintGraph &G = CG.getGraph();
    const TaintNode &SinkNode = G.getNode(Sink);

    PathEnumerator Enum(CG, Sink, Opts.Policy.MaxPathsPerSink);
    if (!Enum.hasPredecessor())
        throw OrphanedSinkError(SinkNode.getId());

    TaintPath Path;
    while (Enum.next(Path)) {
        if (TimedOut || Clock::now() > Deadline) {
            TimedOut = true;
            return;
        }
        PathVerdict V = Engine.classify(Path);
        if (!V.isLive())
            ++NumDeadPaths;
        Result.Verdicts.push_back(V);
        Result.Paths.push_back(Path);
    }

    Result.Verdict = Aggregator.aggregate(SinkNode, Result.Verdicts);

    if (!Enum.hasReachingEntry())
        Result.Warnings.push_back(
            "no entry point reaches this sink; only unwired code calls it");

    if (Enum.getNumTruncations() != 0)
        Result.Warnings.push_back(std::to_string(Enum.getNumTruncations()) +
                                  " back-edge(s) cut by the revisit cap");

    if (Enum.hitPathLimit()) {
        Result.Warnings.push_back(
            "path limit of " + std::to_string(Opts.Policy.MaxPathsPerSink) +
            " reached; remaining paths were not enumerated");
        // Not already charged for a revisit-cap truncation.
        bool Charged = false;
        for (const PathVerdict &V : Result.Verdicts)
            Charged |= V.Truncated;
        if (!Charged)
            Result.Verdict.Confidence = Result.Verdict.Confidence >= 20
                                            ? Result.Verdict.Confidence - 20
                                            : 0;
    }

    BitVector Reported(G.getNumNodes());
    for (size_t I = 0; I < Result.Paths.size(); ++I) {
        if (!Result.Verdicts[I].isLive())
            continue;
        for (unsigned Node : Result.Paths[I].Nodes) {
            if (!CG.getClassification(Node).Unclassifiable || Reported.test(Node))
                continue;
            Reported.set(Node);
            Result.Warnings.push_back("node '" + G.getNode(Node).getId() +
                                      "' on a live path has an unclassifiable "
                                      "tag");
        }
    }

    TAINTREACH_DEBUG(SinkNode.getId() << ": " << Result.Paths.size()
                                      << " paths, "
                                      << toString(Result.Verdict.Overall));
}

std::vector<SinkResult> TaintPathChecker::run() {
    std::vector<unsigned> Sinks = CG.getGraph().getSinks();
    std::vector<SinkResult> Results(Sinks.size());
    TimedOut = false;

    bool HasTimeout = Opts.Timeout.count() > 0;
    Clock::time_point Deadline =
        HasTimeout ? Clock::now() + Opts.Timeout : Clock::time_point::max();

    // A single worker runs the units inline.
    unsigned NumWorkers =
        ThreadPool::computeWorkerCount(Opts.NumJobs, Sinks.size());
    if (NumWorkers == 1)
        NumWorkers = 0;

    TAINTREACH_INFO("Analyzing " << Sinks.size() << " sink(s) with "
                                 << (NumWorkers ? NumWorkers : 1)
                                 << " worker(s)");
    {
        ThreadPool Pool(NumWorkers);
        std::vector<std::future<SinkResult>> Futures;
        Futures.reserve(Sinks.size());
        for (unsigned Sink : Sinks)
            Futures.push_back(Pool.enqueue(
                [this, Sink, Deadline] { return analyzeSink(Sink, Deadline); }));

        for (size_t I = 0; I < Futures.size(); ++I) {
            if (HasTimeout && Futures[I].wait_until(Deadline) ==
                                  std::future_status::timeout) {
                TimedOut = true;
                break;
            }
            Results[I] = Futures[I].get();
            if (TimedOut)
                break;
        }
        // Leaving the scope joins the workers; running units see TimedOut
        // and stop at their next path, queued ones are dropped.
    }

    if (TimedOut)
        throw AnalysisTimeoutError(Opts.Timeout);

    TAINTREACH_INFO("Analysis finished");
    return Results;
}

} // namespace taintreach
