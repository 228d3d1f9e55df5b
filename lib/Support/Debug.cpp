#include <llvm/ADT/SmallVector.h>
#include <llvm/ADT/StringRef.h>
#include <llvm/Support/CommandLine.h>
#include <llvm/Support/ManagedStatic.h>

#include <mutex>
#include <vector>

#include "Support/Debug.h"

using namespace llvm;

namespace taintreach {

// Global debug flag, set once any debug type is requested.
bool TaintReachDebugFlag = false;

static bool LogQuiet = false;

// Currently enabled debug types.
static ManagedStatic<std::vector<std::string>> TaintReachCurrentDebugType;

static ManagedStatic<std::mutex> LogMutex;

bool isTaintReachCurrentDebugType(const char *DebugType) {
    if (TaintReachCurrentDebugType->empty())
        return true; // debug everything

    for (auto &D : *TaintReachCurrentDebugType)
        if (D == DebugType)
            return true;
    return false;
}

void setLogQuiet(bool Quiet) { LogQuiet = Quiet; }

void emitLog(LogLevel Level, const std::string &Msg) {
    if (Level == LogLevel::Info && LogQuiet)
        return;

    std::lock_guard<std::mutex> Lock(*LogMutex);
    switch (Level) {
    case LogLevel::Info:
        outs() << "[INFO] " << Msg << "\n";
        break;
    case LogLevel::Warning:
        errs() << "[WARN] " << Msg << "\n";
        break;
    case LogLevel::Error:
        errs() << "[ERROR] " << Msg << "\n";
        break;
    case LogLevel::Debug:
        errs() << "[DEBUG] " << Msg << "\n";
        break;
    }
}

namespace {

// Command line option handler for debug types.
struct TaintReachDebugOpt {
    void operator=(const std::string &Val) const {
        if (Val.empty())
            return;
        TaintReachDebugFlag = true;
        SmallVector<StringRef, 8> DbgTypes;
        StringRef(Val).split(DbgTypes, ',', -1, false);
        for (auto DbgType : DbgTypes)
            TaintReachCurrentDebugType->push_back(std::string(DbgType));
    }
};

TaintReachDebugOpt DebugOptLoc;

} // namespace

static cl::opt<TaintReachDebugOpt, true, cl::parser<std::string>>
    DebugOnly("taintreach-debug",
              cl::desc("Enable a specific type of debug output (comma "
                       "separated list of types, e.g. path-enum,aggregate)"),
              cl::Hidden, cl::ZeroOrMore, cl::value_desc("debug string"),
              cl::location(DebugOptLoc), cl::ValueRequired,
              cl::sub(*cl::AllSubCommands));

} // namespace taintreach
