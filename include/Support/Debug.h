#ifndef TAINTREACH_SUPPORT_DEBUG_H
#define TAINTREACH_SUPPORT_DEBUG_H

#include <llvm/Support/raw_ostream.h>

#include <string>

namespace taintreach {

enum class LogLevel { Info, Warning, Error, Debug };

/// Writes one line to the log stream. Serialized, so worker threads may log.
void emitLog(LogLevel Level, const std::string &Msg);

/// Suppress [INFO] lines (warnings and errors are always shown).
void setLogQuiet(bool Quiet);

bool isTaintReachCurrentDebugType(const char *Type);

extern bool TaintReachDebugFlag;

} // namespace taintreach

#define TAINTREACH_LOG_IMPL(LEVEL, X)                                          \
  do {                                                                         \
    std::string TRLogMsg;                                                      \
    llvm::raw_string_ostream TRLogOS(TRLogMsg);                                \
    TRLogOS << X;                                                              \
    taintreach::emitLog(LEVEL, TRLogOS.str());                                 \
  } while (false)

#define TAINTREACH_INFO(X) TAINTREACH_LOG_IMPL(taintreach::LogLevel::Info, X)
#define TAINTREACH_WARN(X) TAINTREACH_LOG_IMPL(taintreach::LogLevel::Warning, X)
#define TAINTREACH_ERROR(X) TAINTREACH_LOG_IMPL(taintreach::LogLevel::Error, X)

/// @{
#define TAINTREACH_DEBUG_WITH_TYPE(TYPE, X)                                    \
  do {                                                                         \
    if (taintreach::TaintReachDebugFlag &&                                     \
        taintreach::isTaintReachCurrentDebugType(TYPE)) {                      \
      TAINTREACH_LOG_IMPL(taintreach::LogLevel::Debug, X);                     \
    }                                                                          \
  } while (false)

#define TAINTREACH_DEBUG(X) TAINTREACH_DEBUG_WITH_TYPE(DEBUG_TYPE, X)
/// @}

#endif // TAINTREACH_SUPPORT_DEBUG_H
