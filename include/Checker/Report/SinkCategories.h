#ifndef TAINTREACH_CHECKER_REPORT_SINKCATEGORIES_H
#define TAINTREACH_CHECKER_REPORT_SINKCATEGORIES_H

#include <llvm/ADT/StringRef.h>

#include <string>

#include "Classifier/NodeClassifier.h"

namespace taintreach {

namespace SinkDescription {
enum Importance {
  SI_NA = 0x0,

  SI_LOW = 0x1,
  SI_MEDIUM = 0x2,
  SI_HIGH = 0x3,
};

enum Classification {
  SC_NA = 0x0,

  SC_SECURITY = 0x1,
  SC_ERROR = 0x2,
};

std::string to_string(Importance si);
std::string to_string(Classification sc);
} // namespace SinkDescription

/*
 * Vulnerability categories, one per sink subtype.
 *   V(rule id, name, importance, classification, CWE list)
 */
#define SINK_SQLI(V)                                                           \
  V("taintreach.sql-injection", "SQL Injection", SinkDescription::SI_HIGH,     \
    SinkDescription::SC_SECURITY, "CWE-89")
#define SINK_SSTI(V)                                                           \
  V("taintreach.template-injection", "Server-Side Template Injection",         \
    SinkDescription::SI_HIGH, SinkDescription::SC_SECURITY,                    \
    "CWE-1336, CWE-94")
#define SINK_TAINT(V)                                                          \
  V("taintreach.taint", "Taint-Style Vulnerability", SinkDescription::SI_HIGH, \
    SinkDescription::SC_SECURITY, "CWE-20")

struct SinkCategory {
    llvm::StringRef RuleId;
    llvm::StringRef Name;
    SinkDescription::Importance Importance;
    SinkDescription::Classification Classification;
    llvm::StringRef CWE;
};

/// Category reported for sinks of the given subtype.
const SinkCategory &getSinkCategory(SinkSubtype Subtype);

} // namespace taintreach

#endif // TAINTREACH_CHECKER_REPORT_SINKCATEGORIES_H
