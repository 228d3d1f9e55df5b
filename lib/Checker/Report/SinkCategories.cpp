#include <llvm/Support/ErrorHandling.h>

#include "Checker/Report/SinkCategories.h"

namespace taintreach {

namespace SinkDescription {

std::string to_string(Importance si) {
    switch (si) {
        case SI_LOW: return "Low";
        case SI_MEDIUM: return "Medium";
        case SI_HIGH: return "High";
        case SI_NA: return "N/A";
        default: return "Unknown";
    }
}

std::string to_string(Classification sc) {
    switch (sc) {
        case SC_SECURITY: return "Security";
        case SC_ERROR: return "Error";
        case SC_NA: return "N/A";
        default: return "Unknown";
    }
}

} // namespace SinkDescription

#define MAKE_SINK_CATEGORY(ID, NAME, IMP, CLS, CWE) {ID, NAME, IMP, CLS, CWE}

static const SinkCategory SQLCategory = SINK_SQLI(MAKE_SINK_CATEGORY);
static const SinkCategory TemplateCategory = SINK_SSTI(MAKE_SINK_CATEGORY);
static const SinkCategory OtherCategory = SINK_TAINT(MAKE_SINK_CATEGORY);

#undef MAKE_SINK_CATEGORY

const SinkCategory &getSinkCategory(SinkSubtype Subtype) {
    switch (Subtype) {
    case SinkSubtype::SQL: return SQLCategory;
    case SinkSubtype::Template: return TemplateCategory;
    case SinkSubtype::Other: return OtherCategory;
    }
    llvm_unreachable("unknown SinkSubtype");
}

} // namespace taintreach
