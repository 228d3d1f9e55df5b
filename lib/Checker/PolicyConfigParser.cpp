/*
 * Aggregation Policy Parser Implementation
 */

#include "Checker/PolicyConfigParser.h"
#include "Support/Debug.h"

#include <llvm/ADT/StringRef.h>

#include <fstream>
#include <sstream>

namespace taintreach {

void PolicyConfigParser::dump(const AggregationPolicy& policy, llvm::raw_ostream& OS) {
    OS << "Weak validator: " << toString(policy.WeakValidatorVerdict)
       << ", Auth protected: " << toString(policy.AuthProtectedVerdict)
       << ", Max paths per sink: " << policy.MaxPathsPerSink << "\n";
}

std::unique_ptr<AggregationPolicy> PolicyConfigParser::parse_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        TAINTREACH_ERROR("Could not open policy file: " << filename);
        return nullptr;
    }

    std::string content((std::istreambuf_iterator<char>(file)),
                       std::istreambuf_iterator<char>());
    return parse_string(content);
}

std::unique_ptr<AggregationPolicy> PolicyConfigParser::parse_string(const std::string& content) {
    auto policy = std::make_unique<AggregationPolicy>();
    std::istringstream stream(content);
    std::string line;
    unsigned line_no = 0;

    while (std::getline(stream, line)) {
        parse_line(trim(line), ++line_no, *policy);
    }

    return policy;
}

void PolicyConfigParser::parse_line(const std::string& line, unsigned line_no, AggregationPolicy& policy) {
    if (line.empty() || line[0] == '#') return;

    auto tokens = split(line);
    if (tokens.size() < 2) {
        TAINTREACH_WARN("policy line " << line_no << ": missing value, ignored");
        return;
    }

    std::string directive = llvm::StringRef(tokens[0]).upper();
    std::string value = llvm::StringRef(tokens[1]).lower();

    if (directive == "WEAK_VALIDATOR") {
        if (value == "good_to_fix") {
            policy.WeakValidatorVerdict = SinkVerdictKind::GoodToFix;
        } else if (value == "must_fix") {
            policy.WeakValidatorVerdict = SinkVerdictKind::MustFix;
        } else {
            TAINTREACH_WARN("policy line " << line_no << ": WEAK_VALIDATOR expects good_to_fix or must_fix, got '"
                            << tokens[1] << "'");
        }
    } else if (directive == "AUTH_PROTECTED") {
        if (value == "false_positive") {
            policy.AuthProtectedVerdict = SinkVerdictKind::FalsePositive;
        } else if (value == "good_to_fix") {
            policy.AuthProtectedVerdict = SinkVerdictKind::GoodToFix;
        } else {
            TAINTREACH_WARN("policy line " << line_no << ": AUTH_PROTECTED expects false_positive or good_to_fix, got '"
                            << tokens[1] << "'");
        }
    } else if (directive == "MAX_PATHS") {
        unsigned long long limit = 0;
        if (llvm::StringRef(value).getAsInteger(10, limit)) {
            TAINTREACH_WARN("policy line " << line_no << ": MAX_PATHS expects a number, got '"
                            << tokens[1] << "'");
        } else {
            policy.MaxPathsPerSink = static_cast<size_t>(limit);
        }
    } else {
        TAINTREACH_WARN("policy line " << line_no << ": unknown directive '" << tokens[0] << "'");
    }
}

std::vector<std::string> PolicyConfigParser::split(const std::string& str) {
    std::vector<std::string> tokens;
    std::istringstream stream(str);
    std::string token;

    while (stream >> token) {
        tokens.push_back(token);
    }

    return tokens;
}

std::string PolicyConfigParser::trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";

    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

} // namespace taintreach
