/*
 * Aggregation Policy Parser
 *
 * Simple parser for triage policy files (.policy format)
 *
 *   # comment
 *   WEAK_VALIDATOR  good_to_fix | must_fix
 *   AUTH_PROTECTED  false_positive | good_to_fix
 *   MAX_PATHS       <n>            (0 = unbounded)
 */

#pragma once

#include <llvm/Support/raw_ostream.h>

#include <memory>
#include <string>
#include <vector>

#include "Analysis/SinkAggregator.h"

namespace taintreach {

class PolicyConfigParser {
public:
    /// Returns nullptr if the file cannot be read.
    static std::unique_ptr<AggregationPolicy> parse_file(const std::string& filename);
    static std::unique_ptr<AggregationPolicy> parse_string(const std::string& content);

    static void dump(const AggregationPolicy& policy, llvm::raw_ostream& OS);

private:
    static void parse_line(const std::string& line, unsigned line_no, AggregationPolicy& policy);
    static std::vector<std::string> split(const std::string& str);
    static std::string trim(const std::string& str);
};

} // namespace taintreach
