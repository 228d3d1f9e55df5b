#ifndef TAINTREACH_CHECKER_REPORT_SARIF_H
#define TAINTREACH_CHECKER_REPORT_SARIF_H

#include <string>
#include <vector>
#include <rapidjson/document.h>
#include <rapidjson/writer.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/prettywriter.h>

namespace taintreach {
namespace sarif {

typedef rapidjson::Value JsonValue;
typedef rapidjson::Document JsonDocument;
typedef rapidjson::Document::AllocatorType JsonAllocator;

enum class Level { Note, Warning, Error };

// Graph nodes have no source positions, only names.
struct Location {
    std::string name;
    std::string kind = "function";
    std::string message;

    Location() = default;
    explicit Location(const std::string& name, const std::string& message = "")
        : name(name), message(message) {}

    JsonValue toJson(JsonAllocator& allocator) const;
};

struct Result {
    std::string ruleId;
    std::string message;
    Level level = Level::Warning;
    std::vector<Location> locations;
    std::vector<Location> relatedLocations;
    // Free-form string properties ("verdict", "confidence", ...)
    std::vector<std::pair<std::string, std::string>> properties;

    Result(const std::string& ruleId, const std::string& message)
        : ruleId(ruleId), message(message) {}

    JsonValue toJson(JsonAllocator& allocator) const;
};

struct Rule {
    std::string id;
    std::string name;
    std::string description;
    std::string cwe;
    // Emitted as rule properties when set
    std::string importance;
    std::string classification;

    Rule(const std::string& id, const std::string& name,
         const std::string& description = "", const std::string& cwe = "")
        : id(id), name(name), description(description), cwe(cwe) {}

    JsonValue toJson(JsonAllocator& allocator) const;
};

class SarifLog {
public:
    SarifLog(const std::string& toolName = "TaintReach", const std::string& version = "1.0.0");

    void addRule(const Rule& rule);
    void addResult(const Result& result);

    const std::vector<Rule>& getRules() const { return rules; }
    const std::vector<Result>& getResults() const { return results; }

    std::string toJsonString(bool pretty = true) const;
    /// Returns false if the file could not be written.
    bool writeToFile(const std::string& filename, bool pretty = true) const;

private:
    std::string toolName;
    std::string toolVersion;
    std::vector<Rule> rules;
    std::vector<Result> results;

    JsonDocument toJsonDocument() const;
};

namespace utils {
    std::string levelToString(Level level);
}

} // namespace sarif
} // namespace taintreach

#endif // TAINTREACH_CHECKER_REPORT_SARIF_H
