#include "Checker/Report/SARIF.h"
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/raw_ostream.h>

using namespace taintreach::sarif;

namespace {
JsonValue createJsonString(const std::string& str, JsonAllocator& allocator) {
    JsonValue val;
    val.SetString(str.c_str(), static_cast<rapidjson::SizeType>(str.length()), allocator);
    return val;
}

JsonValue createMessage(const std::string& text, JsonAllocator& allocator) {
    JsonValue messageObj(rapidjson::kObjectType);
    messageObj.AddMember("text", createJsonString(text, allocator), allocator);
    return messageObj;
}
}

JsonValue Location::toJson(JsonAllocator& allocator) const {
    JsonValue location(rapidjson::kObjectType);

    JsonValue logicalLocation(rapidjson::kObjectType);
    logicalLocation.AddMember("name", createJsonString(name, allocator), allocator);
    logicalLocation.AddMember("kind", createJsonString(kind, allocator), allocator);

    JsonValue logicalLocations(rapidjson::kArrayType);
    logicalLocations.PushBack(logicalLocation, allocator);
    location.AddMember("logicalLocations", logicalLocations, allocator);

    if (!message.empty()) {
        location.AddMember("message", createMessage(message, allocator), allocator);
    }

    return location;
}

JsonValue Result::toJson(JsonAllocator& allocator) const {
    JsonValue result(rapidjson::kObjectType);

    if (!ruleId.empty()) {
        result.AddMember("ruleId", createJsonString(ruleId, allocator), allocator);
    }

    result.AddMember("message", createMessage(message, allocator), allocator);
    result.AddMember("level", createJsonString(utils::levelToString(level), allocator), allocator);

    if (!locations.empty()) {
        JsonValue locationsArray(rapidjson::kArrayType);
        for (const auto& location : locations) {
            locationsArray.PushBack(location.toJson(allocator), allocator);
        }
        result.AddMember("locations", locationsArray, allocator);
    }

    if (!relatedLocations.empty()) {
        JsonValue relatedLocationsArray(rapidjson::kArrayType);
        int id = 0;
        for (const auto& location : relatedLocations) {
            JsonValue loc = location.toJson(allocator);
            loc.AddMember("id", id++, allocator);
            relatedLocationsArray.PushBack(loc, allocator);
        }
        result.AddMember("relatedLocations", relatedLocationsArray, allocator);
    }

    if (!properties.empty()) {
        JsonValue props(rapidjson::kObjectType);
        for (const auto& kv : properties) {
            props.AddMember(createJsonString(kv.first, allocator),
                            createJsonString(kv.second, allocator), allocator);
        }
        result.AddMember("properties", props, allocator);
    }

    return result;
}

JsonValue Rule::toJson(JsonAllocator& allocator) const {
    JsonValue rule(rapidjson::kObjectType);

    if (!id.empty()) {
        rule.AddMember("id", createJsonString(id, allocator), allocator);
    }

    if (!name.empty()) {
        rule.AddMember("name", createJsonString(name, allocator), allocator);
    }

    if (!description.empty()) {
        rule.AddMember("shortDescription", createMessage(description, allocator), allocator);
    }

    JsonValue props(rapidjson::kObjectType);
    if (!cwe.empty()) {
        props.AddMember("cwe", createJsonString(cwe, allocator), allocator);
    }
    if (!importance.empty()) {
        props.AddMember("importance", createJsonString(importance, allocator), allocator);
    }
    if (!classification.empty()) {
        props.AddMember("classification", createJsonString(classification, allocator), allocator);
    }
    if (props.MemberCount() != 0) {
        rule.AddMember("properties", props, allocator);
    }

    return rule;
}

SarifLog::SarifLog(const std::string& toolName, const std::string& version)
    : toolName(toolName), toolVersion(version) {}

void SarifLog::addRule(const Rule& rule) {
    rules.push_back(rule);
}

void SarifLog::addResult(const Result& result) {
    results.push_back(result);
}

std::string SarifLog::toJsonString(bool pretty) const {
    JsonDocument doc = toJsonDocument();

    rapidjson::StringBuffer buffer;
    if (pretty) {
        rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
        doc.Accept(writer);
    } else {
        rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
        doc.Accept(writer);
    }

    return buffer.GetString();
}

bool SarifLog::writeToFile(const std::string& filename, bool pretty) const {
    std::error_code EC;
    llvm::raw_fd_ostream file(filename, EC, llvm::sys::fs::OF_Text);
    if (EC) {
        return false;
    }
    file << toJsonString(pretty);
    file.close();
    return !file.has_error();
}

JsonDocument SarifLog::toJsonDocument() const {
    JsonDocument doc;
    doc.SetObject();
    auto& allocator = doc.GetAllocator();

    doc.AddMember("version", createJsonString("2.1.0", allocator), allocator);
    doc.AddMember("$schema", createJsonString("https://json.schemastore.org/sarif-2.1.0.json", allocator), allocator);

    JsonValue runsArray(rapidjson::kArrayType);
    JsonValue run(rapidjson::kObjectType);

    JsonValue tool(rapidjson::kObjectType);
    JsonValue driver(rapidjson::kObjectType);
    driver.AddMember("name", createJsonString(toolName, allocator), allocator);
    driver.AddMember("version", createJsonString(toolVersion, allocator), allocator);

    JsonValue rulesArray(rapidjson::kArrayType);
    for (const auto& rule : rules) {
        rulesArray.PushBack(rule.toJson(allocator), allocator);
    }
    driver.AddMember("rules", rulesArray, allocator);

    tool.AddMember("driver", driver, allocator);
    run.AddMember("tool", tool, allocator);

    // An empty results array means "analyzed, nothing found".
    JsonValue resultsArray(rapidjson::kArrayType);
    for (const auto& result : results) {
        resultsArray.PushBack(result.toJson(allocator), allocator);
    }
    run.AddMember("results", resultsArray, allocator);

    runsArray.PushBack(run, allocator);
    doc.AddMember("runs", runsArray, allocator);

    return doc;
}

namespace taintreach {
namespace sarif {
namespace utils {

std::string levelToString(Level level) {
    switch (level) {
        case Level::Note: return "note";
        case Level::Warning: return "warning";
        case Level::Error: return "error";
        default: return "warning";
    }
}

} // namespace utils
} // namespace sarif
} // namespace taintreach
