#include <llvm/Support/ErrorOr.h>
#include <llvm/Support/MemoryBuffer.h>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include <string>

#include "Graph/GraphReader.h"
#include "Support/Debug.h"

#define DEBUG_TYPE "graph-reader"

using namespace llvm;

namespace taintreach {

namespace {

const rapidjson::Value &requireMember(const rapidjson::Value &Obj,
                                      const char *Key,
                                      const std::string &Where) {
    auto It = Obj.FindMember(Key);
    if (It == Obj.MemberEnd())
        throw GraphFormatError(Where + ": missing field '" + Key + "'", Where);
    return It->value;
}

std::string requireString(const rapidjson::Value &Obj, const char *Key,
                          const std::string &Where) {
    const rapidjson::Value &V = requireMember(Obj, Key, Where);
    if (!V.IsString())
        throw GraphFormatError(Where + ": field '" + Key +
                                   "' must be a string",
                               Where);
    return std::string(V.GetString(), V.GetStringLength());
}

const rapidjson::Value &requireArray(const rapidjson::Value &Obj,
                                     const char *Key,
                                     const std::string &Where) {
    const rapidjson::Value &V = requireMember(Obj, Key, Where);
    if (!V.IsArray())
        throw GraphFormatError(Where + ": field '" + Key +
                                   "' must be an array",
                               Where);
    return V;
}

std::string elementName(const char *Array, unsigned Index) {
    return std::string(Array) + "[" + std::to_string(Index) + "]";
}

void readNodes(const rapidjson::Value &Nodes, TaintGraph &G) {
    for (rapidjson::SizeType I = 0; I < Nodes.Size(); ++I) {
        std::string Where = elementName("nodes", I);
        const rapidjson::Value &N = Nodes[I];
        if (!N.IsObject())
            throw GraphFormatError(Where + ": expected an object", Where);

        std::string Id = requireString(N, "id", Where);
        std::string KindName = requireString(N, "kind", Where);
        Optional<NodeKind> Kind = parseNodeKind(KindName);
        if (!Kind)
            throw GraphFormatError(Where + ": unknown node kind '" + KindName +
                                       "'",
                                   Id);

        TagMap Tags;
        auto TagsIt = N.FindMember("roleTags");
        if (TagsIt != N.MemberEnd()) {
            if (!TagsIt->value.IsObject())
                throw GraphFormatError(Where + ": 'roleTags' must be an object",
                                       Id);
            for (auto &Tag : TagsIt->value.GetObject()) {
                if (!Tag.value.IsString())
                    throw GraphFormatError(Where + ": tag '" +
                                               Tag.name.GetString() +
                                               "' must be a string",
                                           Id);
                // A repeated key must not silently override a role.
                if (!Tags.emplace(Tag.name.GetString(), Tag.value.GetString())
                         .second)
                    throw GraphFormatError(Where + ": duplicate tag '" +
                                               Tag.name.GetString() + "'",
                                           Id);
            }
        }
        G.addNode(std::move(Id), *Kind, std::move(Tags));
    }
}

void readEdges(const rapidjson::Value &Edges, TaintGraph &G) {
    for (rapidjson::SizeType I = 0; I < Edges.Size(); ++I) {
        std::string Where = elementName("edges", I);
        const rapidjson::Value &E = Edges[I];
        if (!E.IsObject())
            throw GraphFormatError(Where + ": expected an object", Where);

        std::string From = requireString(E, "from", Where);
        std::string To = requireString(E, "to", Where);

        BranchCondition Cond = BranchCondition::Always;
        if (E.HasMember("condition")) {
            std::string CondName = requireString(E, "condition", Where);
            Optional<BranchCondition> Parsed = parseBranchCondition(CondName);
            if (!Parsed)
                throw GraphFormatError(Where + ": unknown branch condition '" +
                                           CondName + "'",
                                       Where);
            Cond = *Parsed;
        }
        G.addEdge(From, To, Cond);
    }
}

} // namespace

TaintGraph GraphReader::readString(StringRef Json) {
    rapidjson::Document Doc;
    Doc.Parse(Json.data(), Json.size());
    if (Doc.HasParseError())
        throw GraphFormatError(
            std::string("JSON parse error at offset ") +
                std::to_string(Doc.GetErrorOffset()) + ": " +
                rapidjson::GetParseError_En(Doc.GetParseError()),
            std::to_string(Doc.GetErrorOffset()));
    if (!Doc.IsObject())
        throw GraphFormatError("graph document must be a JSON object");

    TaintGraph G;
    readNodes(requireArray(Doc, "nodes", "graph"), G);
    if (Doc.HasMember("edges"))
        readEdges(requireArray(Doc, "edges", "graph"), G);

    if (Doc.HasMember("registeredEntryPoints")) {
        const rapidjson::Value &Reg =
            requireArray(Doc, "registeredEntryPoints", "graph");
        for (rapidjson::SizeType I = 0; I < Reg.Size(); ++I) {
            if (!Reg[I].IsString()) {
                std::string Where = elementName("registeredEntryPoints", I);
                throw GraphFormatError(Where + ": expected a node id", Where);
            }
            G.markEntryRegistered(Reg[I].GetString());
        }
    }

    TAINTREACH_DEBUG("read graph with " << G.getNumNodes() << " nodes and "
                                        << G.getNumEdges() << " edges");
    return G;
}

TaintGraph GraphReader::readFile(StringRef Path) {
    ErrorOr<std::unique_ptr<MemoryBuffer>> Buf = MemoryBuffer::getFile(Path);
    if (!Buf)
        throw GraphFormatError("cannot read graph file '" + Path.str() +
                                   "': " + Buf.getError().message(),
                               Path.str());
    return readString((*Buf)->getBuffer());
}

} // namespace taintreach
