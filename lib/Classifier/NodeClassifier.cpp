#include <llvm/ADT/None.h>
#include <llvm/ADT/SmallVector.h>
#include <llvm/ADT/StringSwitch.h>
#include <llvm/Support/ErrorHandling.h>

#include "Classifier/NodeClassifier.h"
#include "Support/Debug.h"

#define DEBUG_TYPE "classify"

using namespace llvm;

namespace taintreach {

StringRef toString(NodeRole Role) {
    switch (Role) {
    case NodeRole::None: return "None";
    case NodeRole::Source: return "Source";
    case NodeRole::Sanitizer: return "Sanitizer";
    case NodeRole::Validator: return "Validator";
    case NodeRole::AuthzGate: return "AuthzGate";
    case NodeRole::RateLimiter: return "RateLimiter";
    case NodeRole::DeadGuard: return "DeadGuard";
    }
    llvm_unreachable("unknown NodeRole");
}

StringRef toString(ValidatorStrength Strength) {
    switch (Strength) {
    case ValidatorStrength::None: return "None";
    case ValidatorStrength::Weak: return "Weak";
    case ValidatorStrength::Strict: return "Strict";
    }
    llvm_unreachable("unknown ValidatorStrength");
}

StringRef toString(SinkSubtype Subtype) {
    switch (Subtype) {
    case SinkSubtype::SQL: return "SQL";
    case SinkSubtype::Template: return "Template";
    case SinkSubtype::Other: return "Other";
    }
    llvm_unreachable("unknown SinkSubtype");
}

std::string UnclassifiableRoleError::message() const {
    std::string Msg = "node '" + NodeId + "' declares unknown " + TagKey +
                      " '" + TagValue + "'";
    if (TagKey == "subtype")
        return Msg + "; sink classified as Other";
    return Msg + "; treated as role None";
}

bool NodeClassification::neutralizes(SinkSubtype Target) const {
    bool Protective =
        Role == NodeRole::Sanitizer ||
        (Role == NodeRole::Validator && Strength == ValidatorStrength::Strict);
    if (!Protective)
        return false;

    switch (Target) {
    case SinkSubtype::SQL: return Protects & ProtectsSQL;
    case SinkSubtype::Template: return Protects & ProtectsTemplate;
    case SinkSubtype::Other: return Protects & ProtectsOther;
    }
    return false;
}

namespace {

// Tag values are matched case-insensitively, with '_' and '-' equivalent.
std::string normalize(StringRef Value) {
    std::string Result = Value.trim().lower();
    for (char &C : Result)
        if (C == '_')
            C = '-';
    return Result;
}

Optional<NodeRole> parseRole(StringRef Value) {
    return StringSwitch<Optional<NodeRole>>(normalize(Value))
        .Case("none", NodeRole::None)
        .Case("source", NodeRole::Source)
        .Case("sanitizer", NodeRole::Sanitizer)
        .Case("validator", NodeRole::Validator)
        .Cases("authz-gate", "authzgate", NodeRole::AuthzGate)
        .Cases("rate-limiter", "ratelimiter", NodeRole::RateLimiter)
        .Cases("dead-guard", "deadguard", NodeRole::DeadGuard)
        .Default(None);
}

Optional<ValidatorStrength> parseStrength(StringRef Value) {
    return StringSwitch<Optional<ValidatorStrength>>(normalize(Value))
        .Case("strict", ValidatorStrength::Strict)
        .Case("weak", ValidatorStrength::Weak)
        .Case("none", ValidatorStrength::None)
        .Default(None);
}

Optional<SinkSubtype> parseSubtype(StringRef Value) {
    return StringSwitch<Optional<SinkSubtype>>(normalize(Value))
        .Cases("sql", "sql-injection", SinkSubtype::SQL)
        .Cases("template", "template-injection", SinkSubtype::Template)
        .Case("other", SinkSubtype::Other)
        .Default(None);
}

// "sql-injection, template-injection" -> mask. None on any unknown entry.
Optional<unsigned> parseProtects(StringRef Value) {
    SmallVector<StringRef, 4> Items;
    Value.split(Items, ',', -1, false);
    if (Items.empty())
        return None;

    unsigned Mask = ProtectsNone;
    for (StringRef Item : Items) {
        unsigned Bit = StringSwitch<unsigned>(normalize(Item))
                           .Cases("any", "all", ProtectsAny)
                           .Cases("sql-injection", "sql", ProtectsSQL)
                           .Cases("template-injection", "template", "ssti",
                                  ProtectsTemplate)
                           .Case("other", ProtectsOther)
                           .Default(ProtectsNone);
        if (Bit == ProtectsNone)
            return None;
        Mask |= Bit;
    }
    return Mask;
}

void reject(const TaintNode &Node, StringRef Key, StringRef Value,
            NodeClassification &Result,
            std::vector<UnclassifiableRoleError> *Diags) {
    Result.Role = NodeRole::None;
    Result.Strength = ValidatorStrength::None;
    Result.Protects = ProtectsNone;
    Result.Unclassifiable = true;
    if (Diags)
        Diags->push_back({Node.getId(), Key.str(), Value.str()});
    TAINTREACH_DEBUG("rejected " << Key << "='" << Value << "' on "
                                 << Node.getId());
}

} // namespace

NodeClassification
NodeClassifier::classify(const TaintNode &Node,
                         std::vector<UnclassifiableRoleError> *Diags) const {
    NodeClassification Result;

    if (Node.isSink()) {
        if (auto Subtype = Node.getTag("subtype")) {
            if (auto Parsed = parseSubtype(*Subtype)) {
                Result.Subtype = *Parsed;
            } else {
                // The sink stays a sink; only its category is unknown.
                Result.Unclassifiable = true;
                if (Diags)
                    Diags->push_back({Node.getId(), "subtype", Subtype->str()});
            }
        }
    }

    Optional<StringRef> RoleTag = Node.getTag("role");
    if (!RoleTag) {
        if (Node.isEntryPoint())
            Result.Role = NodeRole::Source;
        return Result;
    }

    Optional<NodeRole> Role = parseRole(*RoleTag);
    if (!Role) {
        reject(Node, "role", *RoleTag, Result, Diags);
        return Result;
    }
    Result.Role = *Role;

    if (Result.Role == NodeRole::Validator) {
        if (auto StrengthTag = Node.getTag("strength")) {
            Optional<ValidatorStrength> Strength = parseStrength(*StrengthTag);
            if (!Strength) {
                reject(Node, "strength", *StrengthTag, Result, Diags);
                return Result;
            }
            Result.Strength = *Strength;
        }
    }

    if (Result.Role == NodeRole::Sanitizer ||
        Result.Role == NodeRole::Validator) {
        if (auto ProtectsTag = Node.getTag("protects")) {
            Optional<unsigned> Mask = parseProtects(*ProtectsTag);
            if (!Mask) {
                reject(Node, "protects", *ProtectsTag, Result, Diags);
                return Result;
            }
            Result.Protects = *Mask;
        }
    }

    return Result;
}

ClassifiedGraph::ClassifiedGraph(const TaintGraph &G,
                                 const NodeClassifier &Classifier)
    : G(G) {
    Classes.reserve(G.getNumNodes());
    for (unsigned I = 0, E = G.getNumNodes(); I != E; ++I)
        Classes.push_back(Classifier.classify(G.getNode(I), &Diagnostics));

    for (const UnclassifiableRoleError &D : Diagnostics)
        TAINTREACH_WARN(D.message());
}

} // namespace taintreach
