/// @file NodeClassifier.h
/// @brief Semantic roles of taint-graph nodes, derived from declared tags.
///
/// Roles come exclusively from explicit metadata (`role`, `strength`,
/// `protects`, `subtype`). Identifiers are never inspected: a function
/// called "validated_query" is as unprotected as any other until its
/// declaration says otherwise.

#ifndef TAINTREACH_CLASSIFIER_NODECLASSIFIER_H
#define TAINTREACH_CLASSIFIER_NODECLASSIFIER_H

#include <llvm/ADT/StringRef.h>

#include <string>
#include <vector>

#include "Graph/TaintGraph.h"

namespace taintreach {

enum class NodeRole {
    None,
    Source,
    Sanitizer,
    Validator,
    AuthzGate,
    RateLimiter,
    DeadGuard,
};

enum class ValidatorStrength {
    None,
    Weak,   ///< substring / blacklist check, does not neutralize taint
    Strict, ///< full-value allowlist or anchored pattern, neutralizes taint
};

enum class SinkSubtype {
    SQL,
    Template,
    Other,
};

llvm::StringRef toString(NodeRole Role);
llvm::StringRef toString(ValidatorStrength Strength);
llvm::StringRef toString(SinkSubtype Subtype);

/// Bit set of sink subtypes a protector neutralizes.
enum ProtectsMask : unsigned {
    ProtectsNone = 0,
    ProtectsSQL = 1u << 0,
    ProtectsTemplate = 1u << 1,
    ProtectsOther = 1u << 2,
    ProtectsAny = ProtectsSQL | ProtectsTemplate | ProtectsOther,
};

/// @brief A tag that could not be mapped onto the known vocabulary.
///
/// Not thrown: the node falls back to the None role (never protective) and
/// the record surfaces as a warning in the report.
struct UnclassifiableRoleError {
    std::string NodeId;
    std::string TagKey;
    std::string TagValue;

    std::string message() const;
};

/// @brief Result of classifying one node.
struct NodeClassification {
    NodeRole Role = NodeRole::None;
    ValidatorStrength Strength = ValidatorStrength::None;
    /// Meaningful for Sink nodes only.
    SinkSubtype Subtype = SinkSubtype::Other;
    unsigned Protects = ProtectsAny;
    /// Set when a tag was rejected and the node was forced to None.
    bool Unclassifiable = false;

    /// @brief True if this node neutralizes taint headed for a sink of
    /// subtype @p Target (a Sanitizer or Strict Validator covering it).
    bool neutralizes(SinkSubtype Target) const;

    bool isWeakValidator() const {
        return Role == NodeRole::Validator &&
               Strength == ValidatorStrength::Weak;
    }
};

/// @brief Maps declared tags onto roles. Stateless and pure.
class NodeClassifier {
public:
    /// @brief Classifies @p Node; rejected tags are appended to @p Diags
    /// when given.
    NodeClassification
    classify(const TaintNode &Node,
             std::vector<UnclassifiableRoleError> *Diags = nullptr) const;

    NodeRole classifyRole(const TaintNode &Node) const {
        return classify(Node).Role;
    }
};

/// @brief A graph together with the role of every node.
///
/// Built once, read concurrently by the per-sink analyses.
class ClassifiedGraph {
public:
    explicit ClassifiedGraph(const TaintGraph &G,
                             const NodeClassifier &Classifier = NodeClassifier());

    const TaintGraph &getGraph() const { return G; }

    const NodeClassification &getClassification(unsigned Node) const {
        return Classes[Node];
    }

    NodeRole getRole(unsigned Node) const { return Classes[Node].Role; }

    /// @brief Rejected tags, in node declaration order.
    const std::vector<UnclassifiableRoleError> &getDiagnostics() const {
        return Diagnostics;
    }

private:
    const TaintGraph &G;
    std::vector<NodeClassification> Classes;
    std::vector<UnclassifiableRoleError> Diagnostics;
};

} // namespace taintreach

#endif // TAINTREACH_CLASSIFIER_NODECLASSIFIER_H
