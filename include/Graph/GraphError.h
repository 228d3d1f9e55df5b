/// @file GraphError.h
/// @brief Structural errors raised while building or querying a taint graph.
///
/// Every error carries the id of the offending node (or the edge endpoint
/// that could not be resolved) so that callers can report it verbatim.

#ifndef TAINTREACH_GRAPH_GRAPHERROR_H
#define TAINTREACH_GRAPH_GRAPHERROR_H

#include <stdexcept>
#include <string>
#include <utility>

namespace taintreach {

/// @brief Base class of all malformed-graph errors. Never transient.
class StructuralGraphError : public std::runtime_error {
public:
    StructuralGraphError(const std::string &Msg, std::string ElementId)
        : std::runtime_error(Msg), ElementId(std::move(ElementId)) {}

    /// @brief Id of the node, edge endpoint or JSON element at fault.
    const std::string &getElementId() const { return ElementId; }

private:
    std::string ElementId;
};

/// @brief Two nodes were declared with the same id.
class DuplicateNodeError : public StructuralGraphError {
public:
    explicit DuplicateNodeError(const std::string &Id)
        : StructuralGraphError("duplicate node id '" + Id + "'", Id) {}
};

/// @brief An edge references a node id that was never declared.
class DanglingEdgeError : public StructuralGraphError {
public:
    DanglingEdgeError(const std::string &From, const std::string &To,
                      const std::string &Missing)
        : StructuralGraphError("edge '" + From + "' -> '" + To +
                                   "' references unknown node '" + Missing +
                                   "'",
                               Missing),
          From(From), To(To) {}

    const std::string &getFrom() const { return From; }
    const std::string &getTo() const { return To; }

private:
    std::string From;
    std::string To;
};

/// @brief A registration or lookup named a node that does not exist.
class UnknownNodeError : public StructuralGraphError {
public:
    explicit UnknownNodeError(const std::string &Id)
        : StructuralGraphError("unknown node id '" + Id + "'", Id) {}
};

/// @brief A sink with no predecessor at all in the raw graph.
class OrphanedSinkError : public StructuralGraphError {
public:
    explicit OrphanedSinkError(const std::string &SinkId)
        : StructuralGraphError("sink '" + SinkId +
                                   "' is not reachable from any node",
                               SinkId) {}
};

/// @brief The serialized graph could not be decoded.
class GraphFormatError : public StructuralGraphError {
public:
    GraphFormatError(const std::string &Msg, std::string Where = "")
        : StructuralGraphError(Msg, std::move(Where)) {}
};

} // namespace taintreach

#endif // TAINTREACH_GRAPH_GRAPHERROR_H
