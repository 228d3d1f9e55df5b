/// @file GraphReader.h
/// @brief Builds a TaintGraph from its JSON serialization.
///
/// \code
/// {
///   "nodes": [ {"id": "login", "kind": "EntryPoint",
///               "roleTags": {"role": "source"}}, ... ],
///   "edges": [ {"from": "login", "to": "check", "condition": "always"}, ... ],
///   "registeredEntryPoints": [ "login", ... ]
/// }
/// \endcode
///
/// `kind` and `condition` are case-insensitive; `condition` and `roleTags`
/// are optional. All errors are StructuralGraphError subclasses.

#ifndef TAINTREACH_GRAPH_GRAPHREADER_H
#define TAINTREACH_GRAPH_GRAPHREADER_H

#include <llvm/ADT/StringRef.h>

#include "Graph/TaintGraph.h"

namespace taintreach {

class GraphReader {
public:
    /// @brief Parses @p Json. Throws GraphFormatError on malformed input and
    /// the other StructuralGraphError kinds on inconsistent content.
    static TaintGraph readString(llvm::StringRef Json);

    /// @brief Reads and parses @p Path. An unreadable file is a
    /// GraphFormatError naming the path.
    static TaintGraph readFile(llvm::StringRef Path);
};

} // namespace taintreach

#endif // TAINTREACH_GRAPH_GRAPHREADER_H
