// Token type transition graph and the advisory sequence validator.

#ifndef REMI_TOKENIZER_TYPE_GRAPH_H
#define REMI_TOKENIZER_TYPE_GRAPH_H

#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "tokenizer/token.h"
#include "tokenizer/tokenizer_config.h"

namespace remi {

/// Legal successor types for each token type.
using TypeGraph = std::map<TokenType, std::set<TokenType>>;

/// @brief Build the type graph for the enabled token families.
///
/// Base edges:
///   Bar -> {Position, Bar}, Position -> {Program}, Program -> {Pitch},
///   Pitch -> {Velocity}, Velocity -> {Duration},
///   Duration -> {Program, Position, Bar}.
/// TimeSignature replaces Bar's successors with {TimeSig, Bar} and adds
/// TimeSig -> {Position};
/// Chord adds Chord -> {Position} and Position -> Chord;
/// Tempo adds Tempo -> {Position} and Position -> Tempo.
TypeGraph buildTypeGraph(const TokenizerConfig& config);

/// @brief True if `next` may follow `prev` in the graph.
bool isLegalTransition(const TypeGraph& graph, TokenType prev, TokenType next);

/// @brief Result of validating a token sequence. Purely diagnostic.
struct TypeCheckReport {
  size_t token_count = 0;
  size_t type_errors = 0;   ///< Adjacent pairs whose successor type is not allowed.
  size_t value_errors = 0;  ///< Positions going backwards in a bar, repeated notes.

  size_t totalErrors() const { return type_errors + value_errors; }

  /// @brief Errors per token (0 for an empty sequence).
  double errorRatio() const;
};

/// @brief Validate a typed token sequence against the graph.
///
/// Special tokens are skipped. Never fails: malformed sequences only raise
/// the error counts.
TypeCheckReport checkTokenTypes(const TypeGraph& graph, const std::vector<Token>& tokens);

}  // namespace remi

#endif  // REMI_TOKENIZER_TYPE_GRAPH_H
