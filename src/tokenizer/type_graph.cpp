/// @file
/// @brief Type graph construction and sequence validation.

#include "tokenizer/type_graph.h"

#include <utility>

namespace remi {

TypeGraph buildTypeGraph(const TokenizerConfig& config) {
  TypeGraph graph;
  graph[TokenType::Bar] = {TokenType::Position, TokenType::Bar};
  graph[TokenType::Position] = {TokenType::Program};
  graph[TokenType::Program] = {TokenType::Pitch};
  graph[TokenType::Pitch] = {TokenType::Velocity};
  graph[TokenType::Velocity] = {TokenType::Duration};
  graph[TokenType::Duration] = {TokenType::Program, TokenType::Position, TokenType::Bar};

  if (config.use_time_signatures) {
    // A run of Bars always ends with its TimeSig.
    graph[TokenType::Bar] = {TokenType::TimeSig, TokenType::Bar};
    graph[TokenType::TimeSig] = {TokenType::Position};
  }
  if (config.use_chords) {
    graph[TokenType::Chord] = {TokenType::Position};
    graph[TokenType::Position].insert(TokenType::Chord);
  }
  if (config.use_tempos) {
    graph[TokenType::Tempo] = {TokenType::Position};
    graph[TokenType::Position].insert(TokenType::Tempo);
  }
  return graph;
}

bool isLegalTransition(const TypeGraph& graph, TokenType prev, TokenType next) {
  auto iter = graph.find(prev);
  return iter != graph.end() && iter->second.count(next) > 0;
}

double TypeCheckReport::errorRatio() const {
  if (token_count == 0) return 0.0;
  return static_cast<double>(totalErrors()) / static_cast<double>(token_count);
}

TypeCheckReport checkTokenTypes(const TypeGraph& graph, const std::vector<Token>& tokens) {
  TypeCheckReport report;
  report.token_count = tokens.size();

  const Token* previous = nullptr;
  int current_position = -1;
  int current_program = 0;
  std::set<std::pair<int, int>> notes_at_position;  // (program, pitch)

  for (const auto& token : tokens) {
    if (token.type == TokenType::Special) continue;

    if (previous != nullptr && !isLegalTransition(graph, previous->type, token.type)) {
      ++report.type_errors;
    } else {
      switch (token.type) {
        case TokenType::Bar:
          current_position = -1;
          notes_at_position.clear();
          break;
        case TokenType::Position:
          if (token.value < current_position) {
            ++report.value_errors;
          } else if (token.value > current_position) {
            current_position = token.value;
            notes_at_position.clear();
          }
          break;
        case TokenType::Program:
          current_program = token.value;
          break;
        case TokenType::Pitch:
          if (!notes_at_position.insert({current_program, token.value}).second) {
            ++report.value_errors;
          }
          break;
        default:
          break;
      }
    }
    previous = &token;
  }
  return report;
}

}  // namespace remi
