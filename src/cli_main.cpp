/// @file
/// @brief CLI entry point for the REMI+ tokenizer.

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

#include "core/basic_types.h"
#include "midi/midi_reader.h"
#include "midi/midi_writer.h"
#include "tokenizer/config_io.h"
#include "tokenizer/remi_tokenizer.h"

namespace {

/// @brief Command-line options parsed from argv.
struct CliOptions {
  std::string command;
  std::string input;
  std::string output;
  std::string config_path;
  uint16_t division = 0;  ///< 0 = take it from the token file
  bool check = false;
  bool help = false;
};

/// @brief Print usage information to stdout.
void printUsage() {
  std::printf("remi_cli - REMI+ multi-track MIDI tokenizer\n\n");
  std::printf("Usage: remi_cli COMMAND [INPUT] [options]\n\n");
  std::printf("Commands:\n");
  std::printf("  tokenize IN.mid     Write the token file of a MIDI file\n");
  std::printf("  detokenize IN.json  Write the MIDI file of a token file\n");
  std::printf("  vocab               List the vocabulary (id and token)\n");
  std::printf("  config              Print the resolved tokenizer config as JSON\n");
  std::printf("\nOptions:\n");
  std::printf("  -c FILE          Tokenizer config (JSON)\n");
  std::printf("  -o FILE          Output file path\n");
  std::printf("  --division N     Time division of decoded MIDI (default: from token file)\n");
  std::printf("  --check          Report grammar errors of the token sequence\n");
  std::printf("  --help           Show this help\n");
}

/// @brief Parse command-line arguments into CliOptions.
/// @return False if --help was requested or the arguments are unusable.
bool parseArgs(int argc, char* argv[], CliOptions& opts) {
  for (int idx = 1; idx < argc; ++idx) {
    if (std::strcmp(argv[idx], "--help") == 0 || std::strcmp(argv[idx], "-h") == 0) {
      opts.help = true;
      return false;
    }
    if (std::strcmp(argv[idx], "-c") == 0 && idx + 1 < argc) {
      opts.config_path = argv[++idx];
    } else if (std::strcmp(argv[idx], "-o") == 0 && idx + 1 < argc) {
      opts.output = argv[++idx];
    } else if (std::strcmp(argv[idx], "--division") == 0 && idx + 1 < argc) {
      int division = std::atoi(argv[++idx]);
      if (division <= 0 || division > 0x7FFF) {
        std::fprintf(stderr, "Error: invalid --division %s\n", argv[idx]);
        return false;
      }
      opts.division = static_cast<uint16_t>(division);
    } else if (std::strcmp(argv[idx], "--check") == 0) {
      opts.check = true;
    } else if (argv[idx][0] == '-') {
      std::fprintf(stderr, "Error: unknown option %s\n", argv[idx]);
      return false;
    } else if (opts.command.empty()) {
      opts.command = argv[idx];
    } else if (opts.input.empty()) {
      opts.input = argv[idx];
    } else {
      std::fprintf(stderr, "Error: unexpected argument %s\n", argv[idx]);
      return false;
    }
  }
  return !opts.command.empty();
}

/// @brief Replace the extension of a path (or append one).
std::string replaceExtension(const std::string& path, const char* extension) {
  auto dot_pos = path.rfind('.');
  auto slash_pos = path.find_last_of("/\\");
  if (dot_pos != std::string::npos && (slash_pos == std::string::npos || dot_pos > slash_pos)) {
    return path.substr(0, dot_pos) + extension;
  }
  return path + extension;
}

/// @brief Print a grammar report.
void printTypeCheck(const remi::TypeCheckReport& report) {
  std::printf("Type errors:  %zu\n", report.type_errors);
  std::printf("Value errors: %zu\n", report.value_errors);
  std::printf("Error ratio:  %.4f\n", report.errorRatio());
}

int runTokenize(const CliOptions& opts, const remi::RemiTokenizer& tokenizer) {
  if (opts.input.empty()) {
    std::fprintf(stderr, "Error: tokenize needs an input MIDI file\n");
    return 1;
  }

  remi::MidiReader reader;
  if (!reader.read(opts.input)) {
    std::fprintf(stderr, "Error: %s\n", reader.getError().c_str());
    return 1;
  }
  const remi::Score& score = reader.getScore();
  std::printf("Input:    %s (format %u, division %u)\n", opts.input.c_str(),
              static_cast<unsigned>(reader.getFormat()),
              static_cast<unsigned>(score.time_division));
  std::printf("Tracks:   %zu\n", score.tracks.size());
  std::printf("Notes:    %zu\n", score.noteCount());

  remi::TokenizeResult result = tokenizer.tokenize(score);
  if (!result.success) {
    std::fprintf(stderr, "Error: %s\n", result.error_message.c_str());
    return 1;
  }
  std::printf("Tokens:   %zu\n", result.tokens.size());

  if (opts.check) printTypeCheck(tokenizer.tokenErrors(result.tokens));

  remi::TokenFile file;
  file.time_division = score.time_division;
  file.tokens = result.tokens;
  file.ids = result.ids;

  std::string output = opts.output.empty() ? replaceExtension(opts.input, ".json") : opts.output;
  std::string error;
  if (!remi::writeTokenFile(output, file, error)) {
    std::fprintf(stderr, "Error: %s\n", error.c_str());
    return 1;
  }
  std::printf("\nOutput:   %s\n", output.c_str());
  return 0;
}

int runDetokenize(const CliOptions& opts, const remi::RemiTokenizer& tokenizer) {
  if (opts.input.empty()) {
    std::fprintf(stderr, "Error: detokenize needs an input token file\n");
    return 1;
  }

  remi::TokenFile file;
  std::string error;
  if (!remi::readTokenFile(opts.input, file, error)) {
    std::fprintf(stderr, "Error: %s\n", error.c_str());
    return 1;
  }

  uint16_t division = opts.division > 0 ? opts.division : file.time_division;
  remi::DetokenizeResult result = file.tokens.empty()
                                      ? tokenizer.detokenizeIds(file.ids, division)
                                      : tokenizer.detokenize(file.tokens, division);
  if (!result.success) {
    std::fprintf(stderr, "Error: %s\n", result.error_message.c_str());
    return 1;
  }

  if (opts.check && !file.tokens.empty()) printTypeCheck(tokenizer.tokenErrors(file.tokens));

  std::printf("Tracks:   %zu\n", result.score.tracks.size());
  std::printf("Notes:    %zu\n", result.score.noteCount());
  std::printf("Length:   %u ticks (division %u)\n", result.score.max_tick,
              static_cast<unsigned>(division));
  std::printf("Tempos:   %zu\n", result.score.tempo_changes.size());
  std::printf("Meters:   %zu\n", result.score.time_signatures.size());

  remi::MidiWriter writer;
  writer.build(result.score);
  std::string output = opts.output.empty() ? replaceExtension(opts.input, ".mid") : opts.output;
  if (!writer.writeToFile(output)) {
    std::fprintf(stderr, "Error: failed to write %s\n", output.c_str());
    return 1;
  }
  std::printf("\nOutput:   %s\n", output.c_str());
  return 0;
}

int runVocab(const CliOptions& opts, const remi::RemiTokenizer& tokenizer) {
  const auto& tokens = tokenizer.vocabulary().tokens();
  std::string text;
  for (size_t idx = 0; idx < tokens.size(); ++idx) {
    text += std::to_string(idx) + "\t" + tokens[idx] + "\n";
  }

  if (opts.output.empty()) {
    std::fputs(text.c_str(), stdout);
    return 0;
  }
  std::string error;
  if (!remi::writeTextFile(opts.output, text, error)) {
    std::fprintf(stderr, "Error: %s\n", error.c_str());
    return 1;
  }
  std::printf("Vocabulary: %zu tokens -> %s\n", tokens.size(), opts.output.c_str());
  return 0;
}

int runConfig(const CliOptions& opts, const remi::RemiTokenizer& tokenizer) {
  if (opts.output.empty()) {
    std::printf("%s\n", remi::configToJson(tokenizer.config()).c_str());
    return 0;
  }
  std::string error;
  if (!remi::saveConfig(opts.output, tokenizer.config(), error)) {
    std::fprintf(stderr, "Error: %s\n", error.c_str());
    return 1;
  }
  std::printf("Config: %s\n", opts.output.c_str());
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  CliOptions opts;
  if (!parseArgs(argc, argv, opts)) {
    printUsage();
    return opts.help ? 0 : 1;
  }

  remi::TokenizerConfig config;
  std::string error;
  if (!opts.config_path.empty() && !remi::loadConfig(opts.config_path, config, error)) {
    std::fprintf(stderr, "Error: %s\n", error.c_str());
    return 1;
  }
  if (!config.validate(error)) {
    std::fprintf(stderr, "Error: %s\n", error.c_str());
    return 1;
  }

  remi::RemiTokenizer tokenizer(config);

  if (opts.command == "tokenize") return runTokenize(opts, tokenizer);
  if (opts.command == "detokenize") return runDetokenize(opts, tokenizer);
  if (opts.command == "vocab") return runVocab(opts, tokenizer);
  if (opts.command == "config") return runConfig(opts, tokenizer);

  std::fprintf(stderr, "Error: unknown command %s\n", opts.command.c_str());
  printUsage();
  return 1;
}
