/// @file
/// @brief CLI entry point: song text (or score JSON) -> MIDI file.

#include <cstdio>
#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

#include "config/tool_config.h"
#include "core/log.h"
#include "core/score_json.h"
#include "dsl/dsl_parser.h"
#include "midi/smf_exporter.h"
#include "playback/event_compiler.h"
#include "playback/player.h"
#include "playback/synth_backend.h"

namespace {

/// @brief Command-line options parsed from argv.
struct CliOptions {
  std::string input;
  std::string output;
  std::string json_path;
  std::string config_path;
  bool load_json = false;
  bool print_events = false;
  bool play = false;
  bool debug = false;
};

/// @brief Print usage information to stdout.
void printUsage() {
  std::printf("tunescript_cli - song text to MIDI\n\n");
  std::printf("Usage: tunescript_cli [options] <input>\n\n");
  std::printf("Options:\n");
  std::printf("  -o FILE          MIDI output path (default %s)\n", tunescript::kDefaultOutputPath);
  std::printf("  --json FILE      Write the parsed score as JSON\n");
  std::printf("  --load-json      Treat <input> as a score JSON document\n");
  std::printf("  --events         Print the compiled timed events\n");
  std::printf("  --play           Dry-run live playback through the console backend\n");
  std::printf("  --config FILE    Tool configuration JSON\n");
  std::printf("  --debug          Parser diagnostics\n");
  std::printf("  --help           Show this help\n");
  std::printf("\nUse '-' as <input> to read from stdin.\n");
}

/// @brief Parse command-line arguments into CliOptions.
/// @return 0 to continue, 1 on a usage error, -1 if --help was shown.
int parseArgs(int argc, char* argv[], CliOptions& opts) {
  for (int idx = 1; idx < argc; ++idx) {
    const char* arg = argv[idx];
    if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
      printUsage();
      return -1;
    }
    if (std::strcmp(arg, "-o") == 0 && idx + 1 < argc) {
      opts.output = argv[++idx];
    } else if (std::strcmp(arg, "--json") == 0 && idx + 1 < argc) {
      opts.json_path = argv[++idx];
    } else if (std::strcmp(arg, "--config") == 0 && idx + 1 < argc) {
      opts.config_path = argv[++idx];
    } else if (std::strcmp(arg, "--load-json") == 0) {
      opts.load_json = true;
    } else if (std::strcmp(arg, "--events") == 0) {
      opts.print_events = true;
    } else if (std::strcmp(arg, "--play") == 0) {
      opts.play = true;
    } else if (std::strcmp(arg, "--debug") == 0) {
      opts.debug = true;
    } else if (arg[0] == '-' && arg[1] != '\0') {
      std::fprintf(stderr, "Error: unknown or incomplete option %s\n", arg);
      return 1;
    } else if (opts.input.empty()) {
      opts.input = arg;
    } else {
      std::fprintf(stderr, "Error: unexpected argument %s\n", arg);
      return 1;
    }
  }

  if (opts.input.empty()) {
    printUsage();
    return 1;
  }
  return 0;
}

/// @brief Read the whole input file, or stdin for "-".
bool readInput(const std::string& path, std::string& text) {
  if (path == "-") {
    text.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    return !std::cin.bad();
  }
  std::ifstream file(path, std::ios::binary);
  if (!file) return false;
  std::ostringstream contents;
  contents << file.rdbuf();
  text = contents.str();
  return true;
}

void printEvents(const tunescript::CompiledScore& compiled) {
  std::printf("\nChannels:\n");
  for (const auto& assignment : compiled.channels) {
    std::printf("  %-16s ch %2u  program %3u%s\n", assignment.name.c_str(),
                static_cast<unsigned>(assignment.channel),
                static_cast<unsigned>(assignment.program), assignment.is_drums ? "  (kit)" : "");
  }
  std::printf("Events:\n");
  for (const auto& event : compiled.events) {
    std::printf("  %9.3f  %-7s ch %2u  pitch %3u  vel %3u\n", event.time_seconds,
                tunescript::timedEventKindToString(event.kind),
                static_cast<unsigned>(event.channel), static_cast<unsigned>(event.pitch),
                static_cast<unsigned>(event.velocity));
  }
}

/// @brief Run the player against a simulated clock so the whole score is
///        dispatched without waiting in real time.
void dryRunPlayback(const tunescript::CompiledScore& compiled) {
  double now = 0.0;
  tunescript::ConsoleSynthBackend backend;
  tunescript::PlayerOptions options;
  options.use_worker_thread = false;
  tunescript::Player player(backend, [&now] { return now; }, options);

  player.load(compiled);
  player.play();
  for (const auto& event : compiled.events) {
    if (!player.isPlaying()) break;
    now = event.time_seconds;
    player.pump();
  }
  player.stop();
}

}  // namespace

int main(int argc, char* argv[]) {
  CliOptions opts;
  int arg_status = parseArgs(argc, argv, opts);
  if (arg_status != 0) {
    return arg_status < 0 ? 0 : 1;
  }

  tunescript::ToolConfig config;
  if (!opts.config_path.empty()) {
    tunescript::ToolConfigResult loaded = tunescript::loadToolConfig(opts.config_path);
    if (!loaded.success) {
      std::fprintf(stderr, "Error: %s\n", loaded.error_message.c_str());
      return 1;
    }
    for (const auto& warning : loaded.warnings) {
      std::fprintf(stderr, "Warning: %s\n", warning.c_str());
    }
    config = loaded.config;
  }
  if (opts.debug) {
    config.debug_parser = true;
    config.log_level = tunescript::LogLevel::Debug;
  }
  if (opts.output.empty()) opts.output = config.output_path;
  tunescript::setLogLevel(config.log_level);

  const tunescript::MusicTables tables = config.buildTables();

  std::string text;
  if (!readInput(opts.input, text)) {
    std::fprintf(stderr, "Error: failed to read %s\n", opts.input.c_str());
    return 1;
  }

  tunescript::Score score;
  if (opts.load_json) {
    tunescript::ScoreLoadResult loaded = tunescript::scoreFromJson(text);
    if (!loaded.success) {
      std::fprintf(stderr, "Error: %s\n", loaded.error_message.c_str());
      return 1;
    }
    score = std::move(loaded.score);
  } else {
    tunescript::ParserOptions parser_options;
    parser_options.debug = config.debug_parser;
    tunescript::ParseResult result = tunescript::DslParser(tables, parser_options).parse(text);
    for (const auto& warning : result.warnings) {
      std::fprintf(stderr, "Warning: %s\n", warning.c_str());
    }
    if (!result.score) {
      std::fprintf(stderr, "Error: %s\n",
                   result.errors.empty() ? "parse failed" : result.errors.front().c_str());
      return 1;
    }
    score = std::move(*result.score);
  }

  std::printf("tunescript_cli v0.1.0\n");
  std::printf("Title:      %s\n", score.title.c_str());
  std::printf("Tempo:      %d BPM\n", score.tempo);
  std::printf("Key:        %s\n", score.key.c_str());
  std::printf("Sections:   %zu\n", score.sections.size());
  for (const auto& section : score.sections) {
    std::printf("  %-16s bar %3d  %3d bars  %zu tracks%s\n", section.name.c_str(),
                section.start_bar, section.bars, section.tracks.size(),
                section.hasDrumHits() ? " + drums" : "");
  }
  std::printf("Duration:   %.1f s (%d bars)\n", score.durationSeconds(), score.totalBars());

  if (!opts.json_path.empty()) {
    if (tunescript::saveScoreFile(score, opts.json_path)) {
      std::printf("JSON:       %s\n", opts.json_path.c_str());
    } else {
      std::fprintf(stderr, "Error: failed to write %s\n", opts.json_path.c_str());
      return 1;
    }
  }

  tunescript::SmfExporter exporter(tables);
  if (!exporter.build(score)) {
    std::fprintf(stderr, "Error: %s\n", exporter.getError().c_str());
    return 1;
  }
  if (!exporter.writeToFile(opts.output)) {
    std::fprintf(stderr, "Error: failed to write %s\n", opts.output.c_str());
    return 1;
  }
  std::printf("Output:     %s (%zu tracks)\n", opts.output.c_str(),
              exporter.getTrackLayout().size() + 1);

  if (opts.print_events || opts.play) {
    tunescript::CompiledScore compiled = tunescript::EventCompiler(tables).compile(score);
    if (opts.print_events) printEvents(compiled);
    if (opts.play) {
      std::printf("\nPlayback (dry run):\n");
      dryRunPlayback(compiled);
    }
  }

  return 0;
}
