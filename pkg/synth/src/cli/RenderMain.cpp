// Repository: DialogCast
// Component: dialogcast_render
// Purpose: Command-line front end: renders one script file to an audio
//          artifact, or serves the DialogueSynthesis gRPC API.
// Copyright (c) 2026 DialogCast
//
// MODES OF OPERATION:
// 1. Render:   --script dialogue.txt --provider cartesia --out episode.mp3
// 2. Serve:    --serve 0.0.0.0:50061
// 3. Inspect:  --list-tags

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>

#include "dialogcast/pipeline/ArtifactWriter.hpp"
#include "dialogcast/pipeline/DialoguePipeline.hpp"
#include "dialogcast/pipeline/PipelineConfig.hpp"
#include "dialogcast/providers/ProviderId.hpp"
#include "dialogcast/tags/EmotionTagMapper.hpp"
#include "dialogcast/util/Errors.hpp"
#include "dialogcast/util/Logger.hpp"
#include "synthesis_service.h"

using namespace dialogcast;
using dialogcast::util::Logger;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitMalformedScript = 2;
constexpr int kExitSynthesis = 3;
constexpr int kExitAssembly = 4;
constexpr int kExitConfig = 5;
constexpr int kExitOther = 6;

std::atomic<bool> g_termination_requested{false};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_termination_requested.store(true, std::memory_order_release);
  }
}

struct CliArgs {
  std::string script_path;
  std::string provider = "elevenlabs";
  std::string language = "german";
  double speed = 0.0;  // 0 = language default
  double speed_a = 0.0;  // 0 = config value or scaled shared speed
  double speed_b = 0.0;
  std::string tier = "prototype";
  std::string out_path;
  std::string config_path;
  int concurrency = 0;  // 0 = config value
  std::string debug_dir;
  std::string project = "dialogcast";
  std::string topic;
  bool wav = false;
  bool list_tags = false;
  std::string serve_address;
  std::string output_root = ".";
  bool help = false;
  bool valid = false;
  std::string error;
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " [OPTIONS]\n"
            << "\n"
            << "Renders a two-speaker dialogue script through a TTS provider.\n"
            << "\n"
            << "RENDER:\n"
            << "  --script PATH        Dialogue script (\"Speaker A: [excited] ...\")\n"
            << "  --provider NAME      elevenlabs | cartesia (default: elevenlabs)\n"
            << "  --language NAME      german | english | dutch, or de | en | nl\n"
            << "  --speed X            Shared speed scale 0.7 - 1.2 (default: language)\n"
            << "  --speed-a X          Fixed speed for every Speaker A line\n"
            << "  --speed-b X          Fixed speed for every Speaker B line\n"
            << "  --tier NAME          prototype | production (default: prototype)\n"
            << "  --out PATH           Output file, or a directory for a generated name\n"
            << "  --project NAME       Project part of a generated name\n"
            << "  --topic NAME         Topic part of a generated name (default: script name)\n"
            << "  --wav                Write WAV instead of MP3\n"
            << "\n"
            << "COMMON:\n"
            << "  --config PATH        podcast_config.json (voices, languages, tuning)\n"
            << "  --concurrency N      Parallel synthesis requests (1 = sequential)\n"
            << "  --debug-dir DIR      Keep per-segment request dumps of failed runs\n"
            << "  --list-tags          Print the emotion tag tables and exit\n"
            << "  --serve ADDR         Serve the gRPC API on ADDR (e.g. 0.0.0.0:50061)\n"
            << "  --output-root DIR    Served output_path / debug_dir resolve under DIR\n"
            << "                       (default: current directory)\n"
            << "  --help               Show this help message\n"
            << "\n"
            << "ENVIRONMENT:\n"
            << "  ELEVENLABS_API_KEY, CARTESIA_API_KEY   Provider credentials\n"
            << "  DIALOGCAST_DEBUG=1                     Debug logging\n"
            << "\n";
}

CliArgs ParseArgs(int argc, char* argv[]) {
  CliArgs args;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    try {
      if (arg == "--help" || arg == "-h") {
        args.help = true;
        args.valid = true;
        return args;
      } else if (arg == "--script" && i + 1 < argc) {
        args.script_path = argv[++i];
      } else if (arg == "--provider" && i + 1 < argc) {
        args.provider = argv[++i];
      } else if (arg == "--language" && i + 1 < argc) {
        args.language = argv[++i];
      } else if (arg == "--speed" && i + 1 < argc) {
        args.speed = std::stod(argv[++i]);
      } else if (arg == "--speed-a" && i + 1 < argc) {
        args.speed_a = std::stod(argv[++i]);
      } else if (arg == "--speed-b" && i + 1 < argc) {
        args.speed_b = std::stod(argv[++i]);
      } else if (arg == "--tier" && i + 1 < argc) {
        args.tier = argv[++i];
      } else if (arg == "--out" && i + 1 < argc) {
        args.out_path = argv[++i];
      } else if (arg == "--config" && i + 1 < argc) {
        args.config_path = argv[++i];
      } else if (arg == "--concurrency" && i + 1 < argc) {
        args.concurrency = std::stoi(argv[++i]);
      } else if (arg == "--debug-dir" && i + 1 < argc) {
        args.debug_dir = argv[++i];
      } else if (arg == "--project" && i + 1 < argc) {
        args.project = argv[++i];
      } else if (arg == "--topic" && i + 1 < argc) {
        args.topic = argv[++i];
      } else if (arg == "--wav") {
        args.wav = true;
      } else if (arg == "--list-tags") {
        args.list_tags = true;
      } else if (arg == "--serve" && i + 1 < argc) {
        args.serve_address = argv[++i];
      } else if (arg == "--output-root" && i + 1 < argc) {
        args.output_root = argv[++i];
      } else {
        args.error = "Unknown argument: " + arg;
        return args;
      }
    } catch (const std::exception&) {
      args.error = "Invalid value for " + arg;
      return args;
    }
  }

  if (args.list_tags || !args.serve_address.empty()) {
    args.valid = true;
    return args;
  }
  if (args.script_path.empty()) {
    args.error = "Must specify --script (or --serve / --list-tags)";
    return args;
  }
  if (args.out_path.empty()) {
    args.error = "Must specify --out";
    return args;
  }

  args.valid = true;
  return args;
}

std::string ReadFile(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw ConfigError("Cannot read script: " + path);
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

int ListTags(const pipeline::PipelineConfig& config) {
  const tags::EmotionTagMapper mapper(config.tags);
  for (auto provider : {providers::ProviderId::kElevenLabs, providers::ProviderId::kCartesia}) {
    std::cout << providers::ProviderName(provider) << " (default: "
              << mapper.DefaultNeutral(provider) << ")\n";
    for (const auto& token : tags::EmotionTagMapper::CanonicalTokens(provider)) {
      std::cout << "  " << token << " -> "
                << mapper.Resolve({token}, provider).ToInlineMarkup() << "\n";
    }
  }
  return kExitOk;
}

// Output is a directory when it exists as one or ends with a separator.
bool IsDirectoryTarget(const std::string& path) {
  if (!path.empty() && (path.back() == '/' || path.back() == '\\')) return true;
  std::error_code ec;
  return std::filesystem::is_directory(path, ec);
}

int RunRender(const CliArgs& args, std::shared_ptr<pipeline::DialoguePipeline> pipe) {
  auto provider = providers::ParseProviderId(args.provider);
  if (!provider) {
    std::cerr << "Error: Unknown provider: " << args.provider << "\n";
    return kExitUsage;
  }
  auto tier = providers::ParseQualityTier(args.tier);
  if (!tier) {
    std::cerr << "Error: Unknown tier: " << args.tier << "\n";
    return kExitUsage;
  }
  auto language = pipeline::ResolveLanguage(pipe->config(), args.language);
  if (!language) {
    std::cerr << "Error: Unknown language: " << args.language << "\n";
    return kExitUsage;
  }

  pipeline::RunRequest request;
  request.script = ReadFile(args.script_path);
  request.provider = *provider;
  request.language = *language;
  if (args.speed > 0.0) request.user_speed = args.speed;
  if (args.speed_a > 0.0) request.speaker_a_speed = args.speed_a;
  if (args.speed_b > 0.0) request.speaker_b_speed = args.speed_b;
  request.tier = *tier;
  if (!args.debug_dir.empty()) request.debug_dir = args.debug_dir;

  // A directory target is named after the run's display speeds, which are
  // known only once the run succeeded.
  const bool directory_target = IsDirectoryTarget(args.out_path);
  if (!directory_target) request.output_path = args.out_path;

  // Cancel watcher: signal handlers cannot take the pipeline's locks.
  std::atomic<bool> run_finished{false};
  std::thread watcher([&]() {
    while (!run_finished.load(std::memory_order_acquire)) {
      if (g_termination_requested.load(std::memory_order_acquire)) {
        Logger::Warn("[dialogcast_render] Termination requested, cancelling run");
        pipe->Cancel();
        return;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
  });

  pipeline::RunResult result;
  try {
    result = pipe->Run(request);
  } catch (...) {
    run_finished.store(true, std::memory_order_release);
    watcher.join();
    throw;
  }
  run_finished.store(true, std::memory_order_release);
  watcher.join();

  std::string written = result.output_path.value_or("");
  if (directory_target) {
    pipeline::ArtifactNameParts parts;
    parts.project = args.project;
    parts.language_code = pipe->config().languages.at(*language).code;
    parts.topic = args.topic.empty()
                      ? std::filesystem::path(args.script_path).stem().string()
                      : args.topic;
    parts.provider = *provider;
    parts.overall_speed = result.display_speed;
    parts.male_speed = result.display_speed_b;
    parts.female_speed = result.display_speed_a;
    parts.tier = *tier;
    parts.container = result.audio.container;
    written = (std::filesystem::path(args.out_path) / pipeline::BuildArtifactName(parts))
                  .string();
    pipeline::WriteAtomically(written, result.audio.bytes);
  }

  std::cout << "Output:   " << written << "\n"
            << "Duration: " << result.audio.duration_seconds << " s\n"
            << "Size:     " << result.audio.byte_size << " bytes\n"
            << "Speed:    A " << result.display_speed_a << " / B "
            << result.display_speed_b << "\n"
            << "Usage:    " << result.usage.ToString() << "\n";
  return kExitOk;
}

}  // namespace

int main(int argc, char* argv[]) {
  CliArgs args = ParseArgs(argc, argv);

  if (args.help) {
    PrintUsage(argv[0]);
    return kExitOk;
  }

  if (!args.valid) {
    std::cerr << "Error: " << args.error << "\n\n";
    PrintUsage(argv[0]);
    return kExitUsage;
  }

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  try {
    pipeline::PipelineConfig config = args.config_path.empty()
                                          ? pipeline::PipelineConfig::Defaults()
                                          : pipeline::LoadPipelineConfig(args.config_path);
    if (args.wav) config.assembly.container = audio::OutputContainer::kWav;
    if (args.concurrency > 0) config.synthesis.max_concurrency = args.concurrency;

    if (args.list_tags) return ListTags(config);

    auto pipe = std::make_shared<pipeline::DialoguePipeline>(std::move(config));
    if (!args.serve_address.empty()) {
      service::ServerOptions options;
      options.address = args.serve_address;
      options.output_root = args.output_root;
      options.stop_requested = [] {
        return g_termination_requested.load(std::memory_order_acquire);
      };
      return service::RunSynthesisServer(options, pipe) ? kExitOk : kExitOther;
    }
    return RunRender(args, pipe);
  } catch (const MalformedScriptError& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return kExitMalformedScript;
  } catch (const SynthesisError& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return kExitSynthesis;
  } catch (const AssemblyError& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return kExitAssembly;
  } catch (const ConfigError& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return kExitConfig;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return kExitOther;
  }
}
