// Repository: encodewatch
// Component: Command-Line Entry Point
// Purpose: Runs one SVT-AV1 encode, printing live progress and serving it over gRPC.
// Copyright (c) 2025 encodewatch

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>

#include <grpcpp/grpcpp.h>

#include "encodewatch/encode/EncodeConfig.h"
#include "encodewatch/encode/EncodeSession.h"
#include "encodewatch/probe/FFmpegMediaProbe.h"
#include "encodewatch/progress/DisplayFormat.h"
#include "encodewatch/progress/LineParser.h"
#include "encodewatch/timing/MasterClock.h"
#include "encodewatch/util/Logger.h"
#include "monitor_service.h"

namespace
{
  constexpr int kDefaultPollMs = 500;
  constexpr size_t kFailureLogTail = 10;

  std::atomic<bool> g_interrupted{false};

  void HandleSignal(int)
  {
    g_interrupted.store(true);
  }

  struct ParsedArgs
  {
    std::string profile = "default";
    std::string input_path;
    std::string ffmpeg_path = "ffmpeg";
    std::map<std::string, std::string> options;
    int port = 0;
    int poll_ms = kDefaultPollMs;
    int probe_timeout_ms = 10'000;
    bool list_profiles = false;
    bool help = false;
  };

  void PrintUsage()
  {
    std::cout << "Usage: encodewatch [options] <input>\n\n"
              << "Options:\n"
              << "  --profile=NAME        Encoding profile (default)\n"
              << "  --list-profiles       List the available profiles and exit\n"
              << "  --set KEY=VALUE       Override one encoder option (repeatable)\n"
              << "  --port=N              Serve EncodeMonitor over gRPC on port N\n"
              << "  --ffmpeg=PATH         Encoder binary (ffmpeg)\n"
              << "  --poll-ms=N           Status refresh interval (500)\n"
              << "  --probe-timeout-ms=N  Media probe timeout (10000)\n\n"
              << "Profiles:\n";
    for (const auto &name : encodewatch::encode::AvailableProfiles())
    {
      std::cout << "  " << name << std::string(name.size() < 10 ? 10 - name.size() : 1, ' ')
                << encodewatch::encode::ProfileDescription(name) << "\n";
    }
  }

  // Accepts "--flag=value" and "--flag value".
  bool TakeValue(std::string_view arg, std::string_view flag, int argc, char **argv, int &i,
                 std::string &value)
  {
    if (arg == flag && i + 1 < argc)
    {
      value = argv[++i];
      return true;
    }
    if (arg.size() > flag.size() + 1 && arg.substr(0, flag.size()) == flag &&
        arg[flag.size()] == '=')
    {
      value = std::string(arg.substr(flag.size() + 1));
      return true;
    }
    return false;
  }

  bool ParseInt(const std::string &text, int min_value, int &out)
  {
    const auto parsed = encodewatch::progress::ParseInt64(text);
    if (!parsed || *parsed < min_value || *parsed > std::numeric_limits<int>::max())
    {
      return false;
    }
    out = static_cast<int>(*parsed);
    return true;
  }

  std::optional<ParsedArgs> ParseArgs(int argc, char **argv)
  {
    ParsedArgs args;
    for (int i = 1; i < argc; ++i)
    {
      const std::string_view arg(argv[i]);
      std::string value;
      if (arg == "--help" || arg == "-h")
      {
        args.help = true;
      }
      else if (arg == "--list-profiles")
      {
        args.list_profiles = true;
      }
      else if (TakeValue(arg, "--profile", argc, argv, i, value))
      {
        args.profile = value;
      }
      else if (TakeValue(arg, "--ffmpeg", argc, argv, i, value))
      {
        args.ffmpeg_path = value;
      }
      else if (TakeValue(arg, "--set", argc, argv, i, value))
      {
        const auto eq = value.find('=');
        if (eq == std::string::npos || eq == 0)
        {
          std::cerr << "Error: --set expects KEY=VALUE, got '" << value << "'" << std::endl;
          return std::nullopt;
        }
        args.options[value.substr(0, eq)] = value.substr(eq + 1);
      }
      else if (TakeValue(arg, "--port", argc, argv, i, value))
      {
        if (!ParseInt(value, 0, args.port) || args.port > 65535)
        {
          std::cerr << "Error: invalid port '" << value << "'" << std::endl;
          return std::nullopt;
        }
      }
      else if (TakeValue(arg, "--poll-ms", argc, argv, i, value))
      {
        if (!ParseInt(value, 10, args.poll_ms))
        {
          std::cerr << "Error: invalid poll interval '" << value << "'" << std::endl;
          return std::nullopt;
        }
      }
      else if (TakeValue(arg, "--probe-timeout-ms", argc, argv, i, value))
      {
        if (!ParseInt(value, 1, args.probe_timeout_ms))
        {
          std::cerr << "Error: invalid probe timeout '" << value << "'" << std::endl;
          return std::nullopt;
        }
      }
      else if (!arg.empty() && arg[0] == '-')
      {
        std::cerr << "Error: unknown option '" << arg << "'" << std::endl;
        return std::nullopt;
      }
      else if (args.input_path.empty())
      {
        args.input_path = std::string(arg);
      }
      else
      {
        std::cerr << "Error: unexpected argument '" << arg << "'" << std::endl;
        return std::nullopt;
      }
    }
    return args;
  }

  void ListProfiles()
  {
    using namespace encodewatch;
    std::cout << "Available encoding profiles:\n\n";
    for (const auto &name : encode::AvailableProfiles())
    {
      encode::EncodeConfig cfg;
      if (!encode::GetProfile(name, &cfg))
      {
        continue;
      }
      std::cout << "  " << name << "\n"
                << "    " << encode::ProfileDescription(name) << "\n"
                << "    CRF: " << cfg.crf << ", Preset: " << cfg.preset << "\n\n";
    }
  }

} // namespace

int main(int argc, char **argv)
{
  using namespace encodewatch;

  const auto parsed = ParseArgs(argc, argv);
  if (!parsed)
  {
    PrintUsage();
    return EXIT_FAILURE;
  }
  const ParsedArgs &args = *parsed;

  if (args.help)
  {
    PrintUsage();
    return EXIT_SUCCESS;
  }
  if (args.list_profiles)
  {
    ListProfiles();
    return EXIT_SUCCESS;
  }
  if (args.input_path.empty())
  {
    PrintUsage();
    return EXIT_FAILURE;
  }

  std::error_code ec;
  if (!std::filesystem::exists(args.input_path, ec))
  {
    std::cerr << "Error: Input file not found: " << args.input_path << std::endl;
    return EXIT_FAILURE;
  }

  encode::EncodeConfig encode_config;
  if (!encode::GetProfile(args.profile, &encode_config))
  {
    std::cerr << "Error: Unknown profile '" << args.profile << "'" << std::endl;
    PrintUsage();
    return EXIT_FAILURE;
  }
  std::string option_error;
  if (!encode_config.ApplyOptions(args.options, &option_error))
  {
    std::cerr << "Error: " << option_error << std::endl;
    return EXIT_FAILURE;
  }

  probe::ProbeConfig probe_config;
  probe_config.timeout = std::chrono::milliseconds(args.probe_timeout_ms);
  std::string probe_error;
  std::unique_ptr<probe::MediaProbe> media_probe =
      probe::FFmpegMediaProbe::Create(args.input_path, probe_config, &probe_error);
  if (!media_probe)
  {
    util::Logger::Error("[main] Media probe unavailable: " + probe_error);
  }

  encode::SessionConfig session_config;
  session_config.ffmpeg_path = args.ffmpeg_path;
  auto session = std::make_shared<encode::EncodeSession>(
      args.input_path, encode_config, std::move(media_probe), timing::MakeSystemMasterClock(),
      session_config);

  const encode::BitrateCheck bitrate = session->CheckSourceBitrate();
  if (!bitrate.allowed)
  {
    std::cout << "Skipping " << args.input_path << ": " << bitrate.reason << std::endl;
    return EXIT_SUCCESS;
  }

  if (!session->ProbeSource())
  {
    std::cerr << "Error: " << session->GetState().error << std::endl;
    return EXIT_FAILURE;
  }

  std::unique_ptr<monitor::EncodeMonitorImpl> service;
  std::unique_ptr<grpc::Server> server;
  if (args.port > 0)
  {
    service = std::make_unique<monitor::EncodeMonitorImpl>(session);
    const std::string address = "0.0.0.0:" + std::to_string(args.port);
    grpc::ServerBuilder builder;
    builder.AddListeningPort(address, grpc::InsecureServerCredentials());
    builder.RegisterService(service.get());
    server = builder.BuildAndStart();
    if (!server)
    {
      std::cerr << "Error: failed to start gRPC server on " << address << std::endl;
      return EXIT_FAILURE;
    }
    util::Logger::Info("[main] EncodeMonitor listening on " + address);
  }

  std::signal(SIGINT, HandleSignal);
  std::signal(SIGTERM, HandleSignal);

  if (session->Start())
  {
    bool stop_sent = false;
    while (!session->GetState().done)
    {
      if (g_interrupted.load() && !stop_sent)
      {
        if (!session->Stop())
        {
          util::Logger::Warn("[main] Interrupted, but the encoder was no longer running");
        }
        stop_sent = true;
      }
      std::cout << "\r" << progress::FormatStatusLine(session->GetState()) << std::flush;
      std::this_thread::sleep_for(std::chrono::milliseconds(args.poll_ms));
    }
    session->Wait();
  }

  const progress::SessionState state = session->GetState();
  std::cout << "\r" << progress::FormatStatusLine(state) << std::endl;

  if (server)
  {
    server->Shutdown();
  }

  if (state.failed())
  {
    std::cerr << "Error: " << state.error << std::endl;
    const size_t first = state.log.size() > kFailureLogTail ? state.log.size() - kFailureLogTail : 0;
    for (size_t i = first; i < state.log.size(); ++i)
    {
      std::cerr << "  " << state.log[i] << std::endl;
    }
    return EXIT_FAILURE;
  }

  std::cout << "Output: " << session->output_path() << " ("
            << progress::FormatBytes(session->ActualOutputSize()) << ")" << std::endl;

  const encode::SizeCheck size_check = session->CheckOutputSize();
  if (!size_check.ok)
  {
    std::cerr << "Error: size check failed: " << size_check.error << std::endl;
    return EXIT_FAILURE;
  }
  if (!size_check.within_limit)
  {
    std::cerr << "Output is " << size_check.ratio_percent << "% of the input, above the "
              << encode_config.max_size_percent << "% limit" << std::endl;
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
