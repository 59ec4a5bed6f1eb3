#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "config/decoder_config.hpp"
#include "event/interpreter.hpp"
#include "event/opcodes.hpp"
#include "event/raw_event.hpp"
#include "link/link_parser.hpp"
#include "text/safe_decoder.hpp"
#include "text/sanitizer.hpp"
#include "util/logging.hpp"

namespace {

// Event documents larger than this are refused before parsing.
constexpr std::size_t kMaxEventDocumentBytes = 4 * 1024 * 1024;

struct CliOptions {
  std::string wallet;
  std::optional<std::string> config_path;
  std::optional<std::string> debug_log;
  std::string log_level{"warn"};
  bool log_stderr{false};
  bool raw{false};
  std::vector<std::string> args;
};

void PrintUsage() {
  std::cout << "Usage: tonsentry-cli [options] <command> [params]\n"
            << "Commands:\n"
            << "  link <uri>                 Parse a ton://transfer deep link\n"
            << "  event <file|->             Interpret an indexer event (JSON)\n"
            << "  defang <text>              Defang free-form text for display\n"
            << "  decode <base64>            Decode a base64 comment payload\n"
            << "  opcodes                    List known operation codes\n"
            << "Options:\n"
            << "  --wallet <address>         Reference wallet for event direction\n"
            << "  --config <path>            JSON file overriding decoder settings\n"
            << "  --debug-log <path>         Append log lines to a file\n"
            << "  --log-stderr               Mirror log lines to stderr\n"
            << "  --log-level <level>        debug|info|warn|error (default warn)\n"
            << "  --raw                      Single-line JSON output\n";
}

CliOptions ParseOptions(int argc, char** argv) {
  CliOptions opts;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--wallet") {
      if (++i >= argc) throw std::runtime_error("missing value for --wallet");
      opts.wallet = argv[i];
    } else if (arg == "--config") {
      if (++i >= argc) throw std::runtime_error("missing value for --config");
      opts.config_path = argv[i];
    } else if (arg == "--debug-log") {
      if (++i >= argc) throw std::runtime_error("missing value for --debug-log");
      opts.debug_log = argv[i];
    } else if (arg == "--log-level") {
      if (++i >= argc) throw std::runtime_error("missing value for --log-level");
      opts.log_level = argv[i];
    } else if (arg == "--log-stderr") {
      opts.log_stderr = true;
    } else if (arg == "--raw") {
      opts.raw = true;
    } else if (arg == "--help" || arg == "-h") {
      PrintUsage();
      std::exit(0);
    } else {
      opts.args.emplace_back(arg);
    }
  }
  return opts;
}

void ConfigureLogging(const CliOptions& opts) {
  tonsentry::util::LogLevel level = tonsentry::util::LogLevel::kWarn;
  if (!tonsentry::util::ParseLogLevel(opts.log_level, &level)) {
    throw std::runtime_error("invalid log level: " + opts.log_level);
  }
  auto& logger = tonsentry::util::GetLogger();
  logger.SetThreshold(level);
  if (opts.debug_log) {
    logger.OpenFile(*opts.debug_log);
  }
  logger.SetStderr(opts.log_stderr);
}

std::string ReadEventDocument(const std::string& source) {
  std::ostringstream buffer;
  if (source == "-") {
    buffer << std::cin.rdbuf();
  } else {
    std::ifstream in(source, std::ios::in | std::ios::binary);
    if (!in) {
      throw std::runtime_error("unable to read event file: " + source);
    }
    buffer << in.rdbuf();
  }
  std::string text = buffer.str();
  if (text.size() > kMaxEventDocumentBytes) {
    throw std::runtime_error("event document exceeds " + std::to_string(kMaxEventDocumentBytes) +
                             " bytes");
  }
  return text;
}

const std::string& RequireArg(const CliOptions& opts, std::size_t index, const char* what) {
  if (opts.args.size() <= index) {
    throw std::runtime_error(std::string("missing ") + what + " for " + opts.args.front());
  }
  return opts.args[index];
}

nlohmann::json RunCommand(const CliOptions& opts, const tonsentry::config::DecoderConfig& cfg) {
  const std::string& command = opts.args.front();
  if (command == "link") {
    return tonsentry::link::ToJson(
        tonsentry::link::ParseLink(RequireArg(opts, 1, "uri"), cfg));
  }
  if (command == "event") {
    const std::string text = ReadEventDocument(RequireArg(opts, 1, "event source"));
    const nlohmann::json document = nlohmann::json::parse(text, nullptr, false);
    if (document.is_discarded()) {
      throw std::runtime_error("event document is not valid JSON");
    }
    return tonsentry::event::ToJson(
        tonsentry::event::InterpretJson(document, opts.wallet, cfg));
  }
  if (command == "defang") {
    nlohmann::json out;
    out["text"] = tonsentry::text::Defang(RequireArg(opts, 1, "text"));
    return out;
  }
  if (command == "decode") {
    nlohmann::json out;
    out["text"] = tonsentry::text::DecodeComment(RequireArg(opts, 1, "payload"), cfg);
    return out;
  }
  if (command == "opcodes") {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& [code, name] : tonsentry::event::OpcodeTable()) {
      out[tonsentry::event::FormatOpcode(code)] = std::string(name);
    }
    return out;
  }
  throw std::runtime_error("unknown command: " + command);
}

}  // namespace

int main(int argc, char** argv) {
  try {
    const auto opts = ParseOptions(argc, argv);
    if (opts.args.empty()) {
      PrintUsage();
      return 1;
    }
    ConfigureLogging(opts);
    const tonsentry::config::DecoderConfig cfg =
        opts.config_path ? tonsentry::config::LoadDecoderConfig(*opts.config_path)
                         : tonsentry::config::DefaultDecoderConfig();
    const nlohmann::json result = RunCommand(opts, cfg);
    std::cout << (opts.raw ? result.dump() : result.dump(2)) << "\n";
  } catch (const std::exception& ex) {
    std::cerr << "tonsentry-cli: " << ex.what() << "\n";
    return 1;
  }
  return 0;
}
