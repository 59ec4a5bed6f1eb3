#include "config/decoder_config.hpp"

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "util/unicode.hpp"

namespace tonsentry::config {

namespace {

std::vector<std::string> StringList(const nlohmann::json& value, const std::string& key) {
  if (!value.is_array()) {
    throw std::runtime_error("config key '" + key + "' must be an array of strings");
  }
  std::vector<std::string> out;
  out.reserve(value.size());
  for (const auto& item : value) {
    if (!item.is_string() || item.get<std::string>().empty()) {
      throw std::runtime_error("config key '" + key + "' must contain non-empty strings");
    }
    out.push_back(item.get<std::string>());
  }
  return out;
}

std::uint64_t Unsigned(const nlohmann::json& value, const std::string& key) {
  if (!value.is_number_unsigned()) {
    throw std::runtime_error("config key '" + key + "' must be a non-negative integer");
  }
  return value.get<std::uint64_t>();
}

std::string String(const nlohmann::json& value, const std::string& key) {
  if (!value.is_string()) {
    throw std::runtime_error("config key '" + key + "' must be a string");
  }
  return value.get<std::string>();
}

}  // namespace

const DecoderConfig& DefaultDecoderConfig() {
  static const DecoderConfig config;
  return config;
}

DecoderConfig ParseDecoderConfig(const std::string& json_text) {
  const nlohmann::json root = nlohmann::json::parse(json_text, nullptr, false);
  if (root.is_discarded()) {
    throw std::runtime_error("config is not valid JSON");
  }
  if (!root.is_object()) {
    throw std::runtime_error("config root must be a JSON object");
  }

  DecoderConfig cfg = DefaultDecoderConfig();
  std::vector<std::string> extra_patterns;

  for (const auto& [key, value] : root.items()) {
    if (key == "max_encoded_comment_bytes") {
      const auto bytes = Unsigned(value, key);
      if (bytes == 0 || bytes > 1024 * 1024) {
        throw std::runtime_error("max_encoded_comment_bytes must be in [1, 1048576]");
      }
      cfg.max_encoded_comment_bytes = static_cast<std::size_t>(bytes);
    } else if (key == "oversized_payload_placeholder") {
      cfg.oversized_payload_placeholder = String(value, key);
    } else if (key == "max_jetton_decimals") {
      const auto decimals = Unsigned(value, key);
      // Bounded so 10^decimals stays cheap for hostile metadata.
      if (decimals > 78) {
        throw std::runtime_error("max_jetton_decimals must be <= 78");
      }
      cfg.max_jetton_decimals = static_cast<int>(decimals);
    } else if (key == "default_jetton_decimals") {
      const auto decimals = Unsigned(value, key);
      if (decimals > 78) {
        throw std::runtime_error("default_jetton_decimals must be <= 78");
      }
      cfg.default_jetton_decimals = static_cast<int>(decimals);
    } else if (key == "native_currency") {
      cfg.native_currency = String(value, key);
    } else if (key == "scam_symbol_patterns") {
      cfg.scam_symbol_patterns.clear();
      for (auto& pattern : StringList(value, key)) {
        cfg.scam_symbol_patterns.push_back(util::ToLowerUtf8(pattern));
      }
    } else if (key == "extra_scam_symbol_patterns") {
      for (auto& pattern : StringList(value, key)) {
        extra_patterns.push_back(util::ToLowerUtf8(pattern));
      }
    } else if (key == "mirror_prefixes") {
      cfg.mirror_prefixes = StringList(value, key);
    } else if (key == "transfer_prefix") {
      cfg.transfer_prefix = String(value, key);
    } else if (key == "max_display_code_points") {
      const auto limit = Unsigned(value, key);
      if (limit == 0) {
        throw std::runtime_error("max_display_code_points must be positive");
      }
      cfg.max_display_code_points = static_cast<std::size_t>(limit);
    } else {
      throw std::runtime_error("unknown config key: " + key);
    }
  }

  if (cfg.default_jetton_decimals > cfg.max_jetton_decimals) {
    throw std::runtime_error("default_jetton_decimals exceeds max_jetton_decimals");
  }
  for (auto& pattern : extra_patterns) {
    if (std::find(cfg.scam_symbol_patterns.begin(), cfg.scam_symbol_patterns.end(), pattern) ==
        cfg.scam_symbol_patterns.end()) {
      cfg.scam_symbol_patterns.push_back(std::move(pattern));
    }
  }
  return cfg;
}

DecoderConfig LoadDecoderConfig(const std::string& path) {
  std::ifstream in(path, std::ios::in);
  if (!in) {
    throw std::runtime_error("unable to read config file: " + path);
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  try {
    return ParseDecoderConfig(buffer.str());
  } catch (const std::runtime_error& ex) {
    throw std::runtime_error(path + ": " + ex.what());
  }
}

}  // namespace tonsentry::config
