/**
 * @file config.cpp
 * @brief Configuration management implementation
 */

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>
#include <pwd.h>
#include <unistd.h>

#include "bluescan/config.h"

namespace fs = ::std::filesystem;
using json = ::nlohmann::json;

namespace bluescan {

namespace {

constexpr size_t MAX_DEVICE_NAME_LENGTH = 64;

Error parse_error(const std::string &key, const std::string &message) {
  return Error(ErrorCode::ConfigParseError, message, key);
}

Result<long long> read_integer(const std::string &key, const json &value) {
  if (!value.is_number_integer()) {
    return parse_error(key, "Expected an integer");
  }
  return value.get<long long>();
}

Result<std::string> read_string(const std::string &key, const json &value) {
  if (!value.is_string()) {
    return parse_error(key, "Expected a string");
  }
  return value.get<std::string>();
}

Result<CapabilitySet> read_capabilities(const std::string &key,
                                        const json &value) {
  if (!value.is_array()) {
    return parse_error(key, "Expected an array of capability names");
  }

  CapabilitySet out;
  for (const auto &item : value) {
    if (!item.is_string()) {
      return parse_error(key, "Expected an array of capability names");
    }
    auto cap = capability_from_name(item.get<std::string>());
    if (!cap) {
      return parse_error(key, "Unknown capability " + item.get<std::string>());
    }
    out.insert(*cap);
  }
  return out;
}

} // namespace

// ============================================================================
// ScanConfig Methods
// ============================================================================

void ScanConfig::load_defaults() { *this = ScanConfig(); }

Result<void> ScanConfig::validate() const {
  if (low_energy_timeout.count() <= 0) {
    return Error(ErrorCode::InvalidArgument,
                 "Low-energy timeout must be positive");
  }

  if (classic_inquiry_duration.count() <= 0) {
    return Error(ErrorCode::InvalidArgument,
                 "Inquiry duration must be positive");
  }

  if (platform_version <= 0) {
    return Error(ErrorCode::InvalidArgument,
                 "Platform version must be positive");
  }

  if (unknown_device_name.empty() ||
      unknown_device_name.length() > MAX_DEVICE_NAME_LENGTH) {
    return Error(ErrorCode::InvalidArgument,
                 "Unknown-device name must be 1-64 chars");
  }

  return Result<void>::ok();
}

fs::path ScanConfig::get_default_config_dir() {
  const char *xdg_config = std::getenv("XDG_CONFIG_HOME");
  if (xdg_config && *xdg_config) {
    return fs::path(xdg_config) / "bluescan";
  }

  const char *home = std::getenv("HOME");
  if (!home) {
    struct passwd *pw = getpwuid(getuid());
    if (pw) {
      home = pw->pw_dir;
    }
  }
  if (home) {
    return fs::path(home) / ".config" / "bluescan";
  }

  return fs::path("/tmp/bluescan");
}

const char *scan_mode_config_name(ScanMode mode) {
  return mode == ScanMode::LowEnergy ? "low_energy" : "classic";
}

std::optional<ScanMode> scan_mode_from_config_name(const std::string &name) {
  if (name == "classic") {
    return ScanMode::Classic;
  }
  if (name == "low_energy") {
    return ScanMode::LowEnergy;
  }
  return std::nullopt;
}

// ============================================================================
// ConfigManager Implementation
// ============================================================================

class ConfigManager::Impl {
public:
  ScanConfig config;
  fs::path config_path;
  mutable std::mutex mutex;
};

ConfigManager::ConfigManager() : impl_(std::make_unique<Impl>()) {
  impl_->config_path =
      ScanConfig::get_default_config_dir() / ConfigManager::FILE_NAME;
}

ConfigManager::~ConfigManager() = default;

Result<void> ConfigManager::init(const fs::path &config_path) {
  fs::path path;
  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (config_path.empty()) {
      impl_->config_path =
          ScanConfig::get_default_config_dir() / ConfigManager::FILE_NAME;
    } else {
      impl_->config_path = config_path;
    }
    path = impl_->config_path;
  }

  // A missing file is not an error; save() creates it
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    return Result<void>::ok();
  }
  return load();
}

const fs::path &ConfigManager::config_path() const {
  return impl_->config_path;
}

ScanConfig ConfigManager::get() const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->config;
}

Result<void> ConfigManager::set(const ScanConfig &config) {
  auto validation = config.validate();
  if (validation.is_error()) {
    return validation;
  }

  std::lock_guard<std::mutex> lock(impl_->mutex);
  impl_->config = config;
  return Result<void>::ok();
}

Result<void> ConfigManager::load() {
  std::lock_guard<std::mutex> lock(impl_->mutex);

  std::ifstream in(impl_->config_path);
  if (!in) {
    return Error(ErrorCode::FileReadError, "Cannot open config file",
                 impl_->config_path.string());
  }

  std::stringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    return Error(ErrorCode::FileReadError, "Cannot read config file",
                 impl_->config_path.string());
  }

  auto parsed = parse(buffer.str());
  if (parsed.is_error()) {
    return parsed.error();
  }

  impl_->config = parsed.value();
  return Result<void>::ok();
}

Result<void> ConfigManager::save() {
  std::lock_guard<std::mutex> lock(impl_->mutex);

  auto dir = impl_->config_path.parent_path();
  if (!dir.empty()) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
      return Error(ErrorCode::FileWriteError,
                   "Cannot create config directory",
                   dir.string() + ": " + ec.message());
    }
  }

  std::ofstream out(impl_->config_path, std::ios::trunc);
  if (!out) {
    return Error(ErrorCode::FileWriteError, "Cannot open config file",
                 impl_->config_path.string());
  }

  out << serialize(impl_->config);
  out.flush();
  if (!out) {
    return Error(ErrorCode::FileWriteError, "Cannot write config file",
                 impl_->config_path.string());
  }

  return Result<void>::ok();
}

void ConfigManager::reset_defaults() {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  impl_->config.load_defaults();
}

// ============================================================================
// JSON Format
// ============================================================================

Result<ScanConfig> ConfigManager::parse(const std::string &text) {
  json doc = json::parse(text, nullptr, false);
  if (doc.is_discarded()) {
    return Error(ErrorCode::ConfigParseError, "Malformed JSON");
  }
  if (!doc.is_object()) {
    return Error(ErrorCode::ConfigParseError, "Expected a JSON object");
  }

  ScanConfig config;
  for (auto it = doc.begin(); it != doc.end(); ++it) {
    const std::string &key = it.key();
    const json &value = it.value();

    if (key == "low_energy_timeout_ms") {
      auto number = read_integer(key, value);
      if (number.is_error()) {
        return number.error();
      }
      config.low_energy_timeout = Milliseconds(number.value());
    } else if (key == "classic_inquiry_duration_ms") {
      auto number = read_integer(key, value);
      if (number.is_error()) {
        return number.error();
      }
      config.classic_inquiry_duration = Milliseconds(number.value());
    } else if (key == "platform_version") {
      auto number = read_integer(key, value);
      if (number.is_error()) {
        return number.error();
      }
      config.platform_version = static_cast<int>(number.value());
    } else if (key == "granted_capabilities") {
      auto caps = read_capabilities(key, value);
      if (caps.is_error()) {
        return caps.error();
      }
      config.granted_capabilities = caps.value();
    } else if (key == "adapter") {
      auto name = read_string(key, value);
      if (name.is_error()) {
        return name.error();
      }
      config.adapter = name.value();
    } else if (key == "unknown_device_name") {
      auto name = read_string(key, value);
      if (name.is_error()) {
        return name.error();
      }
      config.unknown_device_name = name.value();
    } else if (key == "default_mode") {
      auto name = read_string(key, value);
      if (name.is_error()) {
        return name.error();
      }
      auto mode = scan_mode_from_config_name(name.value());
      if (!mode) {
        return parse_error(key, "Unknown scan mode " + name.value());
      }
      config.default_mode = *mode;
    } else {
      return parse_error(key, "Unknown key");
    }
  }

  auto validation = config.validate();
  if (validation.is_error()) {
    return Error(ErrorCode::ConfigParseError, validation.error().message,
                 validation.error().details);
  }

  return config;
}

std::string ConfigManager::serialize(const ScanConfig &config) {
  json capabilities = json::array();
  for (Capability cap : config.granted_capabilities) {
    capabilities.push_back(capability_name(cap));
  }

  json doc = {
      {"low_energy_timeout_ms", config.low_energy_timeout.count()},
      {"classic_inquiry_duration_ms", config.classic_inquiry_duration.count()},
      {"platform_version", config.platform_version},
      {"granted_capabilities", capabilities},
      {"adapter", config.adapter},
      {"unknown_device_name", config.unknown_device_name},
      {"default_mode", scan_mode_config_name(config.default_mode)},
  };
  return doc.dump(2) + "\n";
}

} // namespace bluescan
