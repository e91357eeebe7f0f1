#include "../include/configmanager.hpp"

#include <stdexcept>

void ConfigManager::initialize(const std::string &filename) {
  nlohmann::json config;
  try {
    config = loader_.loadFromFile(filename);
  } catch (const std::exception &e) {
    throw std::runtime_error(std::string("Config initialization failed: ") +
                             e.what());
  }
  initializeFromJson(std::move(config));
}

void ConfigManager::initializeFromJson(nlohmann::json config) {
  try {
    envProcessor_.process(config);
    validator_.validateRoot(config);
  } catch (const std::exception &e) {
    throw std::runtime_error(std::string("Config initialization failed: ") +
                             e.what());
  }

  std::lock_guard<std::mutex> lock(configMutex_);
  baseConfig_ = std::move(config);
}

void ConfigManager::applyCliOverrides(
    const std::map<std::string, std::string> &overrides) {
  std::lock_guard<std::mutex> lock(configMutex_);
  for (const auto &[key, value] : overrides) {
    overrides_[key] = value;
  }
}

nlohmann::json ConfigManager::getMergedConfig(const std::string &env) const {
  std::lock_guard<std::mutex> lock(configMutex_);

  nlohmann::json merged = ExporterConfig::defaultsJson();
  if (baseConfig_.contains("defaults")) {
    merged.merge_patch(baseConfig_["defaults"]);
  }

  if (baseConfig_.contains("environments")) {
    const auto &environments = baseConfig_["environments"];
    if (!environments.contains(env)) {
      throw std::runtime_error("Environment '" + env + "' not found");
    }
    merged.merge_patch(environments[env]);
  }

  for (const auto &[key, value] : overrides_) {
    setByPath(merged, key, value);
  }

  validator_.validateSection(merged);
  return merged;
}

ExporterConfig ConfigManager::getExporterConfig(const std::string &env) const {
  return ExporterConfig::fromJson(getMergedConfig(env));
}

std::string ConfigManager::getConfigFilePath() const {
  std::lock_guard<std::mutex> lock(configMutex_);
  return loader_.getLastLoadedFile();
}

void ConfigManager::setByPath(nlohmann::json &root,
                              const std::string &dottedKey,
                              const std::string &value) {
  if (dottedKey.empty()) {
    throw std::invalid_argument("Empty override key");
  }

  nlohmann::json *node = &root;
  size_t start = 0;
  while (true) {
    const size_t dot = dottedKey.find('.', start);
    const std::string part = dottedKey.substr(start, dot - start);
    if (part.empty()) {
      throw std::invalid_argument("Invalid override key: " + dottedKey);
    }
    if (!node->is_object()) *node = nlohmann::json::object();
    node = &(*node)[part];
    if (dot == std::string::npos) break;
    start = dot + 1;
  }

  auto parsed = nlohmann::json::parse(value, nullptr, false);
  if (!parsed.is_discarded() && (parsed.is_boolean() || parsed.is_number())) {
    *node = std::move(parsed);
  } else {
    *node = value;
  }
}
