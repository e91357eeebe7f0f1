#include "../include/environmentprocessor.hpp"

#include <cstdlib>
#include <optional>

using namespace std;

void EnvironmentProcessor::process(nlohmann::json &config) const {
  walkJson(config, [this](string &value) { resolveVariable(value); });
}

void EnvironmentProcessor::walkJson(
    nlohmann::json &node, const function<void(string &)> &func) const {
  if (node.is_object() || node.is_array()) {
    for (auto &child : node) {
      walkJson(child, func);
    }
  } else if (node.is_string()) {
    string str = node.get<string>();
    func(str);
    node = str;
  }
}

void EnvironmentProcessor::resolveVariable(string &value) const {
  static const string prefix = "$ENV{";
  string result;
  size_t pos = 0;

  while (pos < value.size()) {
    const size_t start = value.find(prefix, pos);
    const size_t end = start == string::npos
                           ? string::npos
                           : value.find('}', start + prefix.size());
    if (end == string::npos) {
      result.append(value, pos, string::npos);
      break;
    }
    result.append(value, pos, start - pos);

    // $ENV{NAME:-default}
    string name = value.substr(start + prefix.size(),
                               end - start - prefix.size());
    optional<string> fallback;
    if (const size_t sep = name.find(":-"); sep != string::npos) {
      fallback = name.substr(sep + 2);
      name.resize(sep);
    }

    if (const char *env_val = getenv(name.c_str())) {
      result += env_val;
    } else if (fallback) {
      result += *fallback;
    } else {
      result.append(value, start, end - start + 1);
    }
    pos = end + 1;
  }
  value = std::move(result);
}
