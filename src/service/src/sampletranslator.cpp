/**
 * @file sampletranslator.cpp
 * @brief Реализация SampleTranslator
 */

#include "../include/sampletranslator.hpp"

#include <cstdio>
#include <type_traits>
#include <variant>

namespace {

bool isMetricChar(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
         (c >= '0' && c <= '9') || c == '_';
}

template <class>
inline constexpr bool always_false_v = false;

}  // namespace

std::string SampleTranslator::sanitize(std::string_view raw) {
  std::string result(raw);
  for (auto& c : result) {
    if (!isMetricChar(c)) c = '_';
  }
  return result;
}

std::string SampleTranslator::quote(std::string_view raw) {
  std::string out;
  out.reserve(raw.size() + 2);
  out.push_back('"');
  for (const char ch : raw) {
    const auto c = static_cast<unsigned char>(ch);
    switch (c) {
      case '"':  out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\a': out += "\\a"; break;
      case '\b': out += "\\b"; break;
      case '\f': out += "\\f"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      case '\v': out += "\\v"; break;
      default:
        if (c < 0x20 || c == 0x7f) {
          char buf[5];
          std::snprintf(buf, sizeof(buf), "\\x%02x", c);
          out += buf;
        } else {
          out.push_back(ch);
        }
    }
  }
  out.push_back('"');
  return out;
}

std::string SampleTranslator::fingerprint(
    const std::string& rawName,
    const std::map<std::string, std::string>& labels) {
  std::string result = "[";
  result += quote(rawName);
  // std::map уже упорядочен по ключу
  for (const auto& [key, value] : labels) {
    result.push_back(' ');
    result += quote(key);
    result.push_back(' ');
    result += quote(value);
  }
  result.push_back(']');
  return result;
}

std::optional<double> SampleTranslator::coerce(
    const ifx::lineprotocol::FieldValue& value) {
  return std::visit(
      [](const auto& v) -> std::optional<double> {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, double>) {
          return v;
        } else if constexpr (std::is_same_v<T, int64_t>) {
          return static_cast<double>(v);
        } else if constexpr (std::is_same_v<T, bool>) {
          return v ? 1.0 : 0.0;
        } else if constexpr (std::is_same_v<T, uint64_t> ||
                             std::is_same_v<T, std::string>) {
          return std::nullopt;
        } else {
          static_assert(always_false_v<T>, "unhandled field type");
        }
      },
      value);
}

std::vector<Sample> SampleTranslator::translate(
    const ifx::lineprotocol::Point& point) {
  std::map<std::string, std::string> labels;
  for (const auto& [key, value] : point.tags) {
    labels[sanitize(key)] = value;
  }

  std::vector<Sample> samples;
  samples.reserve(point.fields.size());
  for (const auto& [field, value] : point.fields) {
    const auto coerced = coerce(value);
    if (!coerced) continue;

    std::string rawName = point.measurement;
    if (field != kValueField) {
      rawName += '_';
      rawName += field;
    }

    Sample sample;
    sample.fingerprint = fingerprint(rawName, labels);
    sample.name = sanitize(rawName);
    sample.labels = labels;
    sample.value = *coerced;
    sample.timestamp = point.timestamp;
    samples.push_back(std::move(sample));
  }
  return samples;
}
