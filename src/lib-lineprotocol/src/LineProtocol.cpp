#include "ifx/LineProtocol.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace ifx::lineprotocol {

namespace {

/// Ошибка в пределах одной строки; превращается в ParseError в parsePoints()
struct LineError {
  std::string reason;
};

bool isBlank(char c) { return c == ' ' || c == '\t'; }

/**
 * Делит буфер на строки. Перевод строки внутри строкового значения поля
 * (в кавычках) строку не завершает.
 */
std::vector<std::string_view> splitLines(std::string_view buf) {
  std::vector<std::string_view> lines;
  std::size_t start = 0;
  bool inFields = false;
  bool quoted = false;
  char prev = '\0';

  for (std::size_t i = 0; i < buf.size(); ++i) {
    const char c = buf[i];
    if (c == '\\' && i + 1 < buf.size() && buf[i + 1] != '\n') {
      prev = buf[++i];
      continue;
    }
    if (c == '\n' && !quoted) {
      lines.push_back(buf.substr(start, i - start));
      start = i + 1;
      inFields = false;
      prev = '\0';
      continue;
    }
    if (c == ' ' && !quoted) {
      inFields = true;
    } else if (c == '"' && inFields && (quoted || prev == '=')) {
      quoted = !quoted;
    }
    prev = c;
  }
  if (start < buf.size()) {
    lines.push_back(buf.substr(start));
  }
  return lines;
}

class LineScanner {
 public:
  explicit LineScanner(std::string_view line) : line_(line) {}

  bool atEnd() const { return pos_ >= line_.size(); }
  char peek() const { return line_[pos_]; }
  void advance() { ++pos_; }

  void skipBlanks() {
    while (!atEnd() && isBlank(peek())) ++pos_;
  }

  /**
   * Читает токен до первого неэкранированного символа из stops.
   * Экранирование снимается только для символов из escapable.
   */
  std::string readToken(std::string_view stops, std::string_view escapable) {
    std::string out;
    while (!atEnd()) {
      const char c = peek();
      if (c == '\\' && pos_ + 1 < line_.size()) {
        const char next = line_[pos_ + 1];
        if (escapable.find(next) != std::string_view::npos) {
          out.push_back(next);
        } else {
          out.push_back(c);
          out.push_back(next);
        }
        pos_ += 2;
        continue;
      }
      if (stops.find(c) != std::string_view::npos) break;
      out.push_back(c);
      ++pos_;
    }
    return out;
  }

  /// Читает строковое значение поля; открывающая кавычка уже прочитана
  std::string readQuoted() {
    std::string out;
    while (!atEnd()) {
      const char c = peek();
      if (c == '\\' && pos_ + 1 < line_.size() &&
          (line_[pos_ + 1] == '"' || line_[pos_ + 1] == '\\')) {
        out.push_back(line_[pos_ + 1]);
        pos_ += 2;
        continue;
      }
      ++pos_;
      if (c == '"') return out;
      out.push_back(c);
    }
    throw LineError{"unterminated quoted string"};
  }

 private:
  std::string_view line_;
  std::size_t pos_ = 0;
};

bool parseSigned(const std::string& text, int64_t& out) {
  if (text.empty()) return false;
  std::size_t i = (text[0] == '-' || text[0] == '+') ? 1 : 0;
  if (i == text.size()) return false;
  for (std::size_t j = i; j < text.size(); ++j) {
    if (text[j] < '0' || text[j] > '9') return false;
  }
  errno = 0;
  char* end = nullptr;
  const long long value = std::strtoll(text.c_str(), &end, 10);
  if (errno == ERANGE || *end != '\0') return false;
  out = static_cast<int64_t>(value);
  return true;
}

bool parseUnsigned(const std::string& text, uint64_t& out) {
  if (text.empty()) return false;
  for (char c : text) {
    if (c < '0' || c > '9') return false;
  }
  errno = 0;
  char* end = nullptr;
  const unsigned long long value = std::strtoull(text.c_str(), &end, 10);
  if (errno == ERANGE || *end != '\0') return false;
  out = static_cast<uint64_t>(value);
  return true;
}

bool parseFloat(const std::string& text, double& out) {
  bool sawDigit = false;
  for (char c : text) {
    if (c >= '0' && c <= '9') {
      sawDigit = true;
    } else if (c != '.' && c != '-' && c != '+' && c != 'e' && c != 'E') {
      return false;
    }
  }
  if (!sawDigit) return false;

  errno = 0;
  char* end = nullptr;
  const double value = std::strtod(text.c_str(), &end);
  if (*end != '\0' || !std::isfinite(value)) return false;
  out = value;
  return true;
}

bool parseBool(const std::string& text, bool& out) {
  if (text == "t" || text == "T" || text == "true" || text == "True" ||
      text == "TRUE") {
    out = true;
    return true;
  }
  if (text == "f" || text == "F" || text == "false" || text == "False" ||
      text == "FALSE") {
    out = false;
    return true;
  }
  return false;
}

FieldValue parseScalar(const std::string& raw) {
  const char suffix = raw.back();
  if (suffix == 'i') {
    int64_t value = 0;
    if (!parseSigned(raw.substr(0, raw.size() - 1), value)) {
      throw LineError{"invalid integer value '" + raw + "'"};
    }
    return value;
  }
  if (suffix == 'u') {
    uint64_t value = 0;
    if (!parseUnsigned(raw.substr(0, raw.size() - 1), value)) {
      throw LineError{"invalid unsigned value '" + raw + "'"};
    }
    return value;
  }

  bool flag = false;
  if (parseBool(raw, flag)) return flag;

  double number = 0;
  if (!parseFloat(raw, number)) {
    throw LineError{"invalid field value '" + raw + "'"};
  }
  return number;
}

std::chrono::system_clock::time_point toTimePoint(int64_t nanos) {
  return std::chrono::system_clock::time_point(
      std::chrono::duration_cast<std::chrono::system_clock::duration>(
          std::chrono::nanoseconds(nanos)));
}

Point parseLine(std::string_view line,
                std::chrono::system_clock::time_point now,
                Precision precision) {
  LineScanner scanner(line);
  Point point;

  point.measurement = scanner.readToken(", ", ", ");
  if (point.measurement.empty()) throw LineError{"missing measurement"};

  while (!scanner.atEnd() && scanner.peek() == ',') {
    scanner.advance();
    std::string key = scanner.readToken("=, ", ",= ");
    if (scanner.atEnd() || scanner.peek() != '=') {
      throw LineError{"missing tag value"};
    }
    if (key.empty()) throw LineError{"missing tag key"};
    scanner.advance();
    std::string value = scanner.readToken(", ", ",= ");
    if (value.empty()) throw LineError{"missing tag value"};
    if (!point.tags.emplace(std::move(key), std::move(value)).second) {
      throw LineError{"duplicate tags"};
    }
  }

  scanner.skipBlanks();
  if (scanner.atEnd()) throw LineError{"missing fields"};

  for (;;) {
    std::string key = scanner.readToken("=, ", ",= ");
    if (scanner.atEnd() || scanner.peek() != '=') {
      throw LineError{"missing field value"};
    }
    if (key.empty()) throw LineError{"missing field key"};
    scanner.advance();

    if (scanner.atEnd()) throw LineError{"missing field value"};
    if (scanner.peek() == '"') {
      scanner.advance();
      point.fields[std::move(key)] = scanner.readQuoted();
    } else {
      const std::string raw = scanner.readToken(", ", "");
      if (raw.empty()) throw LineError{"missing field value"};
      point.fields[std::move(key)] = parseScalar(raw);
    }

    if (scanner.atEnd() || scanner.peek() != ',') break;
    scanner.advance();
  }

  if (!scanner.atEnd() && !isBlank(scanner.peek())) {
    throw LineError{"invalid field format"};
  }
  scanner.skipBlanks();

  const int64_t multiplier = precisionMultiplier(precision);
  if (scanner.atEnd()) {
    const int64_t nowNanos =
        std::chrono::duration_cast<std::chrono::nanoseconds>(
            now.time_since_epoch())
            .count();
    point.timestamp = toTimePoint(nowNanos / multiplier * multiplier);
    return point;
  }

  const std::string rawTime = scanner.readToken(" \t", "");
  scanner.skipBlanks();
  if (!scanner.atEnd()) throw LineError{"trailing characters after timestamp"};

  int64_t ts = 0;
  if (!parseSigned(rawTime, ts)) {
    throw LineError{"bad timestamp '" + rawTime + "'"};
  }
  if (ts > std::numeric_limits<int64_t>::max() / multiplier ||
      ts < std::numeric_limits<int64_t>::min() / multiplier) {
    throw LineError{"time outside range " + rawTime};
  }
  point.timestamp = toTimePoint(ts * multiplier);
  return point;
}

}  // namespace

Precision parsePrecision(std::string_view value) {
  if (value == "u" || value == "us" || value == "\xC2\xB5") {
    return Precision::Microseconds;
  }
  if (value == "ms") return Precision::Milliseconds;
  if (value == "s") return Precision::Seconds;
  if (value == "m") return Precision::Minutes;
  if (value == "h") return Precision::Hours;
  return Precision::Nanoseconds;
}

int64_t precisionMultiplier(Precision precision) {
  switch (precision) {
    case Precision::Nanoseconds:
      return 1;
    case Precision::Microseconds:
      return 1000;
    case Precision::Milliseconds:
      return 1000 * 1000;
    case Precision::Seconds:
      return 1000 * 1000 * 1000;
    case Precision::Minutes:
      return int64_t{60} * 1000 * 1000 * 1000;
    case Precision::Hours:
      return int64_t{3600} * 1000 * 1000 * 1000;
  }
  return 1;
}

std::vector<Point> parsePoints(std::string_view buf,
                               std::chrono::system_clock::time_point now,
                               Precision precision) {
  std::vector<Point> points;
  std::string errors;

  for (std::string_view line : splitLines(buf)) {
    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);

    std::size_t first = 0;
    while (first < line.size() && isBlank(line[first])) ++first;
    line.remove_prefix(first);
    if (line.empty() || line.front() == '#') continue;

    try {
      points.push_back(parseLine(line, now, precision));
    } catch (const LineError& e) {
      if (!errors.empty()) errors.push_back('\n');
      errors += "unable to parse '" + std::string(line) + "': " + e.reason;
    }
  }

  if (!errors.empty()) {
    throw ParseError(errors);
  }
  return points;
}

}  // namespace ifx::lineprotocol
