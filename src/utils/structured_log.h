/**
 * @file structured_log.h
 * @brief Structured logging on top of spdlog
 *
 * Each event is emitted as a single line, either as a JSON object or as
 * space separated key=value pairs, so logs can be parsed by tooling.
 */

#pragma once

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace phonegen::utils {

/**
 * @brief Structured log line builder
 *
 * Example usage:
 * @code
 * StructuredLog()
 *   .Event("dispatch_failed")
 *   .Field("partition", partition_index)
 *   .Field("error", error.message())
 *   .Error();
 * @endcode
 */
class StructuredLog {
 public:
  enum class Format : uint8_t { kJson, kText };

  StructuredLog() = default;

  /**
   * @brief Set the process-wide output format
   */
  static void SetFormat(Format format) { format_.store(format); }

  [[nodiscard]] static Format GetFormat() { return format_.load(); }

  /**
   * @brief Parse "json" / "text" (anything else means JSON)
   */
  static Format ParseFormat(const std::string& name) { return name == "text" ? Format::kText : Format::kJson; }

  StructuredLog& Event(const std::string& event) {
    event_ = event;
    return *this;
  }

  StructuredLog& Field(const std::string& key, const char* value) {
    fields_.emplace_back(key, Quoted{std::string(value)});
    return *this;
  }

  StructuredLog& Field(const std::string& key, const std::string& value) {
    fields_.emplace_back(key, Quoted{value});
    return *this;
  }

  StructuredLog& Field(const std::string& key, std::string_view value) {
    fields_.emplace_back(key, Quoted{std::string(value)});
    return *this;
  }

  StructuredLog& Field(const std::string& key, int64_t value) {
    fields_.emplace_back(key, Raw{std::to_string(value)});
    return *this;
  }

  StructuredLog& Field(const std::string& key, uint64_t value) {
    fields_.emplace_back(key, Raw{std::to_string(value)});
    return *this;
  }

  StructuredLog& Field(const std::string& key, double value) {
    std::ostringstream oss;
    oss << value;
    fields_.emplace_back(key, Raw{oss.str()});
    return *this;
  }

  StructuredLog& Field(const std::string& key, bool value) {
    fields_.emplace_back(key, Raw{value ? "true" : "false"});
    return *this;
  }

  /**
   * @brief Human-readable context
   */
  StructuredLog& Message(const std::string& message) {
    message_ = message;
    return *this;
  }

  void Debug() { spdlog::debug("{}", Build()); }
  void Info() { spdlog::info("{}", Build()); }
  void Warn() { spdlog::warn("{}", Build()); }
  void Error() { spdlog::error("{}", Build()); }
  void Critical() { spdlog::critical("{}", Build()); }

  /**
   * @brief Render the line without logging it
   */
  [[nodiscard]] std::string Build() const { return GetFormat() == Format::kText ? BuildText() : BuildJson(); }

 private:
  struct Quoted {
    std::string text;
  };
  struct Raw {
    std::string text;
  };
  struct FieldValue {
    FieldValue(Quoted quoted) : text(std::move(quoted.text)), quoted(true) {}  // NOLINT(google-explicit-constructor)
    FieldValue(Raw raw) : text(std::move(raw.text)), quoted(false) {}          // NOLINT(google-explicit-constructor)
    std::string text;
    bool quoted;
  };

  inline static std::atomic<Format> format_{Format::kJson};

  std::string event_;
  std::string message_;
  std::vector<std::pair<std::string, FieldValue>> fields_;

  std::string BuildJson() const {
    std::ostringstream json;
    json << "{";
    bool first = true;
    auto separator = [&]() {
      if (!first) {
        json << ",";
      }
      first = false;
    };

    if (!event_.empty()) {
      separator();
      json << R"("event":")" << Escape(event_) << R"(")";
    }
    if (!message_.empty()) {
      separator();
      json << R"("message":")" << Escape(message_) << R"(")";
    }
    for (const auto& [key, value] : fields_) {
      separator();
      json << "\"" << Escape(key) << "\":";
      if (value.quoted) {
        json << "\"" << Escape(value.text) << "\"";
      } else {
        json << value.text;
      }
    }
    json << "}";
    return json.str();
  }

  std::string BuildText() const {
    std::ostringstream text;
    text << event_;
    if (!message_.empty()) {
      text << ": " << message_;
    }
    for (const auto& [key, value] : fields_) {
      text << " " << key << "=";
      if (value.quoted && value.text.find(' ') != std::string::npos) {
        text << "\"" << value.text << "\"";
      } else {
        text << value.text;
      }
    }
    return text.str();
  }

  static std::string Escape(const std::string& str) {
    // Control character threshold for JSON escaping (0x20 = space)
    constexpr char kControlCharThreshold = 0x20;

    std::ostringstream escaped;
    for (char chr : str) {
      switch (chr) {
        case '"':
          escaped << R"(\")";
          break;
        case '\\':
          escaped << R"(\\)";
          break;
        case '\b':
          escaped << R"(\b)";
          break;
        case '\f':
          escaped << R"(\f)";
          break;
        case '\n':
          escaped << R"(\n)";
          break;
        case '\r':
          escaped << R"(\r)";
          break;
        case '\t':
          escaped << R"(\t)";
          break;
        default:
          if (chr >= 0 && chr < kControlCharThreshold) {
            escaped << R"(\u)" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(chr);
          } else {
            escaped << chr;
          }
      }
    }
    return escaped.str();
  }
};

/**
 * @brief Log a record source failure
 */
inline void LogSourceError(const std::string& source, const std::string& location, const std::string& error_msg) {
  StructuredLog()
      .Event("source_error")
      .Field("source", source)
      .Field("location", location)
      .Field("error", error_msg)
      .Error();
}

/**
 * @brief Log an output file failure
 */
inline void LogOutputError(const std::string& operation, const std::string& filepath, const std::string& error_msg) {
  StructuredLog()
      .Event("output_error")
      .Field("operation", operation)
      .Field("filepath", filepath)
      .Field("error", error_msg)
      .Error();
}

}  // namespace phonegen::utils
