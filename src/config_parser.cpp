#include "hierophant/config_parser.hpp"
#include "hierophant/log.hpp"

#include <cctype>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <system_error>

namespace hierophant {

namespace {

// Guards against include cycles
constexpr int kMaxIncludeDepth = 16;

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

}  // namespace

// ============================================================================
// ConfigValue
// ============================================================================

bool ConfigValue::asBool(bool defaultVal) const {
    if (text_.empty()) return defaultVal;

    if (text_ == "true" || text_ == "yes" || text_ == "1" || text_ == "on") {
        return true;
    }
    if (text_ == "false" || text_ == "no" || text_ == "0" || text_ == "off") {
        return false;
    }
    return defaultVal;
}

std::optional<double> ConfigValue::toDouble() const {
    if (text_.empty()) return std::nullopt;

    char* end = nullptr;
    double val = std::strtod(text_.c_str(), &end);
    if (end != text_.c_str() + text_.size()) return std::nullopt;
    return val;
}

std::optional<int64_t> ConfigValue::toInt64() const {
    if (text_.empty()) return std::nullopt;

    int64_t val = 0;
    const char* first = text_.data();
    const char* last = text_.data() + text_.size();
    if (*first == '+') ++first;
    auto [ptr, ec] = std::from_chars(first, last, val);
    if (ec != std::errc() || ptr != last) return std::nullopt;
    return val;
}

double ConfigValue::asDouble(double defaultVal) const {
    return toDouble().value_or(defaultVal);
}

int ConfigValue::asInt(int defaultVal) const {
    auto v = toInt64();
    if (!v || *v < INT32_MIN || *v > INT32_MAX) return defaultVal;
    return static_cast<int>(*v);
}

int64_t ConfigValue::asInt64(int64_t defaultVal) const {
    return toInt64().value_or(defaultVal);
}

// ============================================================================
// ConfigDocument
// ============================================================================

void ConfigDocument::addEntry(ConfigEntry entry) {
    entries_.push_back(std::move(entry));
}

const ConfigEntry* ConfigDocument::get(std::string_view key) const {
    for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
        if (it->key == key) {
            return &(*it);
        }
    }
    return nullptr;
}

std::string_view ConfigDocument::getString(std::string_view key, std::string_view defaultVal) const {
    if (auto* entry = get(key)) {
        auto sv = entry->value.asString();
        if (!sv.empty()) return sv;
    }
    return defaultVal;
}

double ConfigDocument::getDouble(std::string_view key, double defaultVal) const {
    if (auto* entry = get(key)) {
        return entry->value.asDouble(defaultVal);
    }
    return defaultVal;
}

int ConfigDocument::getInt(std::string_view key, int defaultVal) const {
    if (auto* entry = get(key)) {
        return entry->value.asInt(defaultVal);
    }
    return defaultVal;
}

int64_t ConfigDocument::getInt64(std::string_view key, int64_t defaultVal) const {
    if (auto* entry = get(key)) {
        return entry->value.asInt64(defaultVal);
    }
    return defaultVal;
}

bool ConfigDocument::getBool(std::string_view key, bool defaultVal) const {
    if (auto* entry = get(key)) {
        return entry->value.asBool(defaultVal);
    }
    return defaultVal;
}

// ============================================================================
// ConfigParser
// ============================================================================

std::optional<ConfigDocument> ConfigParser::parseFile(const std::string& path) const {
    return parseFileAtDepth(path, 0);
}

ConfigDocument ConfigParser::parseString(std::string_view content, const std::string& basePath) const {
    return parseStringAtDepth(content, basePath, 0);
}

std::optional<ConfigDocument> ConfigParser::parseFileAtDepth(const std::string& path, int depth) const {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    std::string basePath;
    auto lastSlash = path.find_last_of("/\\");
    if (lastSlash != std::string::npos) {
        basePath = path.substr(0, lastSlash + 1);
    }

    return parseStringAtDepth(buffer.str(), basePath, depth);
}

ConfigDocument ConfigParser::parseStringAtDepth(std::string_view content, const std::string& basePath,
                                                int depth) const {
    ConfigDocument doc;
    std::string_view remaining = content;
    int lineNumber = 0;

    while (!remaining.empty()) {
        auto lineEnd = remaining.find('\n');
        std::string_view line;
        if (lineEnd == std::string_view::npos) {
            line = remaining;
            remaining = {};
        } else {
            line = remaining.substr(0, lineEnd);
            remaining = remaining.substr(lineEnd + 1);
        }
        ++lineNumber;

        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }

        parseLine(line, lineNumber, doc, basePath, depth);
    }

    return doc;
}

void ConfigParser::parseLine(std::string_view line, int lineNumber, ConfigDocument& doc,
                             const std::string& basePath, int depth) const {
    // Strip trailing comment
    auto hash = line.find('#');
    if (hash != std::string_view::npos) {
        line = line.substr(0, hash);
    }
    line = trim(line);
    if (line.empty()) {
        return;
    }

    ConfigEntry entry;
    entry.line = lineNumber;

    auto colonPos = line.find(':');
    if (colonPos == std::string_view::npos) {
        // Bare key with no value
        entry.key = std::string(line);
        doc.addEntry(std::move(entry));
        return;
    }

    entry.key = std::string(trim(line.substr(0, colonPos)));
    std::string_view rest = trim(line.substr(colonPos + 1));

    if (entry.key == "include") {
        if (depth >= kMaxIncludeDepth) {
            Logger("ConfigParser").warn("include depth limit reached at line " +
                                        std::to_string(lineNumber) + ", skipping '" +
                                        std::string(rest) + "'");
            return;
        }

        std::string includePath(rest);
        std::string resolvedPath = includeResolver_ ? includeResolver_(includePath)
                                                    : basePath + includePath;

        if (auto included = parseFileAtDepth(resolvedPath, depth + 1)) {
            for (const auto& e : *included) {
                doc.addEntry(e);
            }
        } else {
            Logger("ConfigParser").warn("cannot open included file: " + resolvedPath);
        }
        return;
    }

    entry.value = ConfigValue(rest);
    doc.addEntry(std::move(entry));
}

}  // namespace hierophant
