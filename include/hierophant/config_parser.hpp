/**
 * @file config_parser.hpp
 * @brief Line-based "key: value" configuration files
 *
 * Format:
 * ```
 * # Comments start with #
 * width: 1200
 * seed: 42
 * include: shared.conf
 * ```
 *
 * Later entries override earlier ones for simple lookups. `include:` pulls in
 * another file's entries at that position, resolved relative to the
 * including file unless an include resolver is set.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hierophant {

// ============================================================================
// ConfigValue
// ============================================================================

/// Raw value text with typed accessors. Accessors return the default when
/// the text is empty or does not parse completely.
class ConfigValue {
public:
    ConfigValue() = default;
    explicit ConfigValue(std::string_view text) : text_(text) {}

    [[nodiscard]] std::string_view asString() const { return text_; }

    [[nodiscard]] bool asBool(bool defaultVal = false) const;
    [[nodiscard]] double asDouble(double defaultVal = 0.0) const;
    [[nodiscard]] int asInt(int defaultVal = 0) const;
    [[nodiscard]] int64_t asInt64(int64_t defaultVal = 0) const;

    /// Strict parses: nullopt unless the whole text is a valid number
    [[nodiscard]] std::optional<double> toDouble() const;
    [[nodiscard]] std::optional<int64_t> toInt64() const;

    [[nodiscard]] bool empty() const { return text_.empty(); }

private:
    std::string text_;
};

struct ConfigEntry {
    std::string key;
    ConfigValue value;
    int line = 0;           ///< 1-based line in the file it came from
};

// ============================================================================
// ConfigDocument
// ============================================================================

class ConfigDocument {
public:
    void addEntry(ConfigEntry entry);

    /// Last entry with this key, or nullptr
    [[nodiscard]] const ConfigEntry* get(std::string_view key) const;
    [[nodiscard]] bool has(std::string_view key) const { return get(key) != nullptr; }

    [[nodiscard]] std::string_view getString(std::string_view key, std::string_view defaultVal = "") const;
    [[nodiscard]] double getDouble(std::string_view key, double defaultVal = 0.0) const;
    [[nodiscard]] int getInt(std::string_view key, int defaultVal = 0) const;
    [[nodiscard]] int64_t getInt64(std::string_view key, int64_t defaultVal = 0) const;
    [[nodiscard]] bool getBool(std::string_view key, bool defaultVal = false) const;

    [[nodiscard]] const std::vector<ConfigEntry>& entries() const { return entries_; }
    [[nodiscard]] auto begin() const { return entries_.begin(); }
    [[nodiscard]] auto end() const { return entries_.end(); }
    [[nodiscard]] bool empty() const { return entries_.empty(); }
    [[nodiscard]] size_t size() const { return entries_.size(); }

private:
    std::vector<ConfigEntry> entries_;
};

// ============================================================================
// ConfigParser
// ============================================================================

class ConfigParser {
public:
    using IncludeResolver = std::function<std::string(const std::string&)>;

    /// Map an include path to a filesystem path
    void setIncludeResolver(IncludeResolver resolver) { includeResolver_ = std::move(resolver); }

    /// Parse a file; nullopt if it cannot be opened
    [[nodiscard]] std::optional<ConfigDocument> parseFile(const std::string& path) const;

    /// Parse text; includes resolve against basePath
    [[nodiscard]] ConfigDocument parseString(std::string_view content,
                                             const std::string& basePath = "") const;

private:
    void parseLine(std::string_view line, int lineNumber, ConfigDocument& doc,
                   const std::string& basePath, int depth) const;
    [[nodiscard]] std::optional<ConfigDocument> parseFileAtDepth(const std::string& path,
                                                                 int depth) const;
    [[nodiscard]] ConfigDocument parseStringAtDepth(std::string_view content,
                                                    const std::string& basePath,
                                                    int depth) const;

    IncludeResolver includeResolver_;
};

}  // namespace hierophant
