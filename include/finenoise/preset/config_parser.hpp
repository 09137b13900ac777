/**
 * @file config_parser.hpp
 * @brief Line-based `key: value` configuration format used for noise presets
 */

#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace finenoise {

// ============================================================================
// ConfigValue - A parsed configuration value
// ============================================================================

/**
 * @brief A configuration value: the text after the colon, or a list of numbers
 */
class ConfigValue {
public:
    ConfigValue() = default;
    explicit ConfigValue(std::string_view text) : text_(text) {}
    explicit ConfigValue(std::vector<double> numbers) : numbers_(std::move(numbers)) {}

    [[nodiscard]] std::string_view asString() const { return text_; }

    /// true/yes/on/1 and false/no/off/0; anything else gives the default
    [[nodiscard]] bool asBool(bool defaultVal = false) const;

    [[nodiscard]] double asDouble(double defaultVal = 0.0) const;
    [[nodiscard]] int asInt(int defaultVal = 0) const;

    /// Full 32-bit unsigned range, for seeds. Accepts 0x-prefixed hex.
    [[nodiscard]] uint32_t asUnsigned(uint32_t defaultVal = 0) const;

    [[nodiscard]] const std::vector<double>& asNumbers() const { return numbers_; }
    [[nodiscard]] bool hasNumbers() const { return !numbers_.empty(); }

    [[nodiscard]] bool empty() const { return text_.empty() && numbers_.empty(); }

private:
    std::string text_;
    std::vector<double> numbers_;
};

// ============================================================================
// ConfigEntry - A key-value pair with optional suffix and data lines
// ============================================================================

/**
 * @brief A configuration entry
 *
 * Represents entries like:
 *   key: value
 *   key:suffix: value
 *   key:suffix:
 *       data line 1
 *       data line 2
 */
struct ConfigEntry {
    std::string key;
    std::string suffix;
    ConfigValue value;
    std::vector<std::vector<double>> dataLines;  // Indented lines, parsed as numbers
    int line = 0;                                // 1-based source line of the key

    [[nodiscard]] bool hasSuffix() const { return !suffix.empty(); }
    [[nodiscard]] bool hasData() const { return !dataLines.empty(); }
};

// ============================================================================
// ConfigDocument - A parsed configuration file
// ============================================================================

/**
 * @brief Entries of a parsed document, in file order.
 *
 * Simple lookups return the last entry with the key, so later entries
 * (including those after an include) override earlier ones.
 */
class ConfigDocument {
public:
    ConfigDocument() = default;

    void addEntry(ConfigEntry entry);

    [[nodiscard]] const ConfigEntry* get(std::string_view key) const;
    [[nodiscard]] const ConfigEntry* get(std::string_view key, std::string_view suffix) const;

    [[nodiscard]] std::string_view getString(std::string_view key, std::string_view defaultVal = "") const;
    [[nodiscard]] double getDouble(std::string_view key, double defaultVal = 0.0) const;
    [[nodiscard]] int getInt(std::string_view key, int defaultVal = 0) const;
    [[nodiscard]] uint32_t getUnsigned(std::string_view key, uint32_t defaultVal = 0) const;
    [[nodiscard]] bool getBool(std::string_view key, bool defaultVal = false) const;

    [[nodiscard]] bool has(std::string_view key) const { return get(key) != nullptr; }

    [[nodiscard]] std::vector<const ConfigEntry*> getAll(std::string_view key) const;

    [[nodiscard]] const std::vector<ConfigEntry>& entries() const { return entries_; }
    [[nodiscard]] auto begin() const { return entries_.begin(); }
    [[nodiscard]] auto end() const { return entries_.end(); }
    [[nodiscard]] bool empty() const { return entries_.empty(); }
    [[nodiscard]] size_t size() const { return entries_.size(); }

private:
    std::vector<ConfigEntry> entries_;
};

// ============================================================================
// ConfigParser - Parses configuration files
// ============================================================================

/**
 * @brief Parser for the preset configuration format
 *
 * Format:
 * ```
 * # Comments start with #
 * generator: perlin
 * seed: 42
 * clamp:
 *     -0.5 0.5
 * include: common.noise
 * ```
 *
 * Indented lines are data lines attached to the preceding key. An
 * `include:` line splices in the entries of another file at that position.
 * Relative includes resolve against the including file's directory unless
 * an include resolver is installed.
 */
class ConfigParser {
public:
    using IncludeResolver = std::function<std::string(const std::string&)>;

    /// Nested includes deeper than this are skipped with a warning
    static constexpr int MAX_INCLUDE_DEPTH = 16;

    ConfigParser() = default;

    void setIncludeResolver(IncludeResolver resolver) { includeResolver_ = std::move(resolver); }

    /**
     * @brief Parse a configuration file
     * @return Parsed document, or nullopt if the file cannot be opened
     */
    [[nodiscard]] std::optional<ConfigDocument> parseFile(const std::string& path) const;

    /**
     * @brief Parse configuration from a string
     * @param basePath Directory prefix for resolving relative includes
     */
    [[nodiscard]] ConfigDocument parseString(std::string_view content,
                                             const std::string& basePath = "") const;

private:
    IncludeResolver includeResolver_;

    [[nodiscard]] std::optional<ConfigDocument> parseFileAtDepth(const std::string& path, int depth) const;
    [[nodiscard]] ConfigDocument parseStringAtDepth(std::string_view content, const std::string& basePath,
                                                    int depth) const;

    void parseLine(std::string_view line, int lineNumber, ConfigEntry& currentEntry,
                   ConfigDocument& doc, const std::string& basePath, int depth) const;

    void includeFile(std::string_view target, ConfigDocument& doc,
                     const std::string& basePath, int depth) const;

    [[nodiscard]] static std::vector<double> parseDataLine(std::string_view line);

    static void flushEntry(ConfigEntry& entry, ConfigDocument& doc);
};

}  // namespace finenoise
