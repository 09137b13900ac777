#include "finenoise/preset/config_parser.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>

namespace finenoise {

namespace {

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
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

double ConfigValue::asDouble(double defaultVal) const {
    if (!numbers_.empty()) {
        return numbers_[0];
    }
    if (text_.empty()) return defaultVal;

    char* end;
    double val = std::strtod(text_.c_str(), &end);
    if (end == text_.c_str()) return defaultVal;
    return val;
}

int ConfigValue::asInt(int defaultVal) const {
    if (!numbers_.empty()) {
        return static_cast<int>(numbers_[0]);
    }
    if (text_.empty()) return defaultVal;

    char* end;
    long val = std::strtol(text_.c_str(), &end, 10);
    if (end == text_.c_str()) return defaultVal;
    return static_cast<int>(val);
}

uint32_t ConfigValue::asUnsigned(uint32_t defaultVal) const {
    if (!numbers_.empty()) {
        return static_cast<uint32_t>(numbers_[0]);
    }
    if (text_.empty() || text_[0] == '-') return defaultVal;

    char* end;
    errno = 0;
    unsigned long long val = std::strtoull(text_.c_str(), &end, 0);
    if (end == text_.c_str() || errno == ERANGE || val > 0xFFFFFFFFull) return defaultVal;
    return static_cast<uint32_t>(val);
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

const ConfigEntry* ConfigDocument::get(std::string_view key, std::string_view suffix) const {
    for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
        if (it->key == key && it->suffix == suffix) {
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

uint32_t ConfigDocument::getUnsigned(std::string_view key, uint32_t defaultVal) const {
    if (auto* entry = get(key)) {
        return entry->value.asUnsigned(defaultVal);
    }
    return defaultVal;
}

bool ConfigDocument::getBool(std::string_view key, bool defaultVal) const {
    if (auto* entry = get(key)) {
        return entry->value.asBool(defaultVal);
    }
    return defaultVal;
}

std::vector<const ConfigEntry*> ConfigDocument::getAll(std::string_view key) const {
    std::vector<const ConfigEntry*> result;
    for (const auto& entry : entries_) {
        if (entry.key == key) {
            result.push_back(&entry);
        }
    }
    return result;
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

    // Relative includes resolve against this file's directory
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
    ConfigEntry currentEntry;

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

        parseLine(line, lineNumber, currentEntry, doc, basePath, depth);
    }

    flushEntry(currentEntry, doc);
    return doc;
}

void ConfigParser::parseLine(std::string_view line, int lineNumber, ConfigEntry& currentEntry,
                             ConfigDocument& doc, const std::string& basePath, int depth) const {
    if (trim(line).empty()) {
        return;
    }

    // Indented: data line for the current entry
    if (std::isspace(static_cast<unsigned char>(line[0]))) {
        auto numbers = parseDataLine(line);
        if (!numbers.empty()) {
            currentEntry.dataLines.push_back(std::move(numbers));
        }
        return;
    }

    flushEntry(currentEntry, doc);

    if (line[0] == '#') {
        return;
    }

    currentEntry.line = lineNumber;

    auto colonPos = line.find(':');
    if (colonPos == std::string_view::npos) {
        // Bare key with no value
        currentEntry.key = std::string(trim(line));
        return;
    }

    currentEntry.key = std::string(trim(line.substr(0, colonPos)));

    // key:suffix: value
    auto rest = line.substr(colonPos + 1);
    auto secondColon = rest.find(':');
    if (secondColon != std::string_view::npos) {
        currentEntry.suffix = std::string(trim(rest.substr(0, secondColon)));
        rest = rest.substr(secondColon + 1);
    }
    rest = trim(rest);

    if (currentEntry.key == "include") {
        includeFile(rest, doc, basePath, depth);
        currentEntry = ConfigEntry{};
        return;
    }

    if (!rest.empty()) {
        currentEntry.value = ConfigValue(rest);
    }
}

void ConfigParser::includeFile(std::string_view target, ConfigDocument& doc,
                               const std::string& basePath, int depth) const {
    std::string includePath(target);
    if (depth >= MAX_INCLUDE_DEPTH) {
        std::cerr << "[ConfigParser] WARNING: include depth limit reached, skipping '"
                  << includePath << "'\n";
        return;
    }

    std::string resolvedPath = includeResolver_ ? includeResolver_(includePath) : basePath + includePath;

    auto includedDoc = parseFileAtDepth(resolvedPath, depth + 1);
    if (!includedDoc) {
        std::cerr << "[ConfigParser] WARNING: cannot open include '" << resolvedPath << "'\n";
        return;
    }
    for (const auto& entry : *includedDoc) {
        doc.addEntry(entry);
    }
}

std::vector<double> ConfigParser::parseDataLine(std::string_view line) {
    std::vector<double> numbers;

    // strtod needs a terminated buffer
    std::string text(line);
    const char* pos = text.c_str();
    const char* stop = pos + text.size();

    while (pos < stop) {
        while (pos < stop && std::isspace(static_cast<unsigned char>(*pos))) {
            ++pos;
        }
        if (pos >= stop) break;

        char* end;
        double val = std::strtod(pos, &end);
        if (end == pos) {
            // Not a number: skip the token
            while (pos < stop && !std::isspace(static_cast<unsigned char>(*pos))) {
                ++pos;
            }
        } else {
            numbers.push_back(val);
            pos = end;
        }
    }

    return numbers;
}

void ConfigParser::flushEntry(ConfigEntry& entry, ConfigDocument& doc) {
    if (!entry.key.empty()) {
        doc.addEntry(std::move(entry));
    }
    entry = ConfigEntry{};
}

}  // namespace finenoise
