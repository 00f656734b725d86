#include "tdma/agent/ResponseParser.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <cstring>

namespace tdma::agent {

namespace {

using json = nlohmann::json;

constexpr std::array<const char*, 2> kPreferredKeys{"channels", "slots"};

struct SpecialCharacter {
    const char* bytes;
    char mapped;  // '\0' drops the sequence
};

// UTF-8 sequences seen in replies from chat models.
constexpr std::array<SpecialCharacter, 13> kSpecialCharacters{{
    {"\xE2\x80\x9C", '"'},   // left double quotation mark
    {"\xE2\x80\x9D", '"'},   // right double quotation mark
    {"\xEF\xBC\x82", '"'},   // fullwidth quotation mark
    {"\xE2\x80\x98", '\''},  // left single quotation mark
    {"\xE2\x80\x99", '\''},  // right single quotation mark
    {"\xEF\xBC\x87", '\''},  // fullwidth apostrophe
    {"\xEF\xBC\x8C", ','},   // fullwidth comma
    {"\xE3\x80\x81", ','},   // ideographic comma
    {"\xEF\xBC\x9A", ':'},   // fullwidth colon
    {"\xEF\xBC\xBB", '['},   // fullwidth left square bracket
    {"\xEF\xBC\xBD", ']'},   // fullwidth right square bracket
    {"\xEF\xBC\x9B", ';'},   // fullwidth semicolon
    {"\xE3\x80\x82", '\0'},  // ideographic full stop
}};

struct Token {
    char ch;
    std::size_t length;
    bool special;
};

Token readToken(const std::string& text, std::size_t pos) {
    for (const auto& special : kSpecialCharacters) {
        const std::size_t length = std::strlen(special.bytes);
        if (text.compare(pos, length, special.bytes) == 0) {
            return {special.mapped, length, true};
        }
    }
    return {text[pos], 1, false};
}

bool isBlank(char ch) {
    return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r';
}

bool isKeyStart(char ch) {
    return std::isalpha(static_cast<unsigned char>(ch)) != 0 || ch == '_';
}

bool isKeyChar(char ch) {
    return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_' || ch == '-';
}

// First non-blank character at or after @p pos, '\0' at the end of the text.
char peekSignificant(const std::string& text, std::size_t pos) {
    while (pos < text.size()) {
        const auto token = readToken(text, pos);
        if (!(token.special && token.ch == '\0') && !isBlank(token.ch)) {
            return token.ch;
        }
        pos += token.length;
    }
    return '\0';
}

// A quote only ends a string literal when JSON structure follows it, so
// apostrophes inside single-quoted text survive.
bool endsLiteral(char next) {
    return next == ',' || next == ':' || next == '}' || next == ']' || next == '\0';
}

std::optional<std::size_t> matchClosingBrace(const std::string& text, std::size_t open) {
    int depth = 0;
    bool inString = false;
    bool escaped = false;
    for (std::size_t i = open; i < text.size(); ++i) {
        const char ch = text[i];
        if (inString) {
            if (escaped) {
                escaped = false;
            } else if (ch == '\\') {
                escaped = true;
            } else if (ch == '"') {
                inString = false;
            }
            continue;
        }
        if (ch == '"') {
            inString = true;
        } else if (ch == '{') {
            ++depth;
        } else if (ch == '}') {
            --depth;
            if (depth == 0) {
                return i;
            }
        }
    }
    return std::nullopt;
}

std::optional<json> parseObject(const std::string& text) {
    json parsed = json::parse(text, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return std::nullopt;
    }
    return parsed;
}

// Numbers and numeric strings; lists of prose notes are skipped.
bool looksLikeSlot(const json& entry) {
    if (entry.is_number()) {
        return true;
    }
    if (!entry.is_string()) {
        return false;
    }
    const auto& text = entry.get_ref<const std::string&>();
    const auto first = text.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return false;
    }
    const char* begin = text.c_str() + first;
    char* end = nullptr;
    std::strtod(begin, &end);
    return end != begin && text.find_first_not_of(" \t", static_cast<std::size_t>(end - text.c_str())) ==
                               std::string::npos;
}

std::optional<std::vector<json>> selectSlotList(const json& object) {
    for (const char* key : kPreferredKeys) {
        auto it = object.find(key);
        if (it != object.end() && it->is_array()) {
            return std::vector<json>(it->begin(), it->end());
        }
    }
    for (const auto& item : object.items()) {
        const auto& value = item.value();
        if (value.is_array() && std::any_of(value.begin(), value.end(), looksLikeSlot)) {
            return std::vector<json>(value.begin(), value.end());
        }
    }
    return std::nullopt;
}

}  // namespace

std::optional<std::string> extractBalancedObject(const std::string& text) {
    std::size_t open = text.find('{');
    while (open != std::string::npos) {
        if (auto close = matchClosingBrace(text, open)) {
            return text.substr(open, *close - open + 1);
        }
        open = text.find('{', open + 1);
    }
    return std::nullopt;
}

std::string normalizeJsonText(const std::string& text) {
    std::string normalized;
    normalized.reserve(text.size());
    char quote = 0;  // delimiter of the open string literal
    char lastSignificant = 0;

    std::size_t pos = 0;
    while (pos < text.size()) {
        const auto token = readToken(text, pos);

        if (quote != 0) {
            if (!token.special && token.ch == '\\' && pos + 1 < text.size()) {
                if (quote == '\'' && text[pos + 1] == '\'') {
                    normalized += '\'';
                } else {
                    normalized.append(text, pos, 2);
                }
                pos += 2;
                continue;
            }
            if (token.ch == quote && endsLiteral(peekSignificant(text, pos + token.length))) {
                normalized += '"';
                quote = 0;
                lastSignificant = '"';
            } else if (!token.special && token.ch == '"') {
                normalized += "\\\"";
            } else {
                normalized.append(text, pos, token.length);
            }
            pos += token.length;
            continue;
        }

        if (token.ch == '"' || token.ch == '\'') {
            normalized += '"';
            quote = token.ch;
            lastSignificant = '"';
        } else if (token.ch == ';' || (token.special && token.ch == '\0')) {
            // dropped
        } else if (token.ch == ',' && (peekSignificant(text, pos + token.length) == '}' ||
                                       peekSignificant(text, pos + token.length) == ']')) {
            // trailing comma
        } else if (!token.special && isKeyStart(token.ch)) {
            std::size_t end = pos;
            while (end < text.size() && isKeyChar(text[end])) {
                ++end;
            }
            const auto word = text.substr(pos, end - pos);
            if ((lastSignificant == '{' || lastSignificant == ',') && peekSignificant(text, end) == ':') {
                normalized += '"' + word + '"';
            } else {
                normalized += word;
            }
            lastSignificant = word.back();
            pos = end;
            continue;
        } else {
            normalized += token.ch;
            if (!isBlank(token.ch)) {
                lastSignificant = token.ch;
            }
        }
        pos += token.length;
    }
    return normalized;
}

std::optional<std::vector<json>> parseProposal(const std::string& text) {
    // Normalization can turn curly quotes into real ones, so look for the object
    // in both the raw and the normalized reply.
    auto candidate = extractBalancedObject(text);
    if (!candidate) {
        candidate = extractBalancedObject(normalizeJsonText(text));
        if (!candidate) {
            spdlog::debug("Reply contains no balanced object");
            return std::nullopt;
        }
    }

    auto object = parseObject(*candidate);
    if (!object) {
        object = parseObject(normalizeJsonText(*candidate));
    }
    if (!object) {
        spdlog::debug("Reply object is not valid JSON after normalization: {}", *candidate);
        return std::nullopt;
    }

    auto slots = selectSlotList(*object);
    if (!slots) {
        spdlog::debug("Reply object has no array-valued key");
    }
    return slots;
}

}  // namespace tdma::agent
