// =================================================================
// src/Renamarion/Rule.cpp
// =================================================================
// Implementation for the literal-character and trailing-character rules.

#include "Renamarion/Rule.hpp"
#include <iomanip>
#include <sstream>

namespace Renamarion {

// Decode one UTF-8 sequence starting at pos. Returns the number of bytes
// consumed, or 0 if the bytes are not a valid sequence.
static size_t decodeUtf8(const std::string& text, size_t pos, unsigned long& code_point) {
    unsigned char lead = static_cast<unsigned char>(text[pos]);
    size_t length = 0;
    if ((lead & 0xE0) == 0xC0) {
        length = 2;
        code_point = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        length = 3;
        code_point = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        length = 4;
        code_point = lead & 0x07;
    } else {
        return 0;
    }

    if (pos + length > text.size()) {
        return 0;
    }
    for (size_t i = 1; i < length; ++i) {
        unsigned char cont = static_cast<unsigned char>(text[pos + i]);
        if ((cont & 0xC0) != 0x80) {
            return 0;
        }
        code_point = (code_point << 6) | (cont & 0x3F);
    }
    return length;
}

std::string Rule::escapeForDisplay(const std::string& text) {
    std::ostringstream out;
    size_t pos = 0;
    while (pos < text.size()) {
        unsigned char c = static_cast<unsigned char>(text[pos]);
        if (c < 0x80) {
            switch (c) {
                case '\r': out << "\\r"; break;
                case '\n': out << "\\n"; break;
                case '\t': out << "\\t"; break;
                default:
                    if (c < 0x20 || c == 0x7F) {
                        out << "\\x" << std::hex << std::setw(2) << std::setfill('0')
                            << static_cast<int>(c) << std::dec;
                    } else {
                        out << static_cast<char>(c);
                    }
                    break;
            }
            ++pos;
            continue;
        }

        unsigned long code_point = 0;
        size_t length = decodeUtf8(text, pos, code_point);
        if (length == 0) {
            out << "\\x" << std::hex << std::setw(2) << std::setfill('0')
                << static_cast<int>(c) << std::dec;
            ++pos;
            continue;
        }
        if (code_point > 0xFFFF) {
            out << "\\U" << std::hex << std::setw(8) << std::setfill('0') << code_point << std::dec;
        } else {
            out << "\\u" << std::hex << std::setw(4) << std::setfill('0') << code_point << std::dec;
        }
        pos += length;
    }
    return out.str();
}

LiteralCharacterRule::LiteralCharacterRule(const std::string& character,
                                           const std::string& replacement)
    : m_character(character), m_replacement(replacement) {}

bool LiteralCharacterRule::matches(const std::string& name) const {
    return !m_character.empty() && name.find(m_character) != std::string::npos;
}

std::string LiteralCharacterRule::apply(const std::string& name) const {
    if (!matches(name)) {
        return name;
    }

    std::string result;
    result.reserve(name.size());
    size_t start = 0;
    size_t found;
    while ((found = name.find(m_character, start)) != std::string::npos) {
        result.append(name, start, found - start);
        result += m_replacement;
        start = found + m_character.size();
    }
    result.append(name, start, std::string::npos);
    return result;
}

std::string LiteralCharacterRule::describe() const {
    if (m_replacement.empty()) {
        return "will be removed";
    }
    return "will be converted to " + escapeForDisplay(m_replacement);
}

TrailingCharacterRule::TrailingCharacterRule(const std::string& trailing_characters,
                                             const std::string& key)
    : m_key(key), m_trailing_characters(trailing_characters) {}

bool TrailingCharacterRule::matches(const std::string& name) const {
    return !name.empty() && m_trailing_characters.find(name.back()) != std::string::npos;
}

std::string TrailingCharacterRule::apply(const std::string& name) const {
    size_t last = name.find_last_not_of(m_trailing_characters);
    if (last == std::string::npos) {
        return "";
    }
    return name.substr(0, last + 1);
}

std::string TrailingCharacterRule::describe() const {
    std::string shown;
    for (char c : m_trailing_characters) {
        if (!shown.empty()) {
            shown += " ";
        }
        shown += (c == ' ') ? std::string("<space>") : escapeForDisplay(std::string(1, c));
    }
    return "trailing " + shown + " will be stripped";
}

std::string formatRuleKeySet(const RuleKeySet& keys) {
    std::string formatted = "{";
    bool first = true;
    for (const auto& key : keys) {
        if (!first) {
            formatted += ", ";
        }
        formatted += Rule::escapeForDisplay(key);
        first = false;
    }
    formatted += "}";
    return formatted;
}

} // namespace Renamarion
