// =================================================================
// src/Renamarion/Console.cpp
// =================================================================
// Implementation for terminal I/O.

#include "Renamarion/Console.hpp"
#include <algorithm>
#include <cctype>

namespace Renamarion {

static std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

Console::Console(std::istream& in, std::ostream& out, bool color)
    : m_in(in), m_out(out), m_color(color) {}

std::string Console::paint(const std::string& text, const char* color) const {
    if (!m_color) {
        return text;
    }
    return std::string(color) + text + RESET;
}

bool Console::readLine(const std::string& prompt, std::string& line) {
    m_out << prompt << std::flush;
    if (!std::getline(m_in, line)) {
        m_out << std::endl;
        return false;
    }
    // Tolerate CRLF input
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return true;
}

bool Console::confirm(const std::string& question, bool& answer) {
    std::string line;
    while (readLine(question + " [y/n]: ", line)) {
        std::string choice = toLower(line);
        if (choice == "y" || choice == "yes") {
            answer = true;
            return true;
        }
        if (choice == "n" || choice == "no") {
            answer = false;
            return true;
        }
        m_out << paint("Please answer 'y' or 'n'.", RED) << std::endl;
    }
    return false;
}

} // namespace Renamarion
