// =================================================================
// include/Renamarion/Console.hpp
// =================================================================
// Line-based terminal I/O with optional ANSI colors.

#pragma once

#include <istream>
#include <ostream>
#include <string>

namespace Renamarion {

/**
 * @brief Wraps the input and output streams of the interactive dialogue
 */
class Console {
public:
    static constexpr const char* RESET = "\033[0m";
    static constexpr const char* RED = "\033[31m";
    static constexpr const char* GREEN = "\033[32m";
    static constexpr const char* YELLOW = "\033[33m";
    static constexpr const char* BLUE = "\033[34m";
    static constexpr const char* CYAN = "\033[36m";
    static constexpr const char* LIGHT_YELLOW = "\033[93m";
    static constexpr const char* LIGHT_MAGENTA = "\033[95m";

    Console(std::istream& in, std::ostream& out, bool color = true);

    std::ostream& out() { return m_out; }

    /**
     * @brief Wrap text in a color code, or return it unchanged if colors are off
     */
    std::string paint(const std::string& text, const char* color) const;

    /**
     * @brief Print a prompt and read one line
     * @param prompt Text printed before reading
     * @param line Receives the line without the newline
     * @return False at end of input
     */
    bool readLine(const std::string& prompt, std::string& line);

    /**
     * @brief Ask a yes/no question until a valid answer is given
     * @param question Question text; " [y/n]: " is appended
     * @param answer Receives the answer
     * @return False at end of input
     */
    bool confirm(const std::string& question, bool& answer);

    bool isColorEnabled() const { return m_color; }

private:
    std::istream& m_in;
    std::ostream& m_out;
    bool m_color;
};

} // namespace Renamarion
