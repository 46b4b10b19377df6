#ifndef SYMMORPH_UI_CLI_TOKENIZER_HPP
#define SYMMORPH_UI_CLI_TOKENIZER_HPP

#include <string>
#include <vector>

namespace symmorph::ui::cli
{

// Shell-style word splitting for the interactive session.
// 'single' quotes are literal, "double" quotes honour \" and \\, a bare backslash escapes the next character.
// An unterminated quote runs to the end of the line.
class Tokenizer
{
public:
    [[nodiscard]] static std::vector<std::string> tokenize(const std::string& line);
};

} // namespace symmorph::ui::cli

#endif // SYMMORPH_UI_CLI_TOKENIZER_HPP
