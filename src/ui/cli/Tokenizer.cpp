#include "Tokenizer.hpp"

#include <cctype>

namespace symmorph::ui::cli
{

std::vector<std::string> Tokenizer::tokenize(const std::string& line)
{
    enum class Quote
    {
        None,
        Single,
        Double
    };

    std::vector<std::string> words{};
    std::string word{};
    bool inWord{ false };
    Quote quote{ Quote::None };

    const auto flush = [&]()
    {
        if (inWord)
        {
            words.push_back(word);
        }
        word.clear();
        inWord = false;
    };

    for (std::size_t i{}; i < line.size(); ++i)
    {
        const char c{ line[i] };
        const bool hasNext{ i + 1U < line.size() };

        switch (quote)
        {
        case Quote::Single:
            if (c == '\'')
            {
                quote = Quote::None;
            }
            else
            {
                word.push_back(c);
            }
            break;

        case Quote::Double:
            if (c == '"')
            {
                quote = Quote::None;
            }
            else if (c == '\\' && hasNext && (line[i + 1U] == '"' || line[i + 1U] == '\\'))
            {
                word.push_back(line[++i]);
            }
            else
            {
                word.push_back(c);
            }
            break;

        case Quote::None:
            if (std::isspace(static_cast<unsigned char>(c)) != 0)
            {
                flush();
                continue;
            }
            inWord = true;
            if (c == '\'')
            {
                quote = Quote::Single;
            }
            else if (c == '"')
            {
                quote = Quote::Double;
            }
            else if (c == '\\' && hasNext)
            {
                word.push_back(line[++i]);
            }
            else
            {
                word.push_back(c);
            }
            break;
        }
    }

    flush();
    return words;
}

} // namespace symmorph::ui::cli
