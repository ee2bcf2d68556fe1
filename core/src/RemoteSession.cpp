#include "scplite/RemoteSession.hpp"

#include <cctype>

namespace scplite {

namespace {

bool isShellSafe(char c) {
    if (std::isalnum(static_cast<unsigned char>(c)))
        return true;
    switch (c) {
    case '-':
    case '_':
    case '.':
    case '/':
    case ':':
    case ',':
    case '+':
    case '@':
    case '%':
    case '=':
        return true;
    default:
        return false;
    }
}

std::string quoteWord(const std::string& word) {
    if (word.empty())
        return "''";
    bool safe = true;
    for (char c : word) {
        if (!isShellSafe(c)) {
            safe = false;
            break;
        }
    }
    if (safe)
        return word;
    std::string out = "'";
    for (char c : word) {
        if (c == '\'')
            out += "'\\''";
        else
            out.push_back(c);
    }
    out.push_back('\'');
    return out;
}

} // namespace

std::string shellJoin(const std::vector<std::string>& argv) {
    std::string out;
    for (std::size_t i = 0; i < argv.size(); ++i) {
        if (i)
            out.push_back(' ');
        out += quoteWord(argv[i]);
    }
    return out;
}

} // namespace scplite
