#include <strata/prompt.hpp>
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <iostream>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace strata {

std::optional<bool> TerminalPrompter::confirm(const std::string& message, bool default_answer) {
    if (!interactive_ || !isatty(fileno(stdin))) return std::nullopt;

    std::fprintf(stderr, "%s %s ", message.c_str(), default_answer ? "[Y/n]" : "[y/N]");
    std::fflush(stderr);

    std::string line;
    if (!std::getline(std::cin, line)) return std::nullopt;

    line.erase(std::remove_if(line.begin(), line.end(),
        [](unsigned char c) { return std::isspace(c); }), line.end());
    std::transform(line.begin(), line.end(), line.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (line.empty()) return default_answer;
    if (line == "y" || line == "yes") return true;
    if (line == "n" || line == "no") return false;
    return std::nullopt;
}

} // namespace strata
