#include "prompt.hpp"
#include <core/constants.hpp>
#include <platform/platform.hpp>
#include <platform/terminal.hpp>
#include <iostream>

std::optional<std::string> collect_line(const std::function<bool(char&)>& next_byte) {
    std::string value;
    char c;
    while (next_byte(c)) {
        if (c == '\n' || c == '\r') return value;
        if (c == 127 || c == 8) {  // backspace
            if (!value.empty()) value.pop_back();
            continue;
        }
        if (static_cast<unsigned char>(c) >= 32) value += c;
    }
    return std::nullopt;
}

std::string read_hidden(const std::string& prompt) {
    std::cerr << prompt;
    std::cerr.flush();

    if (!platform::stdin_is_tty()) {
        std::string value;
        std::getline(std::cin, value);
        if (!value.empty() && value.back() == '\r') value.pop_back();
        return value;
    }

    std::optional<std::string> line;
    {
        platform::NoEchoGuard guard;
        line = collect_line([](char& c) {
            return platform::poll_stdin(PROMPT_TIMEOUT_MS) && platform::read_stdin_byte(c);
        });
    }

    std::cerr << "\n";
    return line.value_or("");
}
