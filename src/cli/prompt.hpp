#pragma once

#include <functional>
#include <optional>
#include <string>

// Print prompt and read one line without echoing it.
// Falls back to a plain line read when stdin is not a terminal (pipes).
// Returns "" on timeout or end of input; a partly typed line is discarded.
std::string read_hidden(const std::string& prompt);

// Builds a line from next_byte until '\n' or '\r', applying backspace and
// dropping other control characters. nullopt if next_byte stops first.
std::optional<std::string> collect_line(const std::function<bool(char&)>& next_byte);
