#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace onova {

// POSIX shell single-quote form of one word.
std::string ShellQuote(std::string_view s);

// Shell-quoted rendition of argv, for logs and for tools that take one string.
std::string JoinCommandLine(const std::vector<std::string>& argv);

// Splits a command line into words using POSIX shell quoting rules (single
// quotes, double quotes, backslash escapes). No expansion of any kind is done.
std::expected<std::vector<std::string>, std::string> SplitCommandLine(std::string_view line);

} // namespace onova
