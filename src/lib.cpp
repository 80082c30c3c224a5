#include "lib.hpp"
#include <algorithm>
#include <cctype>

namespace {

    // Two-pass vsnprintf: size first, then write.
    std::string vformat(const char* fmt, va_list args) {
        va_list args_copy;
        va_copy(args_copy, args); // Make a copy for the second pass
        int required_size = std::vsnprintf(nullptr, 0, fmt, args_copy);
        va_end(args_copy); // Clean up the copy

        // Check for an error during sizing.
        if (required_size < 0) {
            throw std::runtime_error("Error: Failed to determine required buffer size.");
        }

        // Allocate a buffer of the exact size needed, plus one for the null terminator.
        std::vector<char> buffer(required_size + 1);
        std::vsnprintf(buffer.data(), buffer.size(), fmt, args);
        return std::string(buffer.data(), required_size);
    }

    std::string with_location(const char* file, int line, const std::string& text) {
        std::stringstream ss;
        ss << file << ":" << line << ": " << text;
        return ss.str();
    }
}

std::string error_msg(const char* file, int line, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    std::string text = vformat(fmt, args);
    va_end(args);
    return with_location(file, line, text);
}

// A safe variadic function for throwing exceptions.
// It includes the file and line number of the call site.
void error(const std::string& msg, const char* file, int line, ...) {
    // va_list is used to iterate through the variable arguments.
    va_list args;
    va_start(args, line);
    std::string text = vformat(msg.c_str(), args);
    va_end(args);

    // Throw the exception with the correctly formatted message.
    throw std::runtime_error(with_location(file, line, text));
}

std::string trim(const std::string& s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    auto b = std::find_if(s.begin(), s.end(), not_space);
    auto e = std::find_if(s.rbegin(), s.rend(), not_space).base();
    return b < e ? std::string(b, e) : std::string {};
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}
