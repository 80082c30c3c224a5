#pragma once
#include <stdexcept>
#include <string>
#include <vector>
#include <cstdarg>
#include <cstdio>
#include <random>
#include <sstream> // To build the final string


using str = std::string;
using er = std::runtime_error;

// printf-style message prefixed with "file:line: "
std::string error_msg(const char* file, int line, const char* fmt, ...);

[[noreturn]] void error(const std::string& msg, const char* file, int line, ...);
// A helper macro to automatically pass __FILE__ and __LINE__
#define THROW(msg, ...) error(msg, __FILE__, __LINE__, ##__VA_ARGS__)
// Same as THROW but raises a typed exception (must be constructible from std::string)
#define THROW_AS(type, msg, ...) throw type(error_msg(__FILE__, __LINE__, msg, ##__VA_ARGS__))

class Random {
private:
    std::random_device rd;
    std::mt19937 gen; // Declare the engine
public:
    // Initialize 'gen' in the constructor's initializer list
    Random() : gen(rd()) {}
    explicit Random(unsigned seed) : gen(seed) {}
    ~Random() = default;

    int get(int min, int max) {
        std::uniform_int_distribution<> distrib(min, max);
        return distrib(gen);
    }

    // n random chars in [a-z]
    std::string letters(std::size_t n) {
        std::string out;
        out.reserve(n);
        for (std::size_t i = 0; i < n; ++i) out += static_cast<char>('a' + get(0, 25));
        return out;
    }
};

std::string trim(const std::string& s);
std::string lower(std::string s);
