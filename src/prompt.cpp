#include "prompt.hpp"
#include "lib.hpp"

bool is_yes(const std::string& answer) {
    return lower(trim(answer)) == "y";
}

bool StreamPrompt::confirm(const std::string& question) {
    out_ << question << ' ' << std::flush;
    std::string line;
    if (!std::getline(in_, line)) {
        in_.clear();
        out_ << std::endl;
        return false;
    }
    return is_yes(line);
}
