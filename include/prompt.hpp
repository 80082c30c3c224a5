#pragma once
#include <iostream>
#include <string>

class Prompt {
public:
    virtual ~Prompt() = default;
    // Asks a yes/no question; true only for a "y" answer.
    virtual bool confirm(const std::string& question) = 0;
};

// Question on @p out, answer read as one line from @p in. EOF or a read error means "no".
class StreamPrompt final : public Prompt {
public:
    StreamPrompt(std::istream& in, std::ostream& out) : in_(in), out_(out) { }
    bool confirm(const std::string& question) override;
private:
    std::istream& in_;
    std::ostream& out_;
};

// "y" or "Y", surrounding whitespace ignored
bool is_yes(const std::string& answer);
