#include "core/modules/ShellCommand.hpp"

#include <algorithm>
#include <cctype>

namespace hostkeeper::core {

namespace {

bool isSafeChar(char c) {
    if (std::isalnum(static_cast<unsigned char>(c))) {
        return true;
    }
    switch (c) {
    case '-':
    case '_':
    case '.':
    case '/':
    case ':':
    case '=':
    case '@':
    case '%':
    case '+':
    case ',':
        return true;
    default:
        return false;
    }
}

} // namespace

ShellCommand::ShellCommand(std::initializer_list<std::string> arguments) {
    for (const auto& arg : arguments) {
        argument(arg);
    }
}

ShellCommand& ShellCommand::argument(const std::string& arg) {
    segments_.back().push_back(arg);
    return *this;
}

ShellCommand& ShellCommand::arguments(const std::vector<std::string>& args) {
    for (const auto& arg : args) {
        argument(arg);
    }
    return *this;
}

ShellCommand& ShellCommand::useSudoIf(bool condition) {
    sudo_ = sudo_ || condition;
    return *this;
}

ShellCommand& ShellCommand::pipeTo(const ShellCommand& next) {
    for (const auto& segment : next.segments_) {
        if (!segment.empty()) {
            segments_.push_back(segment);
        }
    }
    return *this;
}

std::string ShellCommand::toString() const {
    std::string result;
    bool firstSegment = true;
    for (const auto& segment : segments_) {
        if (segment.empty()) {
            continue;
        }
        if (!firstSegment) {
            result += " | ";
        } else if (sudo_) {
            result += "sudo ";
        }
        for (size_t i = 0; i < segment.size(); ++i) {
            if (i > 0) {
                result += ' ';
            }
            result += quote(segment[i]);
        }
        firstSegment = false;
    }
    return result;
}

std::string ShellCommand::quote(const std::string& arg) {
    if (arg.empty()) {
        return "''";
    }
    if (std::all_of(arg.begin(), arg.end(), isSafeChar)) {
        return arg;
    }

    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += '\'';
    return quoted;
}

} // namespace hostkeeper::core
