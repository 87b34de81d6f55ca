// src/io/console_input.cpp
#include "console_input.h"
#include "../utils/logger.h"
#include <string>

namespace Pachislo {

ConsoleInput::ConsoleInput(std::istream& in) : in_(in), active_(true) {
}

std::vector<Command> ConsoleInput::WaitForInput() {
    std::string line;
    if (!std::getline(in_, line)) {
        LOG_DEBUG("Console input closed", "ConsoleInput");
        active_ = false;
        return {};
    }

    auto commands = ParseLine(line);
    if (commands.empty()) {
        LOG_DEBUG("Ignoring input: '" + line + "'", "ConsoleInput");
    }
    return commands;
}

std::vector<Command> ConsoleInput::ParseLine(const std::string& line) {
    // 去掉首尾空白
    auto begin = line.find_first_not_of(" \t\r\n");
    std::string trimmed = begin == std::string::npos
        ? std::string()
        : line.substr(begin, line.find_last_not_of(" \t\r\n") - begin + 1);

    if (trimmed == "s") {
        return {Command::START_GAME};
    }
    if (trimmed == "l" || trimmed.empty()) {
        return {Command::LAUNCH_BALL};
    }
    if (trimmed == "q") {
        return {Command::FINISH_GAME};
    }
    return {};
}

} // namespace Pachislo
