// src/io/scripted_input.cpp
#include "scripted_input.h"
#include <algorithm>
#include <stdexcept>

namespace Pachislo {

ScriptedInput::ScriptedInput(size_t batch_size) : batch_size_(batch_size), remaining_(0) {
    if (batch_size_ == 0) {
        throw std::invalid_argument("ScriptedInput batch size must be positive");
    }
}

ScriptedInput& ScriptedInput::Add(Command command, int count) {
    if (count < 0) {
        throw std::invalid_argument("ScriptedInput command count cannot be negative");
    }
    if (count == 0) {
        return *this;
    }

    // 相邻的相同命令合并为一步
    if (!steps_.empty() && steps_.back().command == command) {
        steps_.back().count += count;
    } else {
        steps_.push_back(Step{command, count});
    }
    remaining_ += count;
    return *this;
}

ScriptedInput ScriptedInput::ForSession(int launches, size_t batch_size) {
    ScriptedInput input(batch_size);
    input.Add(Command::START_GAME)
         .Add(Command::LAUNCH_BALL, launches)
         .Add(Command::FINISH_GAME);
    return input;
}

std::vector<Command> ScriptedInput::WaitForInput() {
    std::vector<Command> commands;
    commands.reserve(static_cast<size_t>(std::min<long long>(remaining_, batch_size_)));

    while (!steps_.empty() && commands.size() < batch_size_) {
        Step& step = steps_.front();
        long long take = std::min<long long>(step.count,
            static_cast<long long>(batch_size_ - commands.size()));
        commands.insert(commands.end(), static_cast<size_t>(take), step.command);

        step.count -= take;
        remaining_ -= take;
        if (step.count == 0) {
            steps_.pop_front();
        }
    }

    return commands;
}

} // namespace Pachislo
