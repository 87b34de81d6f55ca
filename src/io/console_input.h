// src/io/console_input.h
#pragma once

#include "../core/game_interface.h"
#include <istream>

namespace Pachislo {

// 从终端读取命令：s=开始，l或回车=发射，q=结束
class ConsoleInput : public GameInput {
public:
    explicit ConsoleInput(std::istream& in);

    std::vector<Command> WaitForInput() override;
    bool IsActive() const override { return active_; }

    static std::vector<Command> ParseLine(const std::string& line);

private:
    std::istream& in_;
    bool active_;
};

} // namespace Pachislo
