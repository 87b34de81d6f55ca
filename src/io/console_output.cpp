// src/io/console_output.cpp
#include "console_output.h"

namespace Pachislo {

ConsoleOutput::ConsoleOutput(std::ostream& out) : out_(out) {
}

void ConsoleOutput::PrintWelcome() {
    out_ << "Welcome to Pachislo!\n"
         << "  s: start game, l or Enter: launch ball, q: quit\n"
         << std::endl;
}

void ConsoleOutput::OnTransition(const Transition& transition) {
    const GameState& state = transition.after;

    if (transition.before && transition.before->IsRush() && state.IsNormal()) {
        out_ << "RUSH finished!, Number of RUSH times: "
             << transition.before->GetRushCount() << "\n";
    } else if (transition.before && transition.before->IsNormal() && state.IsRush()) {
        out_ << "RUSH start!\n";
    }

    out_ << "Current state: " << state.ToString() << "\n" << std::endl;
}

void ConsoleOutput::OnFinish(const GameState& final_state) {
    out_ << "Game finished!\n"
         << "Final state: " << final_state.ToString() << std::endl;
}

void ConsoleOutput::OnLotteryNormal(const LotteryReport& report) {
    if (!report.reached_start_hole) {
        out_ << "The ball missed the start hole." << "\n";
        return;
    }
    PrintLottery("Lottery result", report);
}

void ConsoleOutput::OnLotteryRush(const LotteryReport& report) {
    PrintLottery("Lottery result in rush mode", report);
}

void ConsoleOutput::OnLotteryRushContinue(const LotteryReport& report) {
    PrintLottery("Lottery result in rush continue", report);
}

void ConsoleOutput::OnCommandRejected(Command command, CommandStatus status,
                                      const GameState& state) {
    out_ << ToString(command) << " rejected: " << ToString(status)
         << " (" << state.ToString() << ")" << std::endl;
}

void ConsoleOutput::PrintLottery(const std::string& label, const LotteryReport& report) {
    if (report.slot) {
        out_ << "Slot: " << ToString(*report.slot) << "\n";
    }
    // 假结果：先显示假的转轮，再揭示真实结果
    if (report.reveal) {
        out_ << "But: " << ToString(*report.reveal) << "\n";
    }
    out_ << label << ": " << ToString(report.result.real_outcome) << "\n";
}

} // namespace Pachislo
