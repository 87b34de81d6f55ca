#include <gtest/gtest.h>

#include "core/config.h"
#include "core/game.h"
#include "io/scripted_input.h"
#include "capture_log_sink.h"
#include "recording_output.h"
#include "test_configs.h"

#include <limits>
#include <memory>
#include <set>

using namespace Pachislo;

namespace {

struct GameHarness {
    RecordingOutput* output = nullptr;
    std::unique_ptr<Game> game;
};

GameHarness MakeGame(const Config& config,
                     std::unique_ptr<RandomSource> lottery_rng,
                     std::unique_ptr<GameInput> input = std::make_unique<ScriptedInput>()) {
    GameHarness harness;
    auto output = std::make_unique<RecordingOutput>();
    harness.output = output.get();
    harness.game = std::make_unique<Game>(config, std::move(input), std::move(output),
                                          std::move(lottery_rng),
                                          std::make_unique<Mt19937RandomSource>(99));
    return harness;
}

GameHarness MakeScriptedGame(const Config& config, std::vector<double> lottery_values) {
    return MakeGame(config, std::make_unique<ScriptedRandomSource>(std::move(lottery_values)));
}

} // namespace

class GameTest : public ::testing::Test {
protected:
    ScopedLogCapture log_;
};

TEST_F(GameTest, LaunchBeforeStartIsInvalid) {
    auto harness = MakeScriptedGame(DeterministicConfig(), {0.5});
    Game& game = *harness.game;

    EXPECT_EQ(game.LaunchBall(), CommandStatus::INVALID_COMMAND);
    EXPECT_TRUE(game.GetState().IsUninitialized());
    EXPECT_TRUE(harness.output->transitions.empty());

    ASSERT_EQ(harness.output->rejections.size(), 1u);
    EXPECT_EQ(harness.output->rejections[0].command, Command::LAUNCH_BALL);
    EXPECT_EQ(harness.output->rejections[0].status, CommandStatus::INVALID_COMMAND);
    EXPECT_TRUE(log_.sink.Contains(LogLevel::WARNING, "Game"));
}

TEST_F(GameTest, StartTwiceIsInvalid) {
    auto harness = MakeScriptedGame(DeterministicConfig(), {0.5});
    Game& game = *harness.game;

    EXPECT_EQ(game.Start(), CommandStatus::OK);
    EXPECT_EQ(game.GetState(), GameState::Normal(10));

    EXPECT_EQ(game.Start(), CommandStatus::INVALID_COMMAND);
    EXPECT_EQ(game.GetState(), GameState::Normal(10));
    EXPECT_EQ(harness.output->transitions.size(), 1u);
}

TEST_F(GameTest, StartEmitsTransitionFromUninitialized) {
    auto harness = MakeScriptedGame(DeterministicConfig(), {0.5});
    harness.game->Start();

    ASSERT_EQ(harness.output->transitions.size(), 1u);
    const auto& transition = harness.output->transitions[0];
    ASSERT_TRUE(transition.before.has_value());
    EXPECT_TRUE(transition.before->IsUninitialized());
    EXPECT_EQ(transition.after, GameState::Normal(10));
}

TEST_F(GameTest, NormalWinEntersRush) {
    auto harness = MakeScriptedGame(DeterministicConfig(), {0.5});
    Game& game = *harness.game;
    game.Start();

    EXPECT_EQ(game.LaunchBall(), CommandStatus::OK);
    // 10 - 1 + 15
    EXPECT_EQ(game.GetState(), GameState::Rush(24, 1));
    ASSERT_TRUE(game.GetBeforeState().has_value());
    EXPECT_EQ(*game.GetBeforeState(), GameState::Normal(10));

    ASSERT_EQ(harness.output->normal.size(), 1u);
    const auto& report = harness.output->normal[0];
    EXPECT_TRUE(report.reached_start_hole);
    EXPECT_TRUE(report.result.IsWin());
    ASSERT_TRUE(report.slot.has_value());
    EXPECT_TRUE(report.slot->matched);
    EXPECT_EQ(report.slot->symbols.size(), 3u);
    EXPECT_FALSE(report.reveal.has_value());
}

TEST_F(GameTest, RushContinueProbabilityDecays) {
    // 每次抽选都是0.3：继续概率 0.8, 0.48, 0.288
    auto harness = MakeScriptedGame(DeterministicConfig(), {0.3});
    Game& game = *harness.game;
    game.Start();
    game.LaunchBall();
    ASSERT_EQ(game.GetState(), GameState::Rush(24, 1));

    game.LaunchBall();
    EXPECT_EQ(game.GetState(), GameState::Rush(323, 2));
    game.LaunchBall();
    EXPECT_EQ(game.GetState(), GameState::Rush(622, 3));
    game.LaunchBall();
    EXPECT_EQ(game.GetState(), GameState::Normal(921));

    EXPECT_EQ(harness.output->rush.size(), 3u);
    ASSERT_EQ(harness.output->rush_continue.size(), 3u);
    EXPECT_TRUE(harness.output->rush_continue[0].result.IsWin());
    EXPECT_TRUE(harness.output->rush_continue[1].result.IsWin());
    EXPECT_FALSE(harness.output->rush_continue[2].result.IsWin());
}

TEST_F(GameTest, RushLoseReturnsToNormal) {
    Config config = DeterministicConfig();
    config.probability.rush = SlotProbability(0.0, 0.0, 0.0);
    auto harness = MakeScriptedGame(config, {0.5});
    Game& game = *harness.game;
    game.Start();
    game.LaunchBall();
    ASSERT_EQ(game.GetState(), GameState::Rush(24, 1));

    game.LaunchBall();
    EXPECT_EQ(game.GetState(), GameState::Normal(23));
    EXPECT_EQ(harness.output->rush.size(), 1u);
    // RUSH未中奖时不进行继续抽选
    EXPECT_TRUE(harness.output->rush_continue.empty());
}

TEST_F(GameTest, MissedStartHoleOnlyConsumesBall) {
    Config config = DeterministicConfig();
    config.probability.start_hole = 0.0;
    auto harness = MakeScriptedGame(config, {0.5});
    Game& game = *harness.game;
    game.Start();

    EXPECT_EQ(game.LaunchBall(), CommandStatus::OK);
    EXPECT_EQ(game.GetState(), GameState::Normal(9));

    ASSERT_EQ(harness.output->normal.size(), 1u);
    const auto& report = harness.output->normal[0];
    EXPECT_FALSE(report.reached_start_hole);
    EXPECT_FALSE(report.result.IsWin());
    EXPECT_FALSE(report.result.is_fake);
    EXPECT_FALSE(report.slot.has_value());
}

TEST_F(GameTest, FakeResultDoesNotChangeState) {
    Config config = DeterministicConfig();
    config.probability.normal = SlotProbability(1.0, 1.0, 0.0);
    auto harness = MakeScriptedGame(config, {0.5});
    Game& game = *harness.game;
    game.Start();
    game.LaunchBall();

    EXPECT_EQ(game.GetState(), GameState::Rush(24, 1));
    ASSERT_EQ(harness.output->normal.size(), 1u);
    const auto& report = harness.output->normal[0];
    EXPECT_TRUE(report.result.is_fake);
    EXPECT_FALSE(report.result.IsDisplayedWin());
    ASSERT_TRUE(report.slot.has_value());
    EXPECT_FALSE(report.slot->matched);
    ASSERT_TRUE(report.reveal.has_value());
    EXPECT_TRUE(report.reveal->matched);
}

TEST_F(GameTest, FakeProbabilitiesDoNotAffectTrajectory) {
    Config plain = ConfigManager::ExampleConfig();
    plain.balls = BallsConfig(50, 15, 300);
    plain.probability.start_hole = 0.5;
    plain.probability.normal = SlotProbability(0.2, 0.0, 0.0);
    plain.probability.rush = SlotProbability(0.5, 0.0, 0.0);
    plain.probability.rush_continue = SlotProbability(0.8, 0.0, 0.0);

    Config faked = plain;
    faked.probability.normal = SlotProbability(0.2, 0.4, 0.3);
    faked.probability.rush = SlotProbability(0.5, 0.5, 0.5);
    faked.probability.rush_continue = SlotProbability(0.8, 0.9, 0.2);

    auto first = MakeGame(plain, std::make_unique<Mt19937RandomSource>(7));
    auto second = MakeGame(faked, std::make_unique<Mt19937RandomSource>(7));

    for (auto* harness : {&first, &second}) {
        harness->game->Start();
        for (int i = 0; i < 2000; ++i) {
            harness->game->LaunchBall();
        }
    }

    EXPECT_EQ(first.output->Trajectory(), second.output->Trajectory());
    EXPECT_EQ(first.game->GetState(), second.game->GetState());

    size_t fakes = 0;
    for (const auto& report : second.output->lotteries) {
        fakes += report.result.is_fake ? 1 : 0;
    }
    EXPECT_GT(fakes, 0u);
}

TEST_F(GameTest, NoBallsIsInsufficient) {
    Config config = DeterministicConfig();
    config.balls = BallsConfig(0, 15, 300);
    auto harness = MakeScriptedGame(config, {0.5});
    Game& game = *harness.game;
    game.Start();

    EXPECT_EQ(game.LaunchBall(), CommandStatus::INSUFFICIENT_BALLS);
    EXPECT_EQ(game.GetState(), GameState::Normal(0));
    EXPECT_EQ(harness.output->transitions.size(), 1u);
    EXPECT_TRUE(harness.output->lotteries.empty());

    ASSERT_EQ(harness.output->rejections.size(), 1u);
    EXPECT_EQ(harness.output->rejections[0].status, CommandStatus::INSUFFICIENT_BALLS);
    EXPECT_EQ(harness.output->rejections[0].state, GameState::Normal(0));

    // 球数不足只记录DEBUG日志
    EXPECT_TRUE(log_.sink.Contains(LogLevel::DEBUG, "Game"));
    EXPECT_FALSE(log_.sink.Contains(LogLevel::WARNING, "Game"));
}

TEST_F(GameTest, LastBallCanStillWin) {
    Config config = DeterministicConfig();
    config.balls = BallsConfig(1, 15, 300);
    auto harness = MakeScriptedGame(config, {0.5});
    Game& game = *harness.game;
    game.Start();

    EXPECT_EQ(game.LaunchBall(), CommandStatus::OK);
    EXPECT_EQ(game.GetState(), GameState::Rush(15, 1));
}

TEST_F(GameTest, WinAtMaximumBallsDoesNotOverflow) {
    const int max_balls = std::numeric_limits<int>::max();
    Config config = DeterministicConfig();
    config.balls = BallsConfig(max_balls, 15, 300);
    auto harness = MakeScriptedGame(config, {0.5});
    Game& game = *harness.game;
    game.Start();

    EXPECT_EQ(game.LaunchBall(), CommandStatus::OK);
    EXPECT_EQ(game.GetState(), GameState::Rush(max_balls, 1));

    // RUSH中奖且继续
    EXPECT_EQ(game.LaunchBall(), CommandStatus::OK);
    EXPECT_EQ(game.GetState(), GameState::Rush(max_balls, 2));
    for (const auto& state : harness.output->Trajectory()) {
        EXPECT_GE(state.GetBalls(), 0);
    }
}

TEST_F(GameTest, FinishIsIdempotent) {
    auto harness = MakeScriptedGame(DeterministicConfig(), {0.5});
    Game& game = *harness.game;
    game.Start();

    EXPECT_EQ(game.Finish(), CommandStatus::OK);
    EXPECT_EQ(game.Finish(), CommandStatus::OK);
    EXPECT_TRUE(game.IsFinished());

    ASSERT_EQ(harness.output->finishes.size(), 2u);
    EXPECT_EQ(harness.output->finishes[0], GameState::Normal(10));
    EXPECT_EQ(harness.output->finishes[1], GameState::Normal(10));

    EXPECT_EQ(game.LaunchBall(), CommandStatus::INVALID_COMMAND);
    EXPECT_EQ(game.Start(), CommandStatus::INVALID_COMMAND);
    EXPECT_EQ(game.GetState(), GameState::Normal(10));
}

TEST_F(GameTest, FinishBeforeStart) {
    auto harness = MakeScriptedGame(DeterministicConfig(), {0.5});
    EXPECT_EQ(harness.game->Finish(), CommandStatus::OK);
    ASSERT_EQ(harness.output->finishes.size(), 1u);
    EXPECT_TRUE(harness.output->finishes[0].IsUninitialized());
}

TEST_F(GameTest, RunExecutesScriptedSession) {
    Config config = DeterministicConfig();
    config.probability.rush = SlotProbability(0.0, 0.0, 0.0);

    auto input = std::make_unique<ScriptedInput>(2);
    input->Add(Command::START_GAME).Add(Command::LAUNCH_BALL, 3).Add(Command::FINISH_GAME)
         .Add(Command::LAUNCH_BALL, 5);

    auto harness = MakeGame(config, std::make_unique<ScriptedRandomSource>(std::vector<double>{0.5}),
                            std::move(input));
    harness.game->Run();

    // Normal{10} -> Rush{24,1} -> Normal{23} -> Rush{37,1}，结束后的命令被丢弃
    EXPECT_TRUE(harness.game->IsFinished());
    EXPECT_EQ(harness.game->GetState(), GameState::Rush(37, 1));

    std::vector<GameState> expected = {
        GameState::Normal(10), GameState::Rush(24, 1),
        GameState::Normal(23), GameState::Rush(37, 1),
    };
    EXPECT_EQ(harness.output->Trajectory(), expected);
    ASSERT_EQ(harness.output->finishes.size(), 1u);
    EXPECT_TRUE(harness.output->rejections.empty());
}

TEST_F(GameTest, RunFinishesWhenInputCloses) {
    auto input = std::make_unique<ScriptedInput>();
    input->Add(Command::START_GAME).Add(Command::LAUNCH_BALL, 2);

    auto harness = MakeGame(DeterministicConfig(),
                            std::make_unique<ScriptedRandomSource>(std::vector<double>{0.5}),
                            std::move(input));
    harness.game->Run();

    EXPECT_TRUE(harness.game->IsFinished());
    ASSERT_EQ(harness.output->finishes.size(), 1u);
    EXPECT_EQ(harness.output->finishes[0], harness.game->GetState());
}

TEST_F(GameTest, BallsNeverNegativeAndRushCountPositive) {
    Config config = ConfigManager::ExampleConfig();
    config.balls = BallsConfig(20, 15, 300);

    auto harness = MakeGame(config, std::make_unique<Mt19937RandomSource>(11));
    Game& game = *harness.game;
    game.Start();
    for (int i = 0; i < 20000; ++i) {
        game.LaunchBall();
    }

    for (const auto& state : harness.output->Trajectory()) {
        EXPECT_GE(state.GetBalls(), 0);
        if (state.IsRush()) {
            EXPECT_GE(state.GetRushCount(), 1);
        }
    }
}

TEST_F(GameTest, InvalidConfigIsRejectedAtConstruction) {
    Config config = DeterministicConfig();
    config.probability.normal.win = 1.5;
    EXPECT_THROW(MakeScriptedGame(config, {0.5}), ConfigError);

    Config single_symbol = DeterministicConfig();
    single_symbol.slot.symbols = {3};
    EXPECT_THROW(MakeScriptedGame(single_symbol, {0.5}), ConfigError);
}

TEST_F(GameTest, NullCollaboratorsThrow) {
    Config config = DeterministicConfig();
    EXPECT_THROW(Game(config, nullptr, std::make_unique<RecordingOutput>()),
                 std::invalid_argument);
    EXPECT_THROW(Game(config, std::make_unique<ScriptedInput>(), std::make_unique<RecordingOutput>(),
                      nullptr, std::make_unique<Mt19937RandomSource>(1)),
                 std::invalid_argument);
}
