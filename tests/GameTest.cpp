#include <gtest/gtest.h>

#include <sstream>

#include "Game.hpp"
#include "GameController.hpp"
#include "TestSupport.hpp"

using testsupport::settingsFor;
using testsupport::waitFor;

namespace {
GameSettings humanVsHuman() {
	GameSettings settings = settingsFor(15);
	settings.blackType = GameSettings::PlayerType::Human;
	settings.whiteType = GameSettings::PlayerType::Human;
	return settings;
}

GameSettings humanVsAi(int delayMs) {
	GameSettings settings = settingsFor(15);
	settings.blackType = GameSettings::PlayerType::Human;
	settings.whiteType = GameSettings::PlayerType::AI;
	settings.whiteDifficulty = GameSettings::Difficulty::Normal;
	settings.aiMoveDelayMs = delayMs;
	return settings;
}
}  // namespace

class GameTest : public ::testing::Test {
protected:
	GameTest() : logger(sink, Logger::Level::Debug, false) {
		for (GameEvent::Type type : { GameEvent::Type::MoveApplied, GameEvent::Type::MoveRejected,
				 GameEvent::Type::MoveUndone, GameEvent::Type::GameWon, GameEvent::Type::GameStopped,
				 GameEvent::Type::AiThinkingStarted, GameEvent::Type::AiThinkingAborted,
				 GameEvent::Type::HintGenerated, GameEvent::Type::GamePaused, GameEvent::Type::GameResumed }) {
			events.subscribe(type, [this](const GameEvent& event) {
				received.push_back(event);
			});
		}
	}

	int countOf(GameEvent::Type type) const {
		int count = 0;
		for (const GameEvent& event : received) {
			if (event.type == type) {
				++count;
			}
		}
		return count;
	}

	std::ostringstream sink;
	Logger logger;
	EventBus events;
	std::vector<GameEvent> received;
};

TEST_F(GameTest, HumanMoveAppliedOnTick) {
	Game game(humanVsHuman(), logger, events);
	EXPECT_EQ(game.getSettings().mode(), GameSettings::Mode::PvP);
	ASSERT_TRUE(game.submitHumanMove(Move(7, 7)));
	EXPECT_TRUE(game.getState().board.isEmpty(7, 7));
	game.tick();
	EXPECT_EQ(game.getState().board.at(7, 7), Board::Cell::Black);
	EXPECT_EQ(game.getState().toMove, PlayerColor::White);
	EXPECT_EQ(countOf(GameEvent::Type::MoveApplied), 1);
	EXPECT_NE(sink.str().find("played at"), std::string::npos);
}

TEST_F(GameTest, RejectsOccupiedAndForbiddenMoves) {
	Game game(humanVsHuman(), logger, events);
	ASSERT_TRUE(game.tryApplyMove(Move(11, 11)));
	std::string reason;
	EXPECT_FALSE(game.tryApplyMove(Move(11, 11), &reason));
	EXPECT_EQ(reason, "occupied");
	EXPECT_EQ(countOf(GameEvent::Type::MoveRejected), 1);
	EXPECT_NE(game.getState().lastMessage.find("occupied"), std::string::npos);

	const Move setup[] = { Move(0, 0), Move(5, 5), Move(0, 2), Move(5, 6), Move(0, 4), Move(3, 7), Move(0, 6),
		Move(4, 7), Move(0, 8) };
	for (const Move& move : setup) {
		ASSERT_TRUE(game.tryApplyMove(move)) << move.toString();
	}
	ASSERT_EQ(game.getState().toMove, PlayerColor::Black);
	EXPECT_FALSE(game.tryApplyMove(Move(5, 7), &reason));
	EXPECT_EQ(reason, "forbidden double-three");
	EXPECT_EQ(game.getState().toMove, PlayerColor::Black);
	EXPECT_TRUE(game.getState().validateState().empty());
}

TEST_F(GameTest, FiveInARowEndsTheGame) {
	Game game(humanVsHuman(), logger, events);
	const Move moves[] = { Move(3, 7), Move(0, 0), Move(4, 7), Move(0, 2), Move(5, 7), Move(0, 4), Move(6, 7),
		Move(0, 6), Move(7, 7) };
	for (const Move& move : moves) {
		ASSERT_TRUE(game.tryApplyMove(move)) << move.toString();
	}
	const GameState& state = game.getState();
	EXPECT_EQ(state.status, GameState::Status::BlackWon);
	EXPECT_EQ(state.winningLine.size(), 5u);
	ASSERT_EQ(countOf(GameEvent::Type::GameWon), 1);
	for (const GameEvent& event : received) {
		if (event.type == GameEvent::Type::GameWon) {
			EXPECT_EQ(event.player, PlayerColor::Black);
			EXPECT_EQ(event.line, state.winningLine);
		}
	}
	EXPECT_FALSE(game.tryApplyMove(Move(10, 10)));
	EXPECT_FALSE(game.submitHumanMove(Move(10, 10)));
}

TEST_F(GameTest, AiAnswersHumanMove) {
	Game game(humanVsAi(0), logger, events);
	ASSERT_TRUE(game.submitHumanMove(Move(7, 7)));
	ASSERT_TRUE(waitFor([&game]() { return game.getHistory().size() == 2; }, 30000, [&game]() { game.tick(); }));
	EXPECT_EQ(game.getState().toMove, PlayerColor::Black);
	EXPECT_EQ(countOf(GameEvent::Type::AiThinkingStarted), 1);
	EXPECT_EQ(game.getHistory().all().back().player, PlayerColor::White);
	EXPECT_TRUE(game.getState().validateState().empty());
}

TEST_F(GameTest, HumanCannotMoveForTheAi) {
	GameSettings settings = humanVsAi(10000);
	Game game(settings, logger, events);
	ASSERT_TRUE(game.submitHumanMove(Move(7, 7)));
	game.tick();
	std::string reason;
	EXPECT_FALSE(game.submitHumanMove(Move(8, 8), &reason));
	EXPECT_EQ(reason, "AI is to move");
	EXPECT_TRUE(game.isAiTurn());
}

TEST_F(GameTest, UndoTakesBackBothPliesAgainstAi) {
	Game game(humanVsAi(0), logger, events);
	game.submitHumanMove(Move(7, 7));
	ASSERT_TRUE(waitFor([&game]() { return game.getHistory().size() == 2; }, 30000, [&game]() { game.tick(); }));

	EXPECT_EQ(game.undo(), 2);
	EXPECT_TRUE(game.getHistory().empty());
	EXPECT_EQ(game.getState().toMove, PlayerColor::Black);
	EXPECT_EQ(game.getState().board.countStones(), 0);
	EXPECT_EQ(countOf(GameEvent::Type::MoveUndone), 2);
	EXPECT_EQ(game.undo(), 0);
}

TEST_F(GameTest, UndoCancelsThinkingAi) {
	Game game(humanVsAi(10000), logger, events);
	game.submitHumanMove(Move(7, 7));
	game.tick();
	game.tick();
	ASSERT_TRUE(game.isAiThinking());

	EXPECT_EQ(game.undo(), 1);
	EXPECT_FALSE(game.isAiThinking());
	EXPECT_TRUE(game.getHistory().empty());
	EXPECT_EQ(countOf(GameEvent::Type::AiThinkingAborted), 1);
	EXPECT_EQ(game.aiProgress(), 0);
}

TEST_F(GameTest, UndoInPvpTakesOnePly) {
	Game game(humanVsHuman(), logger, events);
	game.tryApplyMove(Move(7, 7));
	game.tryApplyMove(Move(8, 8));
	EXPECT_EQ(game.undo(), 1);
	EXPECT_EQ(game.getHistory().size(), 1u);
	EXPECT_EQ(game.getState().toMove, PlayerColor::White);
}

TEST_F(GameTest, HintSuggestsCentreThenAnEmptyCell) {
	Game game(humanVsHuman(), logger, events);
	Move hint;
	ASSERT_TRUE(game.hint(hint));
	EXPECT_EQ(hint, Move(7, 7));
	EXPECT_TRUE(game.hasHint());
	EXPECT_EQ(countOf(GameEvent::Type::HintGenerated), 1);

	const Move moves[] = { Move(3, 7), Move(2, 7), Move(4, 7), Move(12, 12), Move(5, 7), Move(12, 2), Move(6, 7) };
	for (const Move& move : moves) {
		ASSERT_TRUE(game.tryApplyMove(move));
	}
	EXPECT_FALSE(game.hasHint());
	ASSERT_TRUE(game.hint(hint));
	EXPECT_TRUE(game.getState().board.isEmpty(hint.x, hint.y));
	EXPECT_EQ(game.getHint(), hint);
}

TEST_F(GameTest, StopEndsTheGame) {
	Game game(humanVsAi(10000), logger, events);
	game.submitHumanMove(Move(7, 7));
	game.tick();
	game.tick();
	game.stop();
	EXPECT_EQ(game.getState().status, GameState::Status::Stopped);
	EXPECT_FALSE(game.isAiThinking());
	EXPECT_EQ(countOf(GameEvent::Type::GameStopped), 1);
	Move hint;
	EXPECT_FALSE(game.hint(hint));
	game.stop();
	EXPECT_EQ(countOf(GameEvent::Type::GameStopped), 1);
}

TEST_F(GameTest, PauseCancelsThinkingAndResumeRestartsIt) {
	Game game(humanVsAi(10000), logger, events);
	game.submitHumanMove(Move(7, 7));
	game.tick();
	game.tick();
	ASSERT_TRUE(game.isAiThinking());

	EXPECT_TRUE(game.pause());
	EXPECT_EQ(game.getState().status, GameState::Status::Paused);
	EXPECT_FALSE(game.isAiThinking());
	EXPECT_EQ(countOf(GameEvent::Type::AiThinkingAborted), 1);
	EXPECT_EQ(countOf(GameEvent::Type::GamePaused), 1);
	EXPECT_FALSE(game.pause());

	game.tick();
	EXPECT_FALSE(game.isAiThinking());
	std::string reason;
	EXPECT_FALSE(game.submitHumanMove(Move(8, 8), &reason));
	EXPECT_EQ(reason, "game is paused");
	EXPECT_FALSE(game.tryApplyMove(Move(8, 8), &reason));
	EXPECT_EQ(reason, "game is paused");
	EXPECT_EQ(game.undo(), 0);
	EXPECT_EQ(game.getHistory().size(), 1u);

	EXPECT_TRUE(game.resume());
	EXPECT_EQ(game.getState().status, GameState::Status::Playing);
	EXPECT_EQ(countOf(GameEvent::Type::GameResumed), 1);
	EXPECT_TRUE(game.isAiThinking());
	EXPECT_EQ(countOf(GameEvent::Type::AiThinkingStarted), 2);
	EXPECT_FALSE(game.resume());
}

TEST_F(GameTest, FinishedGameCannotBePaused) {
	Game game(humanVsHuman(), logger, events);
	EXPECT_FALSE(game.resume());
	game.stop();
	EXPECT_FALSE(game.pause());
	EXPECT_EQ(game.getState().status, GameState::Status::Stopped);
	EXPECT_EQ(countOf(GameEvent::Type::GamePaused), 0);
}

TEST_F(GameTest, NewGameResetsState) {
	Game game(humanVsHuman(), logger, events);
	game.tryApplyMove(Move(7, 7));
	GameSettings small = humanVsHuman();
	small.boardSize = 9;
	game.newGame(small);
	EXPECT_TRUE(game.getHistory().empty());
	EXPECT_EQ(game.getState().board.getSize(), 9);
	EXPECT_EQ(game.getState().status, GameState::Status::Ready);
	EXPECT_EQ(game.getRules().getBoardSize(), 9);
}

TEST_F(GameTest, AiSelfPlayReachesAConsistentEnd) {
	GameSettings settings = settingsFor(9, false);
	settings.blackType = GameSettings::PlayerType::AI;
	settings.whiteType = GameSettings::PlayerType::AI;
	settings.blackDifficulty = GameSettings::Difficulty::Beginner;
	settings.whiteDifficulty = GameSettings::Difficulty::Beginner;
	Game game(settings, logger, events);
	EXPECT_EQ(settings.mode(), GameSettings::Mode::EvE);
	ASSERT_TRUE(waitFor([&game]() { return game.getState().isFinished(); }, 60000, [&game]() { game.tick(); }));
	const GameState& state = game.getState();
	EXPECT_NE(state.status, GameState::Status::Stopped);
	EXPECT_EQ(state.board.countStones(), static_cast<int>(state.getHistory().size()));
	EXPECT_TRUE(state.validateState().empty());
}

TEST_F(GameTest, ControllerReportsStatus) {
	GameController controller(humanVsHuman(), logger, events);
	EXPECT_NE(controller.statusText().find("black to move"), std::string::npos);
	controller.onCellClicked(7, 7);
	controller.tick();
	EXPECT_EQ(controller.history().size(), 1u);
	controller.onHint();
	EXPECT_TRUE(controller.hasHint());
	controller.onUndo();
	EXPECT_TRUE(controller.history().empty());
	controller.onTogglePause();
	EXPECT_NE(controller.statusText().find("paused"), std::string::npos);
	controller.onTogglePause();
	EXPECT_NE(controller.statusText().find("black to move"), std::string::npos);
	controller.onStop();
	EXPECT_NE(controller.statusText().find("stopped"), std::string::npos);
	controller.onNewGame();
	EXPECT_EQ(controller.state().status, GameState::Status::Ready);
}
