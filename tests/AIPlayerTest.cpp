#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <sstream>
#include <thread>

#include "AIPlayer.hpp"
#include "HumanPlayer.hpp"
#include "TestSupport.hpp"

using testsupport::place;
using testsupport::settingsFor;
using testsupport::waitFor;

namespace {
const int kLongDelayMs = 10000;

long long elapsedMs(std::chrono::steady_clock::time_point start) {
	return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
}
}  // namespace

class AIPlayerTest : public ::testing::Test {
protected:
	AIPlayerTest() : logger(sink, Logger::Level::Debug, false), rules(settingsFor(15)), state(settingsFor(15)) {
	}

	std::ostringstream sink;
	Logger logger;
	Rules rules;
	GameState state;
};

TEST_F(AIPlayerTest, CalculatesMoveOnWorker) {
	AIPlayer ai(GameSettings::Difficulty::Normal, 0, logger);
	std::future<SearchResult> future = ai.calculateBestMove(state, rules);
	ASSERT_EQ(future.wait_for(std::chrono::seconds(30)), std::future_status::ready);
	SearchResult result = future.get();
	EXPECT_EQ(result.status, SearchResult::Status::MoveProduced);
	EXPECT_EQ(result.position, Move(7, 7));

	ASSERT_TRUE(waitFor([&ai]() { return ai.hasMoveReady(); }, 5000));
	EXPECT_EQ(ai.getState(), AIPlayer::ThinkingState::MoveProduced);
	SearchResult taken = ai.takeResult();
	EXPECT_EQ(taken.position, Move(7, 7));
	EXPECT_FALSE(ai.hasMoveReady());
	EXPECT_EQ(ai.getState(), AIPlayer::ThinkingState::Idle);
	EXPECT_TRUE(state.board.isEmpty(7, 7));
	EXPECT_NE(sink.str().find("[AI]"), std::string::npos);
}

TEST_F(AIPlayerTest, SecondRequestWhileThinkingFails) {
	AIPlayer ai(GameSettings::Difficulty::Normal, kLongDelayMs, logger);
	std::future<SearchResult> first = ai.calculateBestMove(state, rules);
	EXPECT_TRUE(ai.isThinking());

	std::future<SearchResult> second = ai.calculateBestMove(state, rules);
	ASSERT_EQ(second.wait_for(std::chrono::seconds(0)), std::future_status::ready);
	SearchResult busy = second.get();
	EXPECT_EQ(busy.status, SearchResult::Status::Failed);
	EXPECT_EQ(busy.message, "AI is already thinking");
	EXPECT_TRUE(ai.isThinking());

	ai.stopThinking();
	ASSERT_EQ(first.wait_for(std::chrono::seconds(5)), std::future_status::ready);
	EXPECT_EQ(first.get().status, SearchResult::Status::Aborted);
}

TEST_F(AIPlayerTest, StopInterruptsMoveDelay) {
	place(state, PlayerColor::Black, 7, 7);
	Board before = state.board;
	AIPlayer ai(GameSettings::Difficulty::Hell, kLongDelayMs, logger);
	ai.startThinking(state, rules);
	ASSERT_TRUE(ai.isThinking());

	auto start = std::chrono::steady_clock::now();
	ai.stopThinking();
	EXPECT_LT(elapsedMs(start), 2000);
	EXPECT_EQ(ai.getState(), AIPlayer::ThinkingState::Aborted);
	EXPECT_FALSE(ai.isThinking());
	EXPECT_FALSE(ai.hasMoveReady());
	EXPECT_EQ(state.board, before);
}

TEST_F(AIPlayerTest, StopIsIdempotent) {
	AIPlayer ai(GameSettings::Difficulty::Beginner, 0, logger);
	ai.stopThinking();
	ai.stopThinking();
	EXPECT_EQ(ai.getState(), AIPlayer::ThinkingState::Idle);

	ai.startThinking(state, rules);
	ai.stopThinking();
	ai.stopThinking();
	EXPECT_FALSE(ai.isThinking());
	EXPECT_FALSE(ai.hasMoveReady());
}

TEST_F(AIPlayerTest, StopDiscardsUntakenResult) {
	AIPlayer ai(GameSettings::Difficulty::Beginner, 0, logger);
	std::future<SearchResult> future = ai.calculateBestMove(state, rules);
	future.wait();
	ASSERT_TRUE(waitFor([&ai]() { return ai.hasMoveReady(); }, 5000));
	ai.stopThinking();
	EXPECT_FALSE(ai.hasMoveReady());
}

TEST_F(AIPlayerTest, CanThinkAgainAfterAbort) {
	AIPlayer ai(GameSettings::Difficulty::Normal, kLongDelayMs, logger);
	ai.startThinking(state, rules);
	ai.stopThinking();
	ASSERT_EQ(ai.getState(), AIPlayer::ThinkingState::Aborted);

	AIPlayer quick(GameSettings::Difficulty::Normal, 0, logger);
	quick.startThinking(state, rules);
	quick.stopThinking();
	std::future<SearchResult> future = quick.calculateBestMove(state, rules);
	ASSERT_EQ(future.wait_for(std::chrono::seconds(30)), std::future_status::ready);
	EXPECT_EQ(future.get().status, SearchResult::Status::MoveProduced);
}

TEST_F(AIPlayerTest, DestructorDoesNotWaitForDelay) {
	auto start = std::chrono::steady_clock::now();
	{
		AIPlayer ai(GameSettings::Difficulty::Normal, kLongDelayMs, logger);
		ai.startThinking(state, rules);
	}
	EXPECT_LT(elapsedMs(start), 2000);
}

TEST_F(AIPlayerTest, ProgressCallbackReceivesPercentages) {
	place(state, PlayerColor::Black, 7, 7);
	AIPlayer ai(GameSettings::Difficulty::Normal, 0, logger);
	std::mutex mutex;
	int last = -1;
	bool monotonic = true;
	std::future<SearchResult> future = ai.calculateBestMove(state, rules, [&](int percent) {
		std::lock_guard<std::mutex> lock(mutex);
		monotonic = monotonic && percent >= last;
		last = percent;
	});
	ASSERT_EQ(future.wait_for(std::chrono::seconds(30)), std::future_status::ready);
	EXPECT_EQ(future.get().status, SearchResult::Status::MoveProduced);
	std::lock_guard<std::mutex> lock(mutex);
	EXPECT_GE(last, 0);
	EXPECT_LE(last, 100);
	EXPECT_TRUE(monotonic);
	EXPECT_EQ(ai.progress(), last);
}

TEST_F(AIPlayerTest, TimeLimitOverridesTierDefault) {
	AIPlayer ai(GameSettings::Difficulty::Hard, 0, logger);
	ai.setTimeLimit(20000);
	EXPECT_FALSE(ai.isHuman());
	EXPECT_EQ(ai.getDifficulty(), GameSettings::Difficulty::Hard);
	EXPECT_STREQ(thinkingStateName(ai.getState()), "idle");
	std::future<SearchResult> future = ai.calculateBestMove(state, rules);
	ASSERT_EQ(future.wait_for(std::chrono::seconds(30)), std::future_status::ready);
	SearchResult result = future.get();
	EXPECT_EQ(result.position, Move(7, 7));
	EXPECT_EQ(result.message.find("deadline"), std::string::npos);
	ASSERT_TRUE(waitFor([&ai]() { return ai.hasMoveReady(); }, 5000));
	ai.takeResult();
	EXPECT_FALSE(ai.hasGhostBoard());
}

TEST_F(AIPlayerTest, ConcurrentRequestsClaimOneSession) {
	place(state, PlayerColor::Black, 7, 7);
	for (int round = 0; round < 20; ++round) {
		AIPlayer ai(GameSettings::Difficulty::Beginner, 50, logger);
		std::atomic<bool> go(false);
		std::future<SearchResult> futures[2];
		auto request = [&](int slot) {
			while (!go.load()) {
				std::this_thread::yield();
			}
			futures[slot] = ai.calculateBestMove(state, rules);
		};
		std::thread first(request, 0);
		std::thread second(request, 1);
		go.store(true);
		first.join();
		second.join();

		int produced = 0;
		int busy = 0;
		for (std::future<SearchResult>& future : futures) {
			ASSERT_EQ(future.wait_for(std::chrono::seconds(30)), std::future_status::ready);
			SearchResult result = future.get();
			if (result.status == SearchResult::Status::MoveProduced) {
				++produced;
			} else if (result.status == SearchResult::Status::Failed && result.message == "AI is already thinking") {
				++busy;
			}
		}
		EXPECT_EQ(produced, 1) << "round " << round;
		EXPECT_EQ(busy, 1) << "round " << round;
		ai.stopThinking();
	}
}

TEST(HumanPlayerTest, HoldsPendingMoveUntilTaken) {
	HumanPlayer human;
	EXPECT_TRUE(human.isHuman());
	EXPECT_FALSE(human.hasPendingMove());

	human.setPendingMove(Move(3, 4));
	ASSERT_TRUE(human.hasPendingMove());
	EXPECT_EQ(human.takePendingMove(), Move(3, 4));
	EXPECT_FALSE(human.hasPendingMove());

	human.setPendingMove(Move(5, 5));
	human.clearPendingMove();
	EXPECT_FALSE(human.hasPendingMove());

	human.noteRejection("occupied");
	EXPECT_EQ(human.lastRejection(), "occupied");
	EXPECT_EQ(human.rejectionCount(), 1);
}
