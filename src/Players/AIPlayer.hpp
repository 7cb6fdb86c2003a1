#ifndef AIPLAYER_HPP
#define AIPLAYER_HPP

#include <atomic>
#include <functional>
#include <future>
#include <mutex>
#include <thread>

#include "AISearch.hpp"
#include "Board.hpp"
#include "IPlayer.hpp"
#include "Logger.hpp"

// One AI seat. Searches run on a worker thread against a snapshot of the game;
// at most one search is in flight per player.
class AIPlayer : public IPlayer {
public:
	enum class ThinkingState { Idle, Thinking, MoveProduced, Aborted, Failed };

	AIPlayer(GameSettings::Difficulty difficulty, int moveDelayMs, Logger& logger);
	~AIPlayer();
	bool isHuman() const override;

	// Starts a search on a worker thread. While one is running the returned
	// future is already Failed.
	std::future<SearchResult> calculateBestMove(const GameState& state, const Rules& rules,
		std::function<void(int)> onProgress = std::function<void(int)>());
	void startThinking(const GameState& state, const Rules& rules);
	// Cancels a running search and drops any result not yet taken.
	void stopThinking();

	ThinkingState getState() const;
	bool isThinking() const;
	bool hasMoveReady() const;
	SearchResult takeResult();
	int progress() const;

	bool hasGhostBoard() const;
	Board ghostBoardCopy() const;
	GameSettings::Difficulty getDifficulty() const;
	void setTimeLimit(int timeoutMs);

private:
	GameSettings::Difficulty difficulty;
	int delayMs;
	int timeLimitMs;
	Logger& logger;

	mutable std::mutex sessionMutex;
	mutable std::mutex ghostMutex;
	std::thread worker;
	CancelToken cancel;
	unsigned long sessionId;
	ThinkingState state;
	bool moveReady;
	SearchResult readyResult;
	std::atomic<int> progressPercent;
	std::atomic<bool> ghostActive;
	Board ghostBoard;

	SearchSettings makeSettings(const CancelToken& token, std::function<void(int)> onProgress);
	SearchResult runSearch(const GameState& state, const Rules& rules, const SearchSettings& settings);
	bool waitDelay(const CancelToken& token) const;
	void joinWorker();
};

const char* thinkingStateName(AIPlayer::ThinkingState state);

#endif
