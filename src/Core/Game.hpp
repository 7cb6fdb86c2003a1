#ifndef GAME_HPP
#define GAME_HPP

#include <chrono>
#include <memory>
#include <string>

#include "AIPlayer.hpp"
#include "EventBus.hpp"
#include "GameSettings.hpp"
#include "GameState.hpp"
#include "HumanPlayer.hpp"
#include "IPlayer.hpp"
#include "Logger.hpp"
#include "MoveHistory.hpp"
#include "Rules.hpp"

// Owns the live game. Only this class commits moves to the state; AI players
// search on their own copy and hand back a result that tick() applies.
class Game {
public:
	Game(const GameSettings& settings, Logger& logger, EventBus& events);

	void newGame(const GameSettings& settings);
	const GameState& getState() const;
	const MoveHistory& getHistory() const;
	const GameSettings& getSettings() const;
	const Rules& getRules() const;

	bool tryApplyMove(const Move& move, std::string* reason = nullptr);
	void tick();
	bool submitHumanMove(const Move& move, std::string* reason = nullptr);
	int undo();
	bool hint(Move& outMove);
	void stop();
	bool pause();
	bool resume();

	bool isAiTurn() const;
	bool isAiThinking() const;
	int aiProgress() const;
	bool hasGhostBoard() const;
	Board getGhostBoard() const;
	bool hasHint() const;
	Move getHint() const;

private:
	GameSettings settings;
	Rules rules;
	GameState state;
	Logger& logger;
	EventBus& events;
	std::unique_ptr<IPlayer> blackPlayer;
	std::unique_ptr<IPlayer> whitePlayer;
	std::chrono::steady_clock::time_point turnStartTime;
	bool aiStalled;
	bool hintActive;
	Move hintMove;
	int coordWidth;
	size_t timeWidth;

	IPlayer* currentPlayer() const;
	IPlayer* playerForColor(PlayerColor color) const;
	AIPlayer* aiFor(PlayerColor color) const;
	void createPlayers();
	void stopAllThinking();
	void clearPendingHumanMoves();
	void collectAiResult(AIPlayer& ai);
	void rejectMove(const Move& move, const std::string& reason, std::string* outReason);
	void publish(GameEvent::Type type, PlayerColor player, const Move& move, const std::string& message);
	void logMatchup() const;
	void logMovePlayed(PlayerColor player, const Move& move, double elapsedMs, bool isAiMove) const;
	void logWin(PlayerColor player, int runLength) const;
	void computeLogWidths();
};

#endif
