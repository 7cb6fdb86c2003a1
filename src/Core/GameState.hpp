#ifndef GAMESTATE_HPP
#define GAMESTATE_HPP

#include <string>
#include <vector>
#include "Board.hpp"
#include "GameSettings.hpp"
#include "Move.hpp"
#include "MoveHistory.hpp"
#include "PlayerColor.hpp"

class GameState {
public:
	using PlayerColor = ::PlayerColor;
	enum class Status { Ready, Playing, Paused, BlackWon, WhiteWon, Draw, Stopped };
	enum class MoveError { None, OutOfBounds, PositionOccupied, GameFinished, GamePaused, EmptyHistory };

	Board board;
	PlayerColor toMove;
	Status status;
	bool hasLastMove;
	Move lastMove;
	std::string lastMessage;
	std::vector<Move> winningLine;

	GameState();
	explicit GameState(const GameSettings& settings);
	void reset(const GameSettings& settings);

	// Places a stone for toMove, records it and passes the turn.
	MoveError applyMove(const Move& move, MoveHistory::HistoryEntry* outEntry = nullptr);
	// Takes back the last recorded move; the mover of that move is to move again.
	MoveError undoMove(MoveHistory::HistoryEntry* outEntry = nullptr);
	void finish(Status result, const std::vector<Move>& line);
	// Paused freezes moves and undo; resume returns to Ready or Playing.
	bool pause();
	bool resume();

	GameState clone() const;
	const MoveHistory& getHistory() const;
	bool isFinished() const;
	bool isPaused() const;
	std::vector<std::string> validateState() const;

private:
	MoveHistory history;
};

const char* moveErrorText(GameState::MoveError error);
const char* statusName(GameState::Status status);

#endif
