#include "GameState.hpp"

#include <chrono>
#include <sstream>

GameState::GameState()
	: toMove(PlayerColor::Black),
	  status(Status::Ready),
	  hasLastMove(false),
	  lastMove(),
	  lastMessage(),
	  winningLine(),
	  history() {
}

GameState::GameState(const GameSettings& settings) : GameState() {
	reset(settings);
}

void GameState::reset(const GameSettings& settings) {
	board.reset(settings.boardSize);
	toMove = settings.blackStarts ? PlayerColor::Black : PlayerColor::White;
	status = Status::Ready;
	hasLastMove = false;
	lastMove = Move();
	lastMessage.clear();
	winningLine.clear();
	history.clear();
}

GameState::MoveError GameState::applyMove(const Move& move, MoveHistory::HistoryEntry* outEntry) {
	if (isFinished()) {
		return MoveError::GameFinished;
	}
	if (status == Status::Paused) {
		return MoveError::GamePaused;
	}
	if (!board.inBounds(move.x, move.y)) {
		return MoveError::OutOfBounds;
	}
	if (!board.isEmpty(move.x, move.y)) {
		return MoveError::PositionOccupied;
	}
	MoveHistory::HistoryEntry entry;
	entry.move = move;
	entry.player = toMove;
	entry.sequence = static_cast<int>(history.size()) + 1;
	entry.timestampMs = std::chrono::duration_cast<std::chrono::milliseconds>(
		std::chrono::system_clock::now().time_since_epoch()).count();
	board.set(move.x, move.y, playerCell(toMove));
	history.push(entry);
	lastMove = move;
	hasLastMove = true;
	if (status == Status::Ready) {
		status = Status::Playing;
	}
	toMove = otherPlayer(toMove);
	if (outEntry) {
		*outEntry = entry;
	}
	return MoveError::None;
}

GameState::MoveError GameState::undoMove(MoveHistory::HistoryEntry* outEntry) {
	if (status == Status::Paused) {
		return MoveError::GamePaused;
	}
	if (history.empty()) {
		return MoveError::EmptyHistory;
	}
	MoveHistory::HistoryEntry entry = history.pop();
	board.remove(entry.move.x, entry.move.y);
	toMove = entry.player;
	winningLine.clear();
	if (history.empty()) {
		status = Status::Ready;
		hasLastMove = false;
		lastMove = Move();
	} else {
		status = Status::Playing;
		hasLastMove = true;
		lastMove = history.back().move;
	}
	if (outEntry) {
		*outEntry = entry;
	}
	return MoveError::None;
}

void GameState::finish(Status result, const std::vector<Move>& line) {
	status = result;
	winningLine = line;
}

bool GameState::pause() {
	if (isFinished() || status == Status::Paused) {
		return false;
	}
	status = Status::Paused;
	return true;
}

bool GameState::resume() {
	if (status != Status::Paused) {
		return false;
	}
	status = history.empty() ? Status::Ready : Status::Playing;
	return true;
}

GameState GameState::clone() const {
	GameState copy(*this);
	return copy;
}

const MoveHistory& GameState::getHistory() const {
	return history;
}

bool GameState::isFinished() const {
	return status == Status::BlackWon || status == Status::WhiteWon
		|| status == Status::Draw || status == Status::Stopped;
}

bool GameState::isPaused() const {
	return status == Status::Paused;
}

std::vector<std::string> GameState::validateState() const {
	std::vector<std::string> issues;
	int stones = board.countStones();
	if (stones != static_cast<int>(history.size())) {
		std::ostringstream out;
		out << "stone count mismatch: board has " << stones << ", history has " << history.size();
		issues.push_back(out.str());
	}
	const std::vector<MoveHistory::HistoryEntry>& entries = history.all();
	std::vector<bool> seen(static_cast<size_t>(board.getSize() * board.getSize()), false);
	for (size_t i = 0; i < entries.size(); ++i) {
		const MoveHistory::HistoryEntry& entry = entries[i];
		std::ostringstream where;
		where << "move " << entry.sequence << " at [" << entry.move.x << "," << entry.move.y << "]";
		if (!board.inBounds(entry.move.x, entry.move.y)) {
			issues.push_back(where.str() + " is out of bounds");
			continue;
		}
		size_t idx = static_cast<size_t>(entry.move.y * board.getSize() + entry.move.x);
		if (seen[idx]) {
			issues.push_back(where.str() + " reuses an occupied cell");
		}
		seen[idx] = true;
		if (board.at(entry.move.x, entry.move.y) != playerCell(entry.player)) {
			issues.push_back(where.str() + " does not match the board");
		}
		if (entry.sequence != static_cast<int>(i) + 1) {
			issues.push_back(where.str() + " has a broken sequence number");
		}
	}
	return issues;
}

const char* moveErrorText(GameState::MoveError error) {
	switch (error) {
	case GameState::MoveError::None:
		return "ok";
	case GameState::MoveError::OutOfBounds:
		return "out of bounds";
	case GameState::MoveError::PositionOccupied:
		return "occupied";
	case GameState::MoveError::GameFinished:
		return "game is over";
	case GameState::MoveError::GamePaused:
		return "game is paused";
	case GameState::MoveError::EmptyHistory:
		return "no moves to undo";
	}
	return "unknown";
}

const char* statusName(GameState::Status status) {
	switch (status) {
	case GameState::Status::Ready:
		return "ready";
	case GameState::Status::Playing:
		return "playing";
	case GameState::Status::Paused:
		return "paused";
	case GameState::Status::BlackWon:
		return "black won";
	case GameState::Status::WhiteWon:
		return "white won";
	case GameState::Status::Draw:
		return "draw";
	case GameState::Status::Stopped:
		return "stopped";
	}
	return "unknown";
}
