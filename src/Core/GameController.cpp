#include "GameController.hpp"

#include <sstream>

GameController::GameController(const GameSettings& settings, Logger& loggerIn, EventBus& events)
	: game(settings, loggerIn, events), logger(loggerIn) {
}

void GameController::onCellClicked(int x, int y) {
	std::string reason;
	if (!game.submitHumanMove(Move(x, y), &reason)) {
		logger.debug("Input", "click at " + Move(x, y).toString() + " ignored: " + reason);
	}
}

void GameController::onUndo() {
	if (game.undo() == 0) {
		logger.debug("Input", "nothing to undo");
	}
}

void GameController::onHint() {
	Move move;
	if (game.hint(move)) {
		logger.info("Input", "hint: " + move.toString());
	}
}

void GameController::onNewGame() {
	game.newGame(game.getSettings());
}

void GameController::onStop() {
	game.stop();
}

void GameController::onTogglePause() {
	bool changed = game.getState().isPaused() ? game.resume() : game.pause();
	if (!changed) {
		logger.debug("Input", "pause ignored, game is over");
	}
}

void GameController::tick() {
	game.tick();
}

const GameState& GameController::state() const {
	return game.getState();
}

const MoveHistory& GameController::history() const {
	return game.getHistory();
}

const GameSettings& GameController::settings() const {
	return game.getSettings();
}

bool GameController::hasGhostBoard() const {
	return game.hasGhostBoard();
}

Board GameController::ghostBoard() const {
	return game.getGhostBoard();
}

bool GameController::hasHint() const {
	return game.hasHint();
}

Move GameController::hintMove() const {
	return game.getHint();
}

// Window-title line: status, side to move and AI progress while it searches.
std::string GameController::statusText() const {
	const GameState& current = game.getState();
	std::ostringstream text;
	text << "Renju - ";
	if (current.isFinished() || current.isPaused()) {
		text << statusName(current.status);
	} else {
		text << playerName(current.toMove) << " to move";
		if (game.isAiThinking()) {
			text << " (AI thinking " << game.aiProgress() << "%)";
		}
	}
	text << " - move " << current.getHistory().size();
	if (!current.lastMessage.empty()) {
		text << " - " << current.lastMessage;
	}
	return text.str();
}
