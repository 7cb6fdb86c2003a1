#ifndef GAMECONTROLLER_HPP
#define GAMECONTROLLER_HPP

#include <string>

#include "Game.hpp"

// Input-facing wrapper used by the front ends.
class GameController {
public:
	GameController(const GameSettings& settings, Logger& logger, EventBus& events);

	void onCellClicked(int x, int y);
	void onUndo();
	void onHint();
	void onNewGame();
	void onStop();
	void onTogglePause();
	void tick();

	const GameState& state() const;
	const MoveHistory& history() const;
	const GameSettings& settings() const;
	bool hasGhostBoard() const;
	Board ghostBoard() const;
	bool hasHint() const;
	Move hintMove() const;
	std::string statusText() const;

private:
	Game game;
	Logger& logger;
};

#endif
