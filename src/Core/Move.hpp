#ifndef MOVE_HPP
#define MOVE_HPP

#include <string>

// A board coordinate. Who played it and when is kept by MoveHistory.
class Move {
public:
	int x;
	int y;

	Move() : x(-1), y(-1) {
	}

	Move(int xPos, int yPos) : x(xPos), y(yPos) {
	}

	bool operator==(const Move& other) const {
		return x == other.x && y == other.y;
	}

	bool operator!=(const Move& other) const {
		return !(*this == other);
	}

	bool isValid(int boardSize) const {
		return x >= 0 && y >= 0 && x < boardSize && y < boardSize;
	}

	std::string toString() const {
		return "[" + std::to_string(x) + "," + std::to_string(y) + "]";
	}
};

#endif
