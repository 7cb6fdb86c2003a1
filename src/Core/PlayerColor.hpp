#ifndef PLAYERCOLOR_HPP
#define PLAYERCOLOR_HPP

#include "Board.hpp"

enum class PlayerColor { Black, White };

inline Board::Cell playerCell(PlayerColor player) {
	return (player == PlayerColor::Black) ? Board::Cell::Black : Board::Cell::White;
}

inline PlayerColor otherPlayer(PlayerColor player) {
	return (player == PlayerColor::Black) ? PlayerColor::White : PlayerColor::Black;
}

inline const char* playerName(PlayerColor player) {
	return (player == PlayerColor::Black) ? "black" : "white";
}

#endif
