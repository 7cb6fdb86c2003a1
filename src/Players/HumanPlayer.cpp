#include "HumanPlayer.hpp"

HumanPlayer::HumanPlayer() : pending(false), pendingMove(), rejection(), rejections(0) {
}

bool HumanPlayer::isHuman() const {
	return true;
}

void HumanPlayer::setPendingMove(const Move& move) {
	pendingMove = move;
	pending = true;
}

bool HumanPlayer::hasPendingMove() const {
	return pending;
}

Move HumanPlayer::takePendingMove() {
	pending = false;
	return pendingMove;
}

void HumanPlayer::clearPendingMove() {
	pending = false;
	pendingMove = Move();
}

void HumanPlayer::noteRejection(const std::string& reason) {
	rejection = reason;
	++rejections;
}

const std::string& HumanPlayer::lastRejection() const {
	return rejection;
}

int HumanPlayer::rejectionCount() const {
	return rejections;
}
