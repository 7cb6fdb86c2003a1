#ifndef HUMANPLAYER_HPP
#define HUMANPLAYER_HPP

#include <string>

#include "IPlayer.hpp"
#include "Move.hpp"

// Holds the last click until the game loop consumes it.
class HumanPlayer : public IPlayer {
public:
	HumanPlayer();
	bool isHuman() const override;

	void setPendingMove(const Move& move);
	bool hasPendingMove() const;
	Move takePendingMove();
	void clearPendingMove();

	void noteRejection(const std::string& reason);
	const std::string& lastRejection() const;
	int rejectionCount() const;

private:
	bool pending;
	Move pendingMove;
	std::string rejection;
	int rejections;
};

#endif
