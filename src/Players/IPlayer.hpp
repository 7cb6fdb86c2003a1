#ifndef IPLAYER_HPP
#define IPLAYER_HPP

// A seat at the board. Game polls humans for a pending click and runs AI
// searches in the background.
class IPlayer {
public:
	virtual ~IPlayer() = default;
	virtual bool isHuman() const = 0;
};

#endif
