#ifndef MOVEHISTORY_HPP
#define MOVEHISTORY_HPP

#include <cstdint>
#include <vector>

#include "Move.hpp"
#include "PlayerColor.hpp"

class MoveHistory {
public:
	struct HistoryEntry {
		Move move;
		PlayerColor player;
		int sequence;
		std::int64_t timestampMs;
	};

	void clear();
	void push(const HistoryEntry& entry);
	HistoryEntry pop();
	const HistoryEntry& back() const;
	bool empty() const;
	size_t size() const;
	bool contains(const Move& move) const;
	const std::vector<HistoryEntry>& all() const;

private:
	std::vector<HistoryEntry> entries;
};

#endif
