#include "MoveHistory.hpp"

void MoveHistory::clear() {
	entries.clear();
}

void MoveHistory::push(const HistoryEntry& entry) {
	entries.push_back(entry);
}

MoveHistory::HistoryEntry MoveHistory::pop() {
	HistoryEntry entry = entries.back();
	entries.pop_back();
	return entry;
}

const MoveHistory::HistoryEntry& MoveHistory::back() const {
	return entries.back();
}

bool MoveHistory::empty() const {
	return entries.empty();
}

size_t MoveHistory::size() const {
	return entries.size();
}

bool MoveHistory::contains(const Move& move) const {
	for (const HistoryEntry& entry : entries) {
		if (entry.move == move) {
			return true;
		}
	}
	return false;
}

const std::vector<MoveHistory::HistoryEntry>& MoveHistory::all() const {
	return entries;
}
