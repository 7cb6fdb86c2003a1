#ifndef PATTERNMATCHER_HPP
#define PATTERNMATCHER_HPP

#include <string>

#include "Board.hpp"

// Classifies the shape a stone forms along one line. The window is 9 cells
// centred on the stone, written with 'X' for own stones, '_' for empty cells,
// 'O' for opponent stones and '#' past the board edge.
class PatternMatcher {
public:
	enum class Pattern { None, Overline, Five, LiveFour, RushFour, LiveThree, SleepThree, LiveTwo, SleepTwo };

	static constexpr int kRadius = 4;
	static constexpr int kWindowSize = kRadius * 2 + 1;
	static constexpr int kPatternCount = 9;

	static std::string extract(const Board& board, int x, int y, int dx, int dy, Board::Cell own);
	static Pattern classify(const std::string& window);
	static Pattern classifyAt(const Board& board, int x, int y, int dx, int dy, Board::Cell own);

	static int score(Pattern pattern);
	static const char* name(Pattern pattern);
	static bool isFour(Pattern pattern);
};

#endif
