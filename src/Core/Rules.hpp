#ifndef RULES_HPP
#define RULES_HPP

#include <array>
#include <string>
#include <vector>
#include "Board.hpp"
#include "GameSettings.hpp"
#include "Move.hpp"
#include "MoveHistory.hpp"
#include "PatternMatcher.hpp"
#include "PlayerColor.hpp"

enum class ForbiddenType { Overline, DoubleThree, DoubleFour };

struct ForbiddenResult {
	bool isForbidden = false;
	std::vector<ForbiddenType> types;
	int longestRun = 0;
	int liveThrees = 0;
	int fours = 0;
};

struct ValidationResult {
	enum class Status { Ok, OutOfBounds, Occupied, Forbidden };

	Status status = Status::Ok;
	std::vector<ForbiddenType> violations;

	bool ok() const { return status == Status::Ok; }
	std::string reason() const;
};

struct WinResult {
	bool isWin = false;
	bool isOverline = false;
	int runLength = 0;
	std::vector<Move> winLine;
};

struct PatternAnalysis {
	struct DirectionPattern {
		int dx;
		int dy;
		PatternMatcher::Pattern pattern;
		std::string window;
	};

	std::vector<DirectionPattern> patterns;
	std::array<int, PatternMatcher::kPatternCount> counts{};
	int score = 0;

	int count(PatternMatcher::Pattern pattern) const;
};

class Rules {
public:
	explicit Rules(const GameSettings& settings);

	ValidationResult validateMove(const Board& board, int x, int y, PlayerColor player) const;
	bool isLegal(const Board& board, const Move& move, PlayerColor player, std::string* reason = nullptr) const;
	ForbiddenResult detectForbidden(const Board& board, int x, int y) const;
	WinResult checkWin(const Board& board, int x, int y, PlayerColor player) const;
	bool isDraw(const Board& board) const;

	std::vector<Move> getAvailableMoves(const Board& board, const MoveHistory& history, PlayerColor player,
		int range = 2, bool includeForbidden = false) const;
	int evaluatePosition(const Board& board, int x, int y, PlayerColor player) const;
	PatternAnalysis analyzePattern(const Board& board, int x, int y, PlayerColor player) const;

	bool isConstrained(PlayerColor player) const;
	int getBoardSize() const;
	bool forbiddenRulesEnabled() const;

private:
	GameSettings settings;

	int countDirection(const Board& board, int x, int y, int dx, int dy, Board::Cell cell) const;
	PatternAnalysis analyzePlaced(const Board& board, int x, int y, PlayerColor player) const;
};

const char* forbiddenName(ForbiddenType type);

#endif
