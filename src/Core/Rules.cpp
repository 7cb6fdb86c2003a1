#include "Rules.hpp"

#include <algorithm>

namespace {
const int kDirections[4][2] = { {1, 0}, {0, 1}, {1, 1}, {1, -1} };
}  // namespace

std::string ValidationResult::reason() const {
	switch (status) {
	case Status::Ok:
		return "ok";
	case Status::OutOfBounds:
		return "out of bounds";
	case Status::Occupied:
		return "occupied";
	case Status::Forbidden: {
		std::string text = "forbidden";
		for (size_t i = 0; i < violations.size(); ++i) {
			text += (i == 0) ? " " : ", ";
			text += forbiddenName(violations[i]);
		}
		return text;
	}
	}
	return "unknown";
}

int PatternAnalysis::count(PatternMatcher::Pattern pattern) const {
	return counts[static_cast<size_t>(pattern)];
}

Rules::Rules(const GameSettings& settingsIn) : settings(settingsIn) {
}

ValidationResult Rules::validateMove(const Board& board, int x, int y, PlayerColor player) const {
	ValidationResult result;
	if (!board.inBounds(x, y)) {
		result.status = ValidationResult::Status::OutOfBounds;
		return result;
	}
	if (!board.isEmpty(x, y)) {
		result.status = ValidationResult::Status::Occupied;
		return result;
	}
	if (isConstrained(player)) {
		ForbiddenResult forbidden = detectForbidden(board, x, y);
		if (forbidden.isForbidden) {
			result.status = ValidationResult::Status::Forbidden;
			result.violations = forbidden.types;
		}
	}
	return result;
}

bool Rules::isLegal(const Board& board, const Move& move, PlayerColor player, std::string* reason) const {
	ValidationResult result = validateMove(board, move.x, move.y, player);
	if (!result.ok() && reason) {
		*reason = result.reason();
	}
	return result.ok();
}

ForbiddenResult Rules::detectForbidden(const Board& board, int x, int y) const {
	ForbiddenResult result;
	if (!board.isEmpty(x, y)) {
		return result;
	}
	const Board::Cell black = Board::Cell::Black;
	for (int i = 0; i < 4; ++i) {
		int dx = kDirections[i][0];
		int dy = kDirections[i][1];
		int run = 1 + countDirection(board, x, y, dx, dy, black) + countDirection(board, x, y, -dx, -dy, black);
		result.longestRun = std::max(result.longestRun, run);

		std::string window = PatternMatcher::extract(board, x, y, dx, dy, black);
		window[PatternMatcher::kRadius] = 'X';
		PatternMatcher::Pattern pattern = PatternMatcher::classify(window);
		if (pattern == PatternMatcher::Pattern::LiveThree) {
			++result.liveThrees;
		} else if (PatternMatcher::isFour(pattern)) {
			++result.fours;
		}
	}
	if (result.longestRun > 5) {
		result.types.push_back(ForbiddenType::Overline);
	}
	if (result.liveThrees >= 2) {
		result.types.push_back(ForbiddenType::DoubleThree);
	}
	if (result.fours >= 2) {
		result.types.push_back(ForbiddenType::DoubleFour);
	}
	result.isForbidden = !result.types.empty();
	return result;
}

WinResult Rules::checkWin(const Board& board, int x, int y, PlayerColor player) const {
	WinResult result;
	if (!board.inBounds(x, y)) {
		return result;
	}
	Board::Cell cell = playerCell(player);
	for (int i = 0; i < 4; ++i) {
		int dx = kDirections[i][0];
		int dy = kDirections[i][1];
		int backward = countDirection(board, x, y, -dx, -dy, cell);
		int run = 1 + backward + countDirection(board, x, y, dx, dy, cell);
		if (run < 5) {
			continue;
		}
		bool overline = run > 5 && isConstrained(player);
		if (result.runLength >= 5 && overline) {
			continue;
		}
		result.runLength = run;
		result.isOverline = overline;
		result.isWin = !overline;
		result.winLine.clear();
		int sx = x - backward * dx;
		int sy = y - backward * dy;
		for (int step = 0; step < 5; ++step) {
			result.winLine.push_back(Move(sx + step * dx, sy + step * dy));
		}
		if (result.isWin) {
			break;
		}
	}
	return result;
}

bool Rules::isDraw(const Board& board) const {
	return board.countEmpty() == 0;
}

std::vector<Move> Rules::getAvailableMoves(const Board& board, const MoveHistory& history, PlayerColor player,
	int range, bool includeForbidden) const {
	std::vector<Move> moves;
	int size = board.getSize();
	if (history.empty()) {
		int center = size / 2;
		moves.push_back(Move(center, center));
		return moves;
	}
	bool filterForbidden = !includeForbidden && isConstrained(player);
	std::vector<bool> seen(static_cast<size_t>(size * size), false);
	for (const MoveHistory::HistoryEntry& entry : history.all()) {
		for (int dy = -range; dy <= range; ++dy) {
			for (int dx = -range; dx <= range; ++dx) {
				int nx = entry.move.x + dx;
				int ny = entry.move.y + dy;
				if (!board.isEmpty(nx, ny)) {
					continue;
				}
				size_t idx = static_cast<size_t>(ny * size + nx);
				if (seen[idx]) {
					continue;
				}
				seen[idx] = true;
				if (filterForbidden && detectForbidden(board, nx, ny).isForbidden) {
					continue;
				}
				moves.push_back(Move(nx, ny));
			}
		}
	}
	return moves;
}

int Rules::evaluatePosition(const Board& board, int x, int y, PlayerColor player) const {
	return analyzePattern(board, x, y, player).score;
}

PatternAnalysis Rules::analyzePattern(const Board& board, int x, int y, PlayerColor player) const {
	if (!board.inBounds(x, y)) {
		return PatternAnalysis();
	}
	return analyzePlaced(board, x, y, player);
}

bool Rules::isConstrained(PlayerColor player) const {
	return settings.forbiddenRules && player == PlayerColor::Black;
}

int Rules::getBoardSize() const {
	return settings.boardSize;
}

bool Rules::forbiddenRulesEnabled() const {
	return settings.forbiddenRules;
}

int Rules::countDirection(const Board& board, int x, int y, int dx, int dy, Board::Cell cell) const {
	int count = 0;
	int cx = x + dx;
	int cy = y + dy;
	while (board.inBounds(cx, cy) && board.at(cx, cy) == cell) {
		++count;
		cx += dx;
		cy += dy;
	}
	return count;
}

// The stone at (x, y) is taken to be the player's whether or not the board holds it.
PatternAnalysis Rules::analyzePlaced(const Board& board, int x, int y, PlayerColor player) const {
	PatternAnalysis analysis;
	Board::Cell cell = playerCell(player);
	bool overlineWins = !isConstrained(player);
	for (int i = 0; i < 4; ++i) {
		int dx = kDirections[i][0];
		int dy = kDirections[i][1];
		std::string window = PatternMatcher::extract(board, x, y, dx, dy, cell);
		window[PatternMatcher::kRadius] = 'X';
		PatternMatcher::Pattern pattern = PatternMatcher::classify(window);
		if (pattern == PatternMatcher::Pattern::None) {
			continue;
		}
		if (pattern == PatternMatcher::Pattern::Overline && overlineWins) {
			pattern = PatternMatcher::Pattern::Five;
		}
		analysis.patterns.push_back(PatternAnalysis::DirectionPattern{ dx, dy, pattern, window });
		++analysis.counts[static_cast<size_t>(pattern)];
		analysis.score += PatternMatcher::score(pattern);
	}
	return analysis;
}

const char* forbiddenName(ForbiddenType type) {
	switch (type) {
	case ForbiddenType::Overline:
		return "overline";
	case ForbiddenType::DoubleThree:
		return "double-three";
	case ForbiddenType::DoubleFour:
		return "double-four";
	}
	return "unknown";
}
