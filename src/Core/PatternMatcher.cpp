#include "PatternMatcher.hpp"

namespace {
struct PatternRule {
	PatternMatcher::Pattern pattern;
	const char* templates[4];
	int score;
};

// Checked top to bottom; the first template found anywhere in the window wins.
const PatternRule kRules[] = {
	{ PatternMatcher::Pattern::Overline, { "XXXXXX", nullptr, nullptr, nullptr }, -100000 },
	{ PatternMatcher::Pattern::Five, { "XXXXX", nullptr, nullptr, nullptr }, 100000 },
	{ PatternMatcher::Pattern::LiveFour, { "_XXXX_", nullptr, nullptr, nullptr }, 10000 },
	{ PatternMatcher::Pattern::RushFour, { "XXXX_", "_XXXX", "XXX_X", "X_XXX" }, 1000 },
	{ PatternMatcher::Pattern::LiveThree, { "_XXX_", "_XX_X_", nullptr, nullptr }, 1000 },
	{ PatternMatcher::Pattern::SleepThree, { "XXX_", "_XXX", "XX_X", "X_XX" }, 100 },
	{ PatternMatcher::Pattern::LiveTwo, { "_XX_", "_X_X_", nullptr, nullptr }, 100 },
	{ PatternMatcher::Pattern::SleepTwo, { "XX_", "_XX", "X_X", nullptr }, 10 },
};
}  // namespace

constexpr int PatternMatcher::kRadius;
constexpr int PatternMatcher::kWindowSize;
constexpr int PatternMatcher::kPatternCount;

std::string PatternMatcher::extract(const Board& board, int x, int y, int dx, int dy, Board::Cell own) {
	std::string window(static_cast<size_t>(kWindowSize), '#');
	for (int i = -kRadius; i <= kRadius; ++i) {
		Board::Cell cell = Board::Cell::Empty;
		if (!board.tryGet(x + i * dx, y + i * dy, cell)) {
			continue;
		}
		char value = 'O';
		if (cell == Board::Cell::Empty) {
			value = '_';
		} else if (cell == own) {
			value = 'X';
		}
		window[static_cast<size_t>(i + kRadius)] = value;
	}
	return window;
}

PatternMatcher::Pattern PatternMatcher::classify(const std::string& window) {
	for (const PatternRule& rule : kRules) {
		for (const char* pattern : rule.templates) {
			if (pattern && window.find(pattern) != std::string::npos) {
				return rule.pattern;
			}
		}
	}
	return Pattern::None;
}

PatternMatcher::Pattern PatternMatcher::classifyAt(const Board& board, int x, int y, int dx, int dy, Board::Cell own) {
	return classify(extract(board, x, y, dx, dy, own));
}

int PatternMatcher::score(Pattern pattern) {
	for (const PatternRule& rule : kRules) {
		if (rule.pattern == pattern) {
			return rule.score;
		}
	}
	return 0;
}

const char* PatternMatcher::name(Pattern pattern) {
	switch (pattern) {
	case Pattern::None:
		return "none";
	case Pattern::Overline:
		return "overline";
	case Pattern::Five:
		return "five";
	case Pattern::LiveFour:
		return "liveFour";
	case Pattern::RushFour:
		return "rushFour";
	case Pattern::LiveThree:
		return "liveThree";
	case Pattern::SleepThree:
		return "sleepThree";
	case Pattern::LiveTwo:
		return "liveTwo";
	case Pattern::SleepTwo:
		return "sleepTwo";
	}
	return "unknown";
}

bool PatternMatcher::isFour(Pattern pattern) {
	return pattern == Pattern::LiveFour || pattern == Pattern::RushFour;
}
