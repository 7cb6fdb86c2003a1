#include "GameSettings.hpp"

#include <algorithm>
#include <cctype>

GameSettings::GameSettings()
	: boardSize(15),
	  forbiddenRules(true),
	  blackType(PlayerType::Human),
	  whiteType(PlayerType::AI),
	  blackDifficulty(Difficulty::Normal),
	  whiteDifficulty(Difficulty::Normal),
	  blackStarts(true),
	  aiMoveDelayMs(0) {
}

GameSettings::PlayerType GameSettings::typeFor(PlayerColor player) const {
	return (player == PlayerColor::Black) ? blackType : whiteType;
}

GameSettings::Difficulty GameSettings::difficultyFor(PlayerColor player) const {
	return (player == PlayerColor::Black) ? blackDifficulty : whiteDifficulty;
}

GameSettings::Mode GameSettings::mode() const {
	if (blackType == PlayerType::Human && whiteType == PlayerType::Human) {
		return Mode::PvP;
	}
	if (blackType == PlayerType::AI && whiteType == PlayerType::AI) {
		return Mode::EvE;
	}
	return Mode::PvE;
}

const char* difficultyName(GameSettings::Difficulty difficulty) {
	switch (difficulty) {
	case GameSettings::Difficulty::Beginner:
		return "beginner";
	case GameSettings::Difficulty::Normal:
		return "normal";
	case GameSettings::Difficulty::Hard:
		return "hard";
	case GameSettings::Difficulty::Hell:
		return "hell";
	}
	return "unknown";
}

const char* modeName(GameSettings::Mode mode) {
	switch (mode) {
	case GameSettings::Mode::PvP:
		return "PvP";
	case GameSettings::Mode::PvE:
		return "PvE";
	case GameSettings::Mode::EvE:
		return "EvE";
	}
	return "unknown";
}

bool parseDifficulty(const std::string& value, GameSettings::Difficulty& outDifficulty) {
	std::string lower = value;
	std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
		return static_cast<char>(std::tolower(c));
	});
	if (lower == "beginner" || lower == "easy") {
		outDifficulty = GameSettings::Difficulty::Beginner;
		return true;
	}
	if (lower == "normal") {
		outDifficulty = GameSettings::Difficulty::Normal;
		return true;
	}
	if (lower == "hard") {
		outDifficulty = GameSettings::Difficulty::Hard;
		return true;
	}
	if (lower == "hell") {
		outDifficulty = GameSettings::Difficulty::Hell;
		return true;
	}
	return false;
}
