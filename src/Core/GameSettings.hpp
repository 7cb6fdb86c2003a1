#ifndef GAMESETTINGS_HPP
#define GAMESETTINGS_HPP

#include <string>

#include "PlayerColor.hpp"

class GameSettings {
public:
	enum class PlayerType { Human, AI };
	enum class Difficulty { Beginner, Normal, Hard, Hell };
	enum class Mode { PvP, PvE, EvE };

	int boardSize;
	bool forbiddenRules;
	PlayerType blackType;
	PlayerType whiteType;
	Difficulty blackDifficulty;
	Difficulty whiteDifficulty;
	bool blackStarts;
	int aiMoveDelayMs;

	GameSettings();

	PlayerType typeFor(PlayerColor player) const;
	Difficulty difficultyFor(PlayerColor player) const;
	Mode mode() const;
};

const char* difficultyName(GameSettings::Difficulty difficulty);
const char* modeName(GameSettings::Mode mode);
bool parseDifficulty(const std::string& value, GameSettings::Difficulty& outDifficulty);

#endif
