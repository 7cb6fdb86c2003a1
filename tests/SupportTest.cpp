#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>
#include <vector>

#include "CommandLine.hpp"
#include "Logger.hpp"

namespace {
CommandLineOptions parse(std::vector<std::string> args, bool allowSeats = true) {
	args.insert(args.begin(), "renju");
	std::vector<char*> argv;
	for (std::string& arg : args) {
		argv.push_back(&arg[0]);
	}
	return parseCommandLine(static_cast<int>(argv.size()), argv.data(), allowSeats);
}
}  // namespace

TEST(LoggerTest, FiltersByLevel) {
	std::ostringstream out;
	Logger logger(out, Logger::Level::Warn, false);
	logger.info("Game", "hidden");
	logger.warn("Game", "shown");
	EXPECT_EQ(out.str(), "[warn] [Game] shown\n");
	EXPECT_FALSE(logger.enabled(Logger::Level::Debug));

	logger.setLevel(Logger::Level::Off);
	logger.error("Game", "silenced");
	EXPECT_EQ(out.str(), "[warn] [Game] shown\n");
}

TEST(LoggerTest, ColorsWrapTheLevelTag) {
	std::ostringstream out;
	Logger logger(out, Logger::Level::Debug, true);
	logger.debug("AI", "x");
	EXPECT_EQ(out.str().find("\033["), 0u);
	EXPECT_NE(out.str().find("[AI] x"), std::string::npos);
}

TEST(CommandLineTest, DefaultsMatchHumanVersusNormalAi) {
	CommandLineOptions options = parse({});
	EXPECT_EQ(options.settings.boardSize, 15);
	EXPECT_TRUE(options.settings.forbiddenRules);
	EXPECT_EQ(options.settings.blackType, GameSettings::PlayerType::Human);
	EXPECT_EQ(options.settings.whiteType, GameSettings::PlayerType::AI);
	EXPECT_EQ(logLevelFor(options), Logger::Level::Info);
}

TEST(CommandLineTest, ParsesSeatsLevelsAndFlags) {
	CommandLineOptions options = parse({ "--black", "ai", "--white=human", "--black-level", "hell", "--size", "19",
		"--no-forbidden", "--white-first", "--delay=250", "--verbose" });
	EXPECT_EQ(options.settings.blackType, GameSettings::PlayerType::AI);
	EXPECT_EQ(options.settings.whiteType, GameSettings::PlayerType::Human);
	EXPECT_EQ(options.settings.blackDifficulty, GameSettings::Difficulty::Hell);
	EXPECT_EQ(options.settings.boardSize, 19);
	EXPECT_FALSE(options.settings.forbiddenRules);
	EXPECT_FALSE(options.settings.blackStarts);
	EXPECT_EQ(options.settings.aiMoveDelayMs, 250);
	EXPECT_EQ(logLevelFor(options), Logger::Level::Debug);
}

TEST(CommandLineTest, RejectsBadValues) {
	EXPECT_THROW(parse({ "--size", "4" }), std::invalid_argument);
	EXPECT_THROW(parse({ "--size", "26" }), std::invalid_argument);
	EXPECT_THROW(parse({ "--size", "ten" }), std::invalid_argument);
	EXPECT_THROW(parse({ "--white-level", "expert" }), std::invalid_argument);
	EXPECT_THROW(parse({ "--black", "robot" }), std::invalid_argument);
	EXPECT_THROW(parse({ "--size" }), std::invalid_argument);
	EXPECT_THROW(parse({ "--bogus" }), std::invalid_argument);
}

TEST(CommandLineTest, SelfPlayForcesBothSeatsToAi) {
	CommandLineOptions options = parse({ "--max-moves", "40", "--white-level", "beginner" }, false);
	EXPECT_EQ(options.settings.mode(), GameSettings::Mode::EvE);
	EXPECT_EQ(options.maxMoves, 40);
	EXPECT_EQ(options.settings.whiteDifficulty, GameSettings::Difficulty::Beginner);
	EXPECT_THROW(parse({ "--black", "human" }, false), std::invalid_argument);
	EXPECT_THROW(parse({ "--max-moves", "5" }, true), std::invalid_argument);
}
