#ifndef COMMANDLINE_HPP
#define COMMANDLINE_HPP

#include <string>

#include "GameSettings.hpp"
#include "Logger.hpp"

struct CommandLineOptions {
	GameSettings settings;
	bool verbose = false;
	bool showHelp = false;
	int maxMoves = 0;
};

// Throws std::invalid_argument with a user-facing message on a bad flag or value.
CommandLineOptions parseCommandLine(int argc, char** argv, bool allowSeats);
bool parsePlayerType(const std::string& value, GameSettings::PlayerType& outType);
void printUsage(const char* exe, bool allowSeats);
Logger::Level logLevelFor(const CommandLineOptions& options);

#endif
