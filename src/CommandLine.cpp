#include "CommandLine.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>

#include "Config.hpp"

namespace {
std::string toLower(std::string value) {
	std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
		return static_cast<char>(std::tolower(c));
	});
	return value;
}

int parseInt(const std::string& flag, const std::string& value) {
	size_t used = 0;
	int parsed = 0;
	try {
		parsed = std::stoi(value, &used);
	} catch (const std::exception&) {
		throw std::invalid_argument("Invalid number for " + flag + ": " + value);
	}
	if (used != value.size()) {
		throw std::invalid_argument("Invalid number for " + flag + ": " + value);
	}
	return parsed;
}

// Accepts both "--flag value" and "--flag=value".
bool takeValue(const std::string& arg, const std::string& flag, int argc, char** argv, int& i, std::string& outValue) {
	if (arg == flag) {
		if (i + 1 >= argc) {
			throw std::invalid_argument("Missing value for " + flag);
		}
		outValue = argv[++i];
		return true;
	}
	std::string prefix = flag + "=";
	if (arg.compare(0, prefix.size(), prefix) == 0) {
		outValue = arg.substr(prefix.size());
		return true;
	}
	return false;
}

GameSettings::Difficulty requireDifficulty(const std::string& flag, const std::string& value) {
	GameSettings::Difficulty difficulty = GameSettings::Difficulty::Normal;
	if (!parseDifficulty(value, difficulty)) {
		throw std::invalid_argument("Invalid level for " + flag + ": " + value);
	}
	return difficulty;
}
}  // namespace

bool parsePlayerType(const std::string& value, GameSettings::PlayerType& outType) {
	std::string lower = toLower(value);
	if (lower == "ai" || lower == "bot") {
		outType = GameSettings::PlayerType::AI;
		return true;
	}
	if (lower == "human" || lower == "player") {
		outType = GameSettings::PlayerType::Human;
		return true;
	}
	return false;
}

CommandLineOptions parseCommandLine(int argc, char** argv, bool allowSeats) {
	CommandLineOptions options;
	if (!allowSeats) {
		options.settings.blackType = GameSettings::PlayerType::AI;
		options.settings.whiteType = GameSettings::PlayerType::AI;
	}
	for (int i = 1; i < argc; ++i) {
		std::string arg = argv[i];
		std::string value;
		if (arg == "--help" || arg == "-h") {
			options.showHelp = true;
			continue;
		}
		if (arg == "--verbose" || arg == "-v") {
			options.verbose = true;
			continue;
		}
		if (arg == "--no-forbidden") {
			options.settings.forbiddenRules = false;
			continue;
		}
		if (arg == "--white-first") {
			options.settings.blackStarts = false;
			continue;
		}
		if (allowSeats && (takeValue(arg, "--black", argc, argv, i, value) || takeValue(arg, "-b", argc, argv, i, value))) {
			if (!parsePlayerType(value, options.settings.blackType)) {
				throw std::invalid_argument("Invalid black player type: " + value);
			}
			continue;
		}
		if (allowSeats && (takeValue(arg, "--white", argc, argv, i, value) || takeValue(arg, "-w", argc, argv, i, value))) {
			if (!parsePlayerType(value, options.settings.whiteType)) {
				throw std::invalid_argument("Invalid white player type: " + value);
			}
			continue;
		}
		if (takeValue(arg, "--black-level", argc, argv, i, value)) {
			options.settings.blackDifficulty = requireDifficulty("--black-level", value);
			continue;
		}
		if (takeValue(arg, "--white-level", argc, argv, i, value)) {
			options.settings.whiteDifficulty = requireDifficulty("--white-level", value);
			continue;
		}
		if (takeValue(arg, "--size", argc, argv, i, value)) {
			int size = parseInt("--size", value);
			if (size < Config::kMinBoardSize || size > Config::kMaxBoardSize) {
				throw std::invalid_argument("Board size must be between " + std::to_string(Config::kMinBoardSize)
					+ " and " + std::to_string(Config::kMaxBoardSize) + ": " + value);
			}
			options.settings.boardSize = size;
			continue;
		}
		if (allowSeats && takeValue(arg, "--delay", argc, argv, i, value)) {
			int delay = parseInt("--delay", value);
			if (delay < 0) {
				throw std::invalid_argument("AI delay cannot be negative: " + value);
			}
			options.settings.aiMoveDelayMs = delay;
			continue;
		}
		if (!allowSeats && takeValue(arg, "--max-moves", argc, argv, i, value)) {
			int maxMoves = parseInt("--max-moves", value);
			if (maxMoves < 0) {
				throw std::invalid_argument("Move limit cannot be negative: " + value);
			}
			options.maxMoves = maxMoves;
			continue;
		}
		throw std::invalid_argument("Unknown argument: " + arg);
	}
	return options;
}

void printUsage(const char* exe, bool allowSeats) {
	std::cout << "Usage: " << exe;
	if (allowSeats) {
		std::cout << " [--black ai|human] [--white ai|human]";
	}
	std::cout << " [--black-level L] [--white-level L]\n"
	          << "       [--size N] [--no-forbidden] [--white-first] [--verbose]";
	if (allowSeats) {
		std::cout << " [--delay MS]";
	} else {
		std::cout << " [--max-moves N]";
	}
	std::cout << "\n  L is one of beginner, normal, hard, hell. N is " << Config::kMinBoardSize << ".."
	          << Config::kMaxBoardSize << ".\n";
}

Logger::Level logLevelFor(const CommandLineOptions& options) {
	return options.verbose ? Logger::Level::Debug : Logger::Level::Info;
}
