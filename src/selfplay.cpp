#include "CommandLine.hpp"
#include "EventBus.hpp"
#include "Game.hpp"
#include "Logger.hpp"

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>

// Console match between two AI players. The board is printed after every move.
int main(int argc, char** argv) {
	CommandLineOptions options;
	try {
		options = parseCommandLine(argc, argv, false);
	} catch (const std::invalid_argument& error) {
		std::cerr << error.what() << std::endl;
		printUsage(argv[0], false);
		return 1;
	}
	if (options.showHelp) {
		printUsage(argv[0], false);
		return 0;
	}
	Logger logger(std::cout, logLevelFor(options));
	EventBus events;
	Game game(options.settings, logger, events);

	int played = 0;
	bool stalled = false;
	events.subscribe(GameEvent::Type::MoveApplied, [&](const GameEvent&) {
		++played;
		std::cout << game.getState().board.toAscii() << std::flush;
	});
	events.subscribe(GameEvent::Type::AiThinkingFailed, [&](const GameEvent& event) {
		logger.error("SelfPlay", std::string(playerName(event.player)) + " cannot move: " + event.message);
		stalled = true;
	});

	std::cout << game.getState().board.toAscii() << std::flush;
	while (!game.getState().isFinished() && !stalled) {
		if (options.maxMoves > 0 && played >= options.maxMoves) {
			logger.info("SelfPlay", "move limit reached");
			game.stop();
			break;
		}
		game.tick();
		std::this_thread::sleep_for(std::chrono::milliseconds(5));
	}

	const GameState& state = game.getState();
	std::cout << "Result: " << statusName(state.status) << " after " << state.getHistory().size() << " moves" << std::endl;
	for (const std::string& issue : state.validateState()) {
		logger.error("SelfPlay", issue);
	}
	return stalled ? 2 : 0;
}
