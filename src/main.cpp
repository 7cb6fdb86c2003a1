#include "CommandLine.hpp"
#include "EventBus.hpp"
#include "GameController.hpp"
#include "Logger.hpp"
#include "SdlApp.hpp"
#include "UiLayout.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

int main(int argc, char** argv) {
	CommandLineOptions options;
	try {
		options = parseCommandLine(argc, argv, true);
	} catch (const std::invalid_argument& error) {
		std::cerr << error.what() << std::endl;
		printUsage(argv[0], true);
		return 1;
	}
	if (options.showHelp) {
		printUsage(argv[0], true);
		return 0;
	}
	Logger logger(std::cout, logLevelFor(options));
	EventBus events;
	events.subscribe(GameEvent::Type::AiThinkingFailed, [&logger](const GameEvent& event) {
		logger.warn("Main", std::string("AI for ") + playerName(event.player) + " could not move: " + event.message);
	});
	GameController controller(options.settings, logger, events);
	UiLayout layout(options.settings.boardSize);
	SdlApp app(controller, layout, logger);
	app.run();
	return 0;
}
