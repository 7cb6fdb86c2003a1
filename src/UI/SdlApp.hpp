#ifndef SDLAPP_HPP
#define SDLAPP_HPP

#include <SDL2/SDL.h>

#include "BoardRenderer.hpp"
#include "GameController.hpp"
#include "Logger.hpp"
#include "UiLayout.hpp"

// Window, event loop and key bindings: U undo, H hint, P pause/resume, N new game,
// S stop, Esc quit.
class SdlApp {
public:
	SdlApp(GameController& controller, const UiLayout& layout, Logger& logger);
	~SdlApp();

	bool init();
	void run();

private:
	GameController& controller;
	UiLayout layout;
	BoardRenderer renderer;
	Logger& logger;
	SDL_Window* window;
	SDL_Renderer* sdlRenderer;
	bool running;
	bool sdlInitialized;

	void handleEvent(const SDL_Event& event);
	void handleKey(SDL_Keycode key);
	void render();
	void updateTitle();
	void shutdown();
};

#endif
