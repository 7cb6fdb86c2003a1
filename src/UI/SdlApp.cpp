#include "SdlApp.hpp"

#include <string>

SdlApp::SdlApp(GameController& controllerIn, const UiLayout& layoutIn, Logger& loggerIn)
	: controller(controllerIn),
	  layout(layoutIn),
	  renderer(),
	  logger(loggerIn),
	  window(nullptr),
	  sdlRenderer(nullptr),
	  running(false),
	  sdlInitialized(false) {
}

SdlApp::~SdlApp() {
	shutdown();
}

void SdlApp::shutdown() {
	if (sdlRenderer) {
		SDL_DestroyRenderer(sdlRenderer);
		sdlRenderer = nullptr;
	}
	if (window) {
		SDL_DestroyWindow(window);
		window = nullptr;
	}
	if (sdlInitialized) {
		SDL_Quit();
		sdlInitialized = false;
	}
}

bool SdlApp::init() {
	if (SDL_Init(SDL_INIT_VIDEO) != 0) {
		logger.error("UI", std::string("SDL_Init failed: ") + SDL_GetError());
		return false;
	}
	sdlInitialized = true;
	window = SDL_CreateWindow("Renju", SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
		layout.windowWidth, layout.windowHeight, SDL_WINDOW_SHOWN | SDL_WINDOW_RESIZABLE);
	if (!window) {
		logger.error("UI", std::string("SDL_CreateWindow failed: ") + SDL_GetError());
		shutdown();
		return false;
	}
	sdlRenderer = SDL_CreateRenderer(window, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
	if (!sdlRenderer) {
		logger.error("UI", std::string("SDL_CreateRenderer failed: ") + SDL_GetError());
		shutdown();
		return false;
	}
	return true;
}

void SdlApp::run() {
	if (!init()) {
		return;
	}
	running = true;
	while (running) {
		SDL_Event event;
		while (SDL_PollEvent(&event)) {
			handleEvent(event);
		}
		controller.tick();
		updateTitle();
		render();
		SDL_Delay(16);
	}
	controller.onStop();
	shutdown();
}

void SdlApp::handleEvent(const SDL_Event& event) {
	switch (event.type) {
	case SDL_QUIT:
		running = false;
		break;
	case SDL_KEYDOWN:
		handleKey(event.key.keysym.sym);
		break;
	case SDL_WINDOWEVENT:
		if (event.window.event == SDL_WINDOWEVENT_SIZE_CHANGED) {
			layout.updateForWindow(event.window.data1, event.window.data2, layout.boardSize);
		}
		break;
	case SDL_MOUSEBUTTONDOWN:
		if (event.button.button == SDL_BUTTON_LEFT) {
			int x = 0;
			int y = 0;
			if (layout.pixelToCell(event.button.x, event.button.y, x, y)) {
				controller.onCellClicked(x, y);
			}
		}
		break;
	default:
		break;
	}
}

void SdlApp::handleKey(SDL_Keycode key) {
	switch (key) {
	case SDLK_ESCAPE:
		running = false;
		break;
	case SDLK_u:
		controller.onUndo();
		break;
	case SDLK_h:
		controller.onHint();
		break;
	case SDLK_p:
		controller.onTogglePause();
		break;
	case SDLK_n:
		controller.onNewGame();
		break;
	case SDLK_s:
		controller.onStop();
		break;
	default:
		break;
	}
}

void SdlApp::render() {
	SDL_SetRenderDrawColor(sdlRenderer, 210, 180, 140, 255);
	SDL_RenderClear(sdlRenderer);
	RenderOverlay overlay;
	Board ghostCopy;
	if (controller.hasGhostBoard()) {
		ghostCopy = controller.ghostBoard();
		overlay.ghostBoard = &ghostCopy;
	}
	overlay.hasHint = controller.hasHint();
	overlay.hint = controller.hintMove();
	renderer.render(sdlRenderer, controller.state(), layout, overlay);
	SDL_RenderPresent(sdlRenderer);
}

void SdlApp::updateTitle() {
	std::string title = controller.statusText();
	SDL_SetWindowTitle(window, title.c_str());
}
