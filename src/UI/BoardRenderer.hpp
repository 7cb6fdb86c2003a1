#ifndef BOARDRENDERER_HPP
#define BOARDRENDERER_HPP

#include <SDL2/SDL.h>

#include "GameState.hpp"
#include "UiLayout.hpp"

struct RenderOverlay {
	const Board* ghostBoard = nullptr;
	bool hasHint = false;
	Move hint;
};

class BoardRenderer {
public:
	void render(SDL_Renderer* renderer, const GameState& state, const UiLayout& layout, const RenderOverlay& overlay);

private:
	void drawGrid(SDL_Renderer* renderer, const UiLayout& layout);
	void drawStarPoints(SDL_Renderer* renderer, const UiLayout& layout);
	void drawStones(SDL_Renderer* renderer, const GameState& state, const UiLayout& layout);
	void drawGhostStones(SDL_Renderer* renderer, const GameState& state, const UiLayout& layout, const Board& ghostBoard);
	void drawHint(SDL_Renderer* renderer, const UiLayout& layout, const Move& hint);
	void drawWinLine(SDL_Renderer* renderer, const GameState& state, const UiLayout& layout);
	void drawStatusBar(SDL_Renderer* renderer, const GameState& state, const UiLayout& layout);
	void drawFilledCircle(SDL_Renderer* renderer, int cx, int cy, int radius, SDL_Color color);
	void drawCircleOutline(SDL_Renderer* renderer, int cx, int cy, int radius, SDL_Color color);
};

#endif
