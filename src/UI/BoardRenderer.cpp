#include "BoardRenderer.hpp"


namespace {
const SDL_Color kBlackStone = { 20, 20, 20, 255 };
const SDL_Color kWhiteStone = { 240, 240, 240, 255 };
const SDL_Color kMarker = { 220, 30, 30, 255 };
const SDL_Color kHint = { 30, 140, 220, 255 };
}  // namespace

void BoardRenderer::render(SDL_Renderer* renderer, const GameState& state, const UiLayout& layout,
	const RenderOverlay& overlay) {
	drawGrid(renderer, layout);
	drawStarPoints(renderer, layout);
	if (overlay.ghostBoard) {
		drawGhostStones(renderer, state, layout, *overlay.ghostBoard);
	}
	drawStones(renderer, state, layout);
	if (overlay.hasHint && state.board.isEmpty(overlay.hint.x, overlay.hint.y)) {
		drawHint(renderer, layout, overlay.hint);
	}
	drawWinLine(renderer, state, layout);
	drawStatusBar(renderer, state, layout);
}

void BoardRenderer::drawGrid(SDL_Renderer* renderer, const UiLayout& layout) {
	SDL_SetRenderDrawColor(renderer, 40, 24, 12, 255);
	int startX = layout.boardX;
	int startY = layout.boardY;
	int endX = layout.boardX + layout.boardPixelSize;
	int endY = layout.boardY + layout.boardPixelSize;
	for (int i = 0; i < layout.boardSize; ++i) {
		int x = startX + i * layout.cellSize;
		int y = startY + i * layout.cellSize;
		SDL_RenderDrawLine(renderer, x, startY, x, endY);
		SDL_RenderDrawLine(renderer, startX, y, endX, y);
	}
}

// Centre point plus the four 3-3 points on boards large enough to have them.
void BoardRenderer::drawStarPoints(SDL_Renderer* renderer, const UiLayout& layout) {
	SDL_Color color = { 40, 24, 12, 255 };
	int center = layout.boardSize / 2;
	int radius = layout.cellSize / 8 + 1;
	int px = 0;
	int py = 0;
	layout.cellCenter(center, center, px, py);
	drawFilledCircle(renderer, px, py, radius, color);
	if (layout.boardSize < 13) {
		return;
	}
	int low = 3;
	int high = layout.boardSize - 4;
	const int points[4][2] = { { low, low }, { high, low }, { low, high }, { high, high } };
	for (const auto& point : points) {
		layout.cellCenter(point[0], point[1], px, py);
		drawFilledCircle(renderer, px, py, radius, color);
	}
}

void BoardRenderer::drawStones(SDL_Renderer* renderer, const GameState& state, const UiLayout& layout) {
	for (int y = 0; y < state.board.getSize(); ++y) {
		for (int x = 0; x < state.board.getSize(); ++x) {
			Board::Cell cell = state.board.at(x, y);
			if (cell == Board::Cell::Empty) {
				continue;
			}
			int px = 0;
			int py = 0;
			layout.cellCenter(x, y, px, py);
			drawFilledCircle(renderer, px, py, layout.stoneRadius, (cell == Board::Cell::Black) ? kBlackStone : kWhiteStone);
		}
	}

	if (state.hasLastMove) {
		int px = 0;
		int py = 0;
		layout.cellCenter(state.lastMove.x, state.lastMove.y, px, py);
		drawFilledCircle(renderer, px, py, layout.stoneRadius / 3, kMarker);
	}
}

// Stones the AI is currently examining, drawn translucent where the real board is empty.
void BoardRenderer::drawGhostStones(SDL_Renderer* renderer, const GameState& state, const UiLayout& layout,
	const Board& ghostBoard) {
	if (ghostBoard.getSize() != state.board.getSize()) {
		return;
	}
	SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);
	for (int y = 0; y < ghostBoard.getSize(); ++y) {
		for (int x = 0; x < ghostBoard.getSize(); ++x) {
			Board::Cell cell = ghostBoard.at(x, y);
			if (cell == Board::Cell::Empty || !state.board.isEmpty(x, y)) {
				continue;
			}
			int px = 0;
			int py = 0;
			layout.cellCenter(x, y, px, py);
			SDL_Color color = (cell == Board::Cell::Black) ? kBlackStone : kWhiteStone;
			color.a = 90;
			drawFilledCircle(renderer, px, py, layout.stoneRadius, color);
		}
	}
	SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_NONE);
}

void BoardRenderer::drawHint(SDL_Renderer* renderer, const UiLayout& layout, const Move& hint) {
	int px = 0;
	int py = 0;
	layout.cellCenter(hint.x, hint.y, px, py);
	drawCircleOutline(renderer, px, py, layout.stoneRadius, kHint);
	drawCircleOutline(renderer, px, py, layout.stoneRadius - 1, kHint);
}

void BoardRenderer::drawWinLine(SDL_Renderer* renderer, const GameState& state, const UiLayout& layout) {
	bool won = state.status == GameState::Status::BlackWon || state.status == GameState::Status::WhiteWon;
	if (!won || state.winningLine.size() < 2) {
		return;
	}
	for (const Move& move : state.winningLine) {
		int px = 0;
		int py = 0;
		layout.cellCenter(move.x, move.y, px, py);
		drawCircleOutline(renderer, px, py, layout.stoneRadius, kMarker);
	}
	int x1 = 0;
	int y1 = 0;
	int x2 = 0;
	int y2 = 0;
	layout.cellCenter(state.winningLine.front().x, state.winningLine.front().y, x1, y1);
	layout.cellCenter(state.winningLine.back().x, state.winningLine.back().y, x2, y2);
	SDL_SetRenderDrawColor(renderer, kMarker.r, kMarker.g, kMarker.b, kMarker.a);
	for (int offset = -1; offset <= 1; ++offset) {
		SDL_RenderDrawLine(renderer, x1 + offset, y1, x2 + offset, y2);
		SDL_RenderDrawLine(renderer, x1, y1 + offset, x2, y2 + offset);
	}
}

// A strip under the board in the colour of the side to move, or of the winner.
void BoardRenderer::drawStatusBar(SDL_Renderer* renderer, const GameState& state, const UiLayout& layout) {
	SDL_Color color = (state.toMove == PlayerColor::Black) ? kBlackStone : kWhiteStone;
	if (state.status == GameState::Status::BlackWon) {
		color = kBlackStone;
	} else if (state.status == GameState::Status::WhiteWon) {
		color = kWhiteStone;
	} else if (state.status == GameState::Status::Draw || state.status == GameState::Status::Stopped) {
		color = SDL_Color{ 128, 128, 128, 255 };
	} else if (state.status == GameState::Status::Paused) {
		color = SDL_Color{ 196, 150, 60, 255 };
	}
	SDL_Rect bar = { 0, layout.statusBarTop(), layout.windowWidth, layout.statusBarHeight };
	SDL_SetRenderDrawColor(renderer, color.r, color.g, color.b, color.a);
	SDL_RenderFillRect(renderer, &bar);
}

void BoardRenderer::drawFilledCircle(SDL_Renderer* renderer, int cx, int cy, int radius, SDL_Color color) {
	SDL_SetRenderDrawColor(renderer, color.r, color.g, color.b, color.a);
	for (int dy = -radius; dy <= radius; ++dy) {
		for (int dx = -radius; dx <= radius; ++dx) {
			if (dx * dx + dy * dy <= radius * radius) {
				SDL_RenderDrawPoint(renderer, cx + dx, cy + dy);
			}
		}
	}
}

void BoardRenderer::drawCircleOutline(SDL_Renderer* renderer, int cx, int cy, int radius, SDL_Color color) {
	SDL_SetRenderDrawColor(renderer, color.r, color.g, color.b, color.a);
	int x = radius;
	int y = 0;
	int err = 0;
	while (x >= y) {
		SDL_RenderDrawPoint(renderer, cx + x, cy + y);
		SDL_RenderDrawPoint(renderer, cx + y, cy + x);
		SDL_RenderDrawPoint(renderer, cx - y, cy + x);
		SDL_RenderDrawPoint(renderer, cx - x, cy + y);
		SDL_RenderDrawPoint(renderer, cx - x, cy - y);
		SDL_RenderDrawPoint(renderer, cx - y, cy - x);
		SDL_RenderDrawPoint(renderer, cx + y, cy - x);
		SDL_RenderDrawPoint(renderer, cx + x, cy - y);
		++y;
		err += 1 + 2 * y;
		if (2 * (err - x) + 1 > 0) {
			--x;
			err += 1 - 2 * x;
		}
	}
}
