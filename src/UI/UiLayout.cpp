#include "UiLayout.hpp"

#include <algorithm>
#include <cmath>

namespace {
const int kDefaultWindow = 840;
const int kMinCellSize = 18;
}  // namespace

UiLayout::UiLayout() : UiLayout(15) {
}

UiLayout::UiLayout(int boardSizeIn) {
	int window = std::max(kDefaultWindow, (boardSizeIn + 3) * kMinCellSize);
	updateForWindow(window, window, boardSizeIn);
}

// The grid is drawn on intersections, so N lines span N - 1 cells.
void UiLayout::updateForWindow(int width, int height, int boardSizeIn) {
	windowWidth = width;
	windowHeight = height;
	padding = 40;
	statusBarHeight = 24;
	boardSize = std::max(2, boardSizeIn);
	int usableHeight = height - statusBarHeight;
	int minSize = std::min(width, usableHeight);
	cellSize = std::max(1, (minSize - padding * 2) / (boardSize - 1));
	boardPixelSize = cellSize * (boardSize - 1);
	boardX = (width - boardPixelSize) / 2;
	boardY = (usableHeight - boardPixelSize) / 2;
	stoneRadius = cellSize * 4 / 10;
}

// Clicks snap to the nearest intersection only inside the stone radius.
bool UiLayout::pixelToCell(int px, int py, int& outX, int& outY) const {
	int x = static_cast<int>(std::lround((px - boardX) / static_cast<double>(cellSize)));
	int y = static_cast<int>(std::lround((py - boardY) / static_cast<double>(cellSize)));
	if (x < 0 || y < 0 || x >= boardSize || y >= boardSize) {
		return false;
	}
	int cx = 0;
	int cy = 0;
	cellCenter(x, y, cx, cy);
	int dx = px - cx;
	int dy = py - cy;
	if (dx * dx + dy * dy > stoneRadius * stoneRadius) {
		return false;
	}
	outX = x;
	outY = y;
	return true;
}

void UiLayout::cellCenter(int x, int y, int& outPx, int& outPy) const {
	outPx = boardX + x * cellSize;
	outPy = boardY + y * cellSize;
}

int UiLayout::statusBarTop() const {
	return windowHeight - statusBarHeight;
}
