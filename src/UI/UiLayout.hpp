#ifndef UILAYOUT_HPP
#define UILAYOUT_HPP

// Window geometry for an N x N grid drawn on intersections, plus the mapping
// between window pixels and board cells.
class UiLayout {
public:
	int windowWidth;
	int windowHeight;
	int padding;
	int statusBarHeight;
	int boardPixelSize;
	int cellSize;
	int stoneRadius;
	int boardX;
	int boardY;
	int boardSize;

	UiLayout();
	explicit UiLayout(int boardSizeIn);
	void updateForWindow(int width, int height, int boardSizeIn);

	bool pixelToCell(int px, int py, int& outX, int& outY) const;
	void cellCenter(int x, int y, int& outPx, int& outPy) const;
	int statusBarTop() const;
};

#endif
