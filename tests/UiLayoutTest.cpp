#include <gtest/gtest.h>

#include "UiLayout.hpp"

TEST(UiLayoutTest, DefaultWindowCentresTheGrid) {
	UiLayout layout;
	EXPECT_EQ(layout.boardSize, 15);
	EXPECT_EQ(layout.cellSize, 52);
	EXPECT_EQ(layout.stoneRadius, 20);
	EXPECT_EQ(layout.statusBarTop(), 816);
	int px = 0;
	int py = 0;
	layout.cellCenter(0, 0, px, py);
	EXPECT_EQ(px, 56);
	EXPECT_EQ(py, 44);
	layout.cellCenter(7, 7, px, py);
	EXPECT_EQ(px, 420);
	EXPECT_EQ(py, 408);
}

TEST(UiLayoutTest, ClicksSnapOnlyInsideStoneRadius) {
	UiLayout layout;
	int x = -1;
	int y = -1;
	ASSERT_TRUE(layout.pixelToCell(425, 403, x, y));
	EXPECT_EQ(x, 7);
	EXPECT_EQ(y, 7);

	x = -1;
	EXPECT_FALSE(layout.pixelToCell(446, 408, x, y));
	EXPECT_EQ(x, -1);
	EXPECT_FALSE(layout.pixelToCell(0, 0, x, y));
	EXPECT_FALSE(layout.pixelToCell(420, 830, x, y));
}

TEST(UiLayoutTest, ResizeRecomputesGeometry) {
	UiLayout layout;
	layout.updateForWindow(400, 424, 9);
	EXPECT_EQ(layout.cellSize, 40);
	EXPECT_EQ(layout.boardX, 40);
	EXPECT_EQ(layout.boardY, 40);
	int x = 0;
	int y = 0;
	ASSERT_TRUE(layout.pixelToCell(360, 360, x, y));
	EXPECT_EQ(x, 8);
	EXPECT_EQ(y, 8);
}
