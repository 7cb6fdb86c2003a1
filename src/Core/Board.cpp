#include "Board.hpp"

#include <iomanip>
#include <sstream>

Board::Board() : size(0) {
}

Board::Board(int boardSize) : size(0) {
	reset(boardSize);
}

Board::Cell Board::at(int x, int y) const {
	return cells[index(x, y)];
}

bool Board::tryGet(int x, int y, Cell& out) const {
	if (!inBounds(x, y)) {
		return false;
	}
	out = at(x, y);
	return true;
}

void Board::set(int x, int y, Cell value) {
	cells[index(x, y)] = value;
}

void Board::remove(int x, int y) {
	cells[index(x, y)] = Cell::Empty;
}

bool Board::inBounds(int x, int y) const {
	return x >= 0 && y >= 0 && x < size && y < size;
}

bool Board::isEmpty(int x, int y) const {
	return inBounds(x, y) && at(x, y) == Cell::Empty;
}

int Board::countEmpty() const {
	int count = 0;
	for (size_t i = 0; i < cells.size(); ++i) {
		if (cells[i] == Cell::Empty) {
			++count;
		}
	}
	return count;
}

int Board::countStones() const {
	return static_cast<int>(cells.size()) - countEmpty();
}

void Board::reset(int boardSize) {
	size = boardSize;
	cells.assign(static_cast<size_t>(size * size), Cell::Empty);
}

int Board::getSize() const {
	return size;
}

// Column numbers on top, row numbers on the left; 'X' black, 'O' white.
std::string Board::toAscii() const {
	std::ostringstream out;
	out << "   ";
	for (int x = 0; x < size; ++x) {
		out << std::setw(2) << x << ' ';
	}
	out << '\n';
	for (int y = 0; y < size; ++y) {
		out << std::setw(2) << y << ' ';
		for (int x = 0; x < size; ++x) {
			Cell cell = at(x, y);
			char symbol = (cell == Cell::Black) ? 'X' : (cell == Cell::White) ? 'O' : '.';
			out << ' ' << symbol << ' ';
		}
		out << '\n';
	}
	return out.str();
}

bool Board::operator==(const Board& other) const {
	return size == other.size && cells == other.cells;
}

bool Board::operator!=(const Board& other) const {
	return !(*this == other);
}

int Board::index(int x, int y) const {
	return y * size + x;
}
