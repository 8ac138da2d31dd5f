#pragma once
#include "bay_grid.hpp"

#include <string>
#include <vector>

// Where a bay ends up in the 2D picture. Lanes alternate direction, so on odd
// rows the column runs right-to-left.
struct Cell {
    int row;
    int col;
};

// Bay indices in drawing order: row 0 left-to-right, row 1 right-to-left, ...
std::vector<int> snakeOrder(int laneSize);

Cell snakeCell(int index, int laneSize);

// Inverse of snakeCell.
int snakeIndex(Cell cell, int laneSize);

// laneSize lines of laneSize glyphs, each line ending in '\n'.
std::string renderLanes(const BayGrid& grid);
