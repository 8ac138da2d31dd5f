#include "lane_renderer.hpp"

std::vector<int> snakeOrder(int laneSize)
{
    std::vector<int> order;
    if (laneSize <= 0) return order;
    order.reserve(static_cast<std::size_t>(laneSize) * laneSize);

    for (int row = 0; row < laneSize; ++row) {
        const int first = row * laneSize;
        const int last  = first + laneSize - 1;

        if (row % 2 == 0) {
            // -->
            for (int i = first; i <= last; ++i) order.push_back(i);
        } else {
            // <-- cars turned around at the end of the previous lane
            for (int i = last; i >= first; --i) order.push_back(i);
        }
    }
    return order;
}

Cell snakeCell(int index, int laneSize)
{
    const int row = index / laneSize;
    const int off = index % laneSize;
    return Cell{ row, (row % 2 == 0) ? off : laneSize - 1 - off };
}

int snakeIndex(Cell cell, int laneSize)
{
    const int off = (cell.row % 2 == 0) ? cell.col : laneSize - 1 - cell.col;
    return cell.row * laneSize + off;
}

std::string renderLanes(const BayGrid& grid)
{
    const int n = grid.laneSize();

    std::string out;
    out.reserve(static_cast<std::size_t>(n) * (n + 1));

    int column = 0;
    for (int index : snakeOrder(n)) {
        out += bayGlyph(grid.at(index));
        if (++column == n) {
            out += '\n';
            column = 0;
        }
    }
    return out;
}
