#include "Board.hpp"

#include <algorithm>
#include <string>

namespace {

Mark check_rows(const Board::Grid& g)
{
    for (const auto& row : g) {
        if (row[0] != Mark::Empty && row[0] == row[1] && row[1] == row[2]) {
            return row[0];
        }
    }
    return Mark::Empty;
}

Mark check_columns(const Board::Grid& g)
{
    for (int c = 0; c < Board::kSize; ++c) {
        if (g[0][c] != Mark::Empty && g[0][c] == g[1][c] && g[1][c] == g[2][c]) {
            return g[0][c];
        }
    }
    return Mark::Empty;
}

Mark check_diagonals(const Board::Grid& g)
{
    if (g[0][0] != Mark::Empty && g[0][0] == g[1][1] && g[1][1] == g[2][2]) {
        return g[0][0];
    }
    if (g[0][2] != Mark::Empty && g[0][2] == g[1][1] && g[1][1] == g[2][0]) {
        return g[0][2];
    }
    return Mark::Empty;
}

} // namespace

Board::Board()
{
    clear();
}

bool Board::in_bounds(int row, int col)
{
    return row >= 0 && row < kSize && col >= 0 && col < kSize;
}

bool Board::is_empty(int row, int col) const
{
    return grid_[row][col] == Mark::Empty;
}

bool Board::place(int row, int col, Mark mark)
{
    if (mark == Mark::Empty || !in_bounds(row, col) || !is_empty(row, col)) {
        return false;
    }
    grid_[row][col] = mark;
    return true;
}

bool Board::is_full() const
{
    return filled_count() == static_cast<std::size_t>(kSize * kSize);
}

std::size_t Board::filled_count() const
{
    std::size_t count = 0;
    for (const auto& row : grid_) {
        count += static_cast<std::size_t>(
            std::count_if(row.begin(), row.end(), [](Mark m) { return m != Mark::Empty; }));
    }
    return count;
}

void Board::clear()
{
    for (auto& row : grid_) {
        row.fill(Mark::Empty);
    }
}

std::string Board::to_string() const
{
    std::string out = "[";
    for (int r = 0; r < kSize; ++r) {
        if (r > 0) out += ", ";
        out += "[";
        for (int c = 0; c < kSize; ++c) {
            if (c > 0) out += ", ";
            out += std::to_string(static_cast<int>(grid_[r][c]));
        }
        out += "]";
    }
    out += "]";
    return out;
}

Mark check_winner(const Board& board)
{
    const auto& g = board.grid();
    if (Mark m = check_rows(g); m != Mark::Empty) return m;
    if (Mark m = check_columns(g); m != Mark::Empty) return m;
    return check_diagonals(g);
}
