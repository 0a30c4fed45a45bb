/**
 * @file Board.hpp
 * @brief 3x3 틱택토 보드와 승패 판정 함수를 정의합니다.
 */
#pragma once

#include <array>
#include <cstddef>
#include <string>

/**
 * @brief 보드 칸의 값.
 * @details 정수 값은 와이어 프로토콜의 보드 직렬화 형식(0, 1, 2)과 일치해야 합니다.
 */
enum class Mark : int {
    Empty = 0,     ///< 빈 칸
    PlayerOne = 1, ///< 플레이어 1의 말
    PlayerTwo = 2  ///< 플레이어 2의 말
};

/**
 * @class Board
 * @brief 3x3 게임 보드.
 * @details 좌표는 0부터 시작하는 (row, col)입니다.
 *          `GameRoom`의 strand 안에서만 수정되며, 그 밖에서는 복사본만 읽습니다.
 */
class Board {
public:
    static constexpr int kSize = 3;
    using Grid = std::array<std::array<Mark, kSize>, kSize>;

    Board();

    /**
     * @brief 좌표가 보드 범위 안에 있는지 확인합니다.
     * @param row 행 (0-based).
     * @param col 열 (0-based).
     * @return 0 <= row, col < 3 이면 true.
     */
    static bool in_bounds(int row, int col);

    /**
     * @brief 해당 칸이 비어 있는지 확인합니다.
     * @pre in_bounds(row, col)
     */
    bool is_empty(int row, int col) const;

    /**
     * @brief 말을 놓습니다.
     * @param row 행.
     * @param col 열.
     * @param mark 놓을 말 (Empty 불가).
     * @return 범위를 벗어났거나, 칸이 이미 차 있거나, mark가 Empty이면 false를 반환하고 보드는 변경되지 않습니다.
     */
    bool place(int row, int col, Mark mark);

    Mark at(int row, int col) const { return grid_[row][col]; }

    /// 빈 칸이 하나도 없으면 true.
    bool is_full() const;

    /// 놓인 말의 개수.
    std::size_t filled_count() const;

    /// 모든 칸을 비웁니다.
    void clear();

    const Grid& grid() const { return grid_; }

    /**
     * @brief 와이어 프로토콜용 직렬화.
     * @return `[[0, 0, 0], [0, 1, 0], [0, 0, 2]]` 형태의 행 우선 중첩 리스트 문자열.
     */
    std::string to_string() const;

private:
    Grid grid_;
};

/**
 * @brief 승자를 판정합니다.
 * @details 행 3개, 열 3개, 대각선 2개(주대각선, 반대각선) 순서로 검사하여
 *          같은 비어있지 않은 말 세 개가 처음 발견된 줄의 말을 반환합니다.
 *          한 수로 여러 줄이 동시에 완성되는 경우에도 이 우선순위(행 > 열 > 대각선)를 따릅니다.
 * @param board 검사할 보드.
 * @return 승자의 말, 승자가 없으면 `Mark::Empty`.
 */
Mark check_winner(const Board& board);
