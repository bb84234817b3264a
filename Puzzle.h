#ifndef PUZZLE_H
#define PUZZLE_H

#include <cstdint>
#include <vector>

#define GRID_SIDE  9
#define BOX_SIDE   3
#define GRID_CELLS (GRID_SIDE*GRID_SIDE)

/* Row-major 9x9 grid. 0 marks a blank cell of a puzzle */
typedef std::vector<uint32_t> Grid;

/* The puzzle both parties know */
const Grid& sudoku_puzzle();
/* Its solution. Only the prover should read this */
const Grid& sudoku_solution();

void Grid_check(const Grid& g, bool allow_blank);
void Grid_check_agrees(const Grid& puzzle, const Grid& solution);

#endif //PUZZLE_H
