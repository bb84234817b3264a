#include "Puzzle.h"

#include <stdexcept>
#include <kernel/yosys.h>

USING_YOSYS_NAMESPACE

const Grid& sudoku_puzzle() {
  static const Grid puzzle = {
    7, 4, 0,  3, 0, 5,  2, 1, 0,
    0, 0, 0,  7, 0, 0,  5, 6, 0,
    0, 0, 0,  0, 8, 1,  0, 7, 0,

    0, 1, 0,  0, 2, 8,  0, 0, 7,
    2, 0, 0,  0, 4, 0,  0, 0, 6,
    9, 0, 0,  6, 3, 0,  0, 5, 0,

    0, 6, 0,  8, 5, 0,  0, 0, 0,
    0, 3, 1,  0, 0, 2,  0, 0, 0,
    0, 7, 2,  9, 0, 6,  0, 8, 3,
  };
  return puzzle;
}

const Grid& sudoku_solution() {
  static const Grid solution = {
    7, 4, 8,  3, 6, 5,  2, 1, 9,
    1, 2, 3,  7, 9, 4,  5, 6, 8,
    6, 9, 5,  2, 8, 1,  3, 7, 4,

    3, 1, 6,  5, 2, 8,  9, 4, 7,
    2, 5, 7,  1, 4, 9,  8, 3, 6,
    9, 8, 4,  6, 3, 7,  1, 5, 2,

    4, 6, 9,  8, 5, 3,  7, 2, 1,
    8, 3, 1,  4, 7, 2,  6, 9, 5,
    5, 7, 2,  9, 1, 6,  4, 8, 3,
  };
  return solution;
}

void Grid_check(const Grid& g, bool allow_blank) {
  if(g.size()!=GRID_CELLS) {
    throw std::runtime_error(stringf("Grid has %zu cells instead of %d\n", g.size(), GRID_CELLS));
  }
  uint32_t lowest=allow_blank?0:1;
  for(size_t i=0; i<g.size(); i++) {
    if(g[i]<lowest || g[i]>GRID_SIDE) {
      throw std::runtime_error(stringf("Grid cell %zu holds out of range value %u\n", i, g[i]));
    }
  }
}

void Grid_check_agrees(const Grid& puzzle, const Grid& solution) {
  Grid_check(puzzle, true);
  Grid_check(solution, false);
  for(size_t i=0; i<puzzle.size(); i++) {
    if(puzzle[i]!=0 && puzzle[i]!=solution[i]) {
      throw std::runtime_error(stringf("Solution changes fixed puzzle cell %zu\n", i));
    }
  }
}
