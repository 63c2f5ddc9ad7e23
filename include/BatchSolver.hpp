#ifndef BATCHSOLVER_HPP
#define BATCHSOLVER_HPP

#include "LineSolver.hpp"
#include <vector>

// Batched solver function
// Solves all line cases in the vector using OpenMP parallelization
// Returns a vector of LineSolutions in the same order as the input cases
std::vector<LineSolution> solve_batch(const std::vector<LineCase>& cases);

#endif // BATCHSOLVER_HPP
