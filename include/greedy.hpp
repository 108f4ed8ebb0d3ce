// greedy.hpp - single-header minimum-first assignment (square matrix).
#pragma once
#include "Matrix.hpp"
#include <utility>
#include <vector>

// Picks the smallest entry among the rows and columns still free, takes that
// (row, col) pair and retires both lines; N picks for an N x N matrix.
// Equal minima go to the first one in row-major order.
//
// This is a heuristic: total_cost can be strictly higher than what
// hungarian() finds on the same matrix.
//
// pairs are returned in the order they were picked.
inline void greedy(const Matrix& cost,
                   std::vector<std::pair<int, int>>& pairs,
                   double& total_cost)
{
    check_square(cost, "greedy");
    int n = cost.size();
    std::vector<char> row_free(n, true), col_free(n, true);

    pairs.clear();
    pairs.reserve(n);
    total_cost = 0.0;

    for(int k=0;k<n;++k){
        int best_r = -1, best_c = -1;
        for(int r=0;r<n;++r) if(row_free[r]){
            for(int c=0;c<n;++c) if(col_free[c]){
                if(best_r < 0 || cost[r][c] < cost[best_r][best_c]) { best_r = r; best_c = c; }
            }
        }
        row_free[best_r] = false;
        col_free[best_c] = false;
        pairs.emplace_back(best_r, best_c);
        total_cost += cost[best_r][best_c];
    }
}
