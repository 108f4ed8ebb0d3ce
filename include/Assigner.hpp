#pragma once
#include "Matrix.hpp"
#include <string>
#include <vector>

struct Match
{
    int agent;   // row of the working matrix
    int task;    // column of the working matrix
};

struct Solution
{
    std::vector<Match> matches;   // one per agent, every task used once
    double             total_cost = 0.0;
};

enum class Method
{
    Exact,    // Kuhn–Munkres, always optimal
    Greedy    // cheapest-first, may cost more than Exact
};

/** "exact" / "greedy", also accepts "munkres" / "manual". */
Method parse_method(const std::string& text);
std::string to_string(Method m);

// ─── stateless entry points ──────────────────────────────────────────

/**
 * Checks the criterion, then the shape, then transforms and pads.
 * Throws InvalidCriterion or ShapeError.
 */
Matrix prepare_working_matrix(const Matrix& raw, Criterion c);
Matrix prepare_working_matrix(const Matrix& raw, const std::string& criterion);

/** Optimal assignment of a square matrix, matches ordered by agent. */
Solution solve_exact(const Matrix& working);

/**
 * Greedy assignment of a square matrix, matches in the order they were
 * picked. Not optimal in general: compare against solve_exact() rather
 * than expecting equal totals.
 */
Solution solve_greedy(const Matrix& working);

// ─── session ─────────────────────────────────────────────────────────

class Assigner
{
public:
    Assigner(const Matrix& raw, Criterion criterion);

    Solution solve_exact() const;
    Solution solve_greedy() const;
    Solution solve(Method method) const;

    /** True when the match lands on a zero row or column added by padding. */
    bool is_padding(const Match& m) const;

    const Matrix& working() const { return working_; }
    Criterion criterion() const { return criterion_; }
    int rows() const { return rows_; }
    int cols() const { return cols_; }

private:
    Criterion criterion_;
    Matrix    working_;       // built first, it validates raw
    int       rows_, cols_;   // shape of the raw input
};
