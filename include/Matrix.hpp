#pragma once
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

// Row-major cost/time grid: rows are agents, columns are tasks.
using Matrix = std::vector<std::vector<double>>;

enum class Criterion
{
    Cost,   // minimise the entries as given
    Time    // maximise the entries (solved as max - entry)
};

struct InvalidCriterion : std::invalid_argument
{
    using std::invalid_argument::invalid_argument;
};

struct ShapeError : std::invalid_argument
{
    using std::invalid_argument::invalid_argument;
};

/** Throws ShapeError unless m has at least one row and column and no ragged rows. */
void check_rectangular(const Matrix& m);

/** Throws ShapeError unless m is a non-empty N x N matrix. */
inline void check_square(const Matrix& m, const char* who)
{
    const size_t n = m.size();
    for (size_t i = 0; i < n; ++i) {
        if (m[i].size() != n) {
            std::ostringstream msg;
            msg << who << " needs a square matrix, row " << i
                << " has " << m[i].size() << " entries for " << n << " rows";
            throw ShapeError(msg.str());
        }
    }
    if (n == 0) throw ShapeError(std::string(who) + " needs a non-empty matrix");
}

/** Lower-cased text with surrounding blanks removed; inner blanks are kept. */
std::string keyword(const std::string& text);

/** "cost" / "time" (or "costo" / "tiempo"), case and surrounding blanks ignored. */
Criterion parse_criterion(const std::string& text);
std::string to_string(Criterion c);

/**
 * Cost leaves the matrix untouched. Time replaces every entry with
 * (max entry - entry) so that the largest times become the cheapest.
 */
Matrix transform_matrix(const Matrix& m, Criterion c);

/**
 * Pads m with trailing zero rows (more tasks than agents) or trailing
 * zero columns (more agents than tasks) up to max(rows, cols) square.
 */
Matrix balance_matrix(const Matrix& m);
