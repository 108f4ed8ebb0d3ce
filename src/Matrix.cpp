#include "Matrix.hpp"
#include <algorithm>
#include <cctype>
#include <limits>

using namespace std;

void check_rectangular(const Matrix& m)
{
    if (m.empty() || m[0].empty())
        throw ShapeError("matrix needs at least one row and one column");

    const size_t cols = m[0].size();
    for (size_t i = 1; i < m.size(); ++i) {
        if (m[i].size() != cols) {
            ostringstream msg;
            msg << "ragged matrix: row " << i << " has " << m[i].size()
                << " entries, row 0 has " << cols;
            throw ShapeError(msg.str());
        }
    }
}

string keyword(const string& text)
{
    auto first = find_if_not(text.begin(), text.end(), [](unsigned char ch) { return isspace(ch); });
    auto last  = find_if_not(text.rbegin(), text.rend(), [](unsigned char ch) { return isspace(ch); }).base();
    string key = first < last ? string(first, last) : string();
    transform(key.begin(), key.end(), key.begin(), [](unsigned char ch) { return char(tolower(ch)); });
    return key;
}

Criterion parse_criterion(const string& text)
{
    const string key = keyword(text);

    if (key == "cost" || key == "costo") return Criterion::Cost;
    if (key == "time" || key == "tiempo") return Criterion::Time;
    throw InvalidCriterion("unrecognised optimisation criterion '" + text + "', use 'cost' or 'time'");
}

string to_string(Criterion c)
{
    switch (c) {
        case Criterion::Cost: return "cost";
        case Criterion::Time: return "time";
    }
    throw InvalidCriterion("unrecognised optimisation criterion " + std::to_string(int(c)));
}

Matrix transform_matrix(const Matrix& m, Criterion c)
{
    switch (c) {
        case Criterion::Cost:
            return m;
        case Criterion::Time: {
            double max_v = -numeric_limits<double>::infinity();
            for (const auto& row : m)
                for (double v : row) max_v = max(max_v, v);

            Matrix out = m;
            for (auto& row : out)
                for (auto& v : row) v = max_v - v;
            return out;
        }
    }
    throw InvalidCriterion("unrecognised optimisation criterion " + std::to_string(int(c)));
}

Matrix balance_matrix(const Matrix& m)
{
    check_rectangular(m);
    const size_t rows = m.size(), cols = m[0].size();
    const size_t n = max(rows, cols);

    Matrix out = m;
    for (auto& row : out) row.resize(n, 0.0);   // extra task columns
    out.resize(n, vector<double>(n, 0.0));      // extra agent rows
    return out;
}
