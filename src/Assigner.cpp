#include "Assigner.hpp"
#include "hungarian.hpp"
#include "greedy.hpp"

using namespace std;

// -------- parsing --------------

Method parse_method(const string& text)
{
    const string key = keyword(text);

    if (key == "exact" || key == "munkres") return Method::Exact;
    if (key == "greedy" || key == "manual") return Method::Greedy;
    throw invalid_argument("unrecognised solving method '" + text + "', use 'exact' or 'greedy'");
}

string to_string(Method m)
{
    return m == Method::Exact ? "exact" : "greedy";
}

// -------- stateless entry points --------------

Matrix prepare_working_matrix(const Matrix& raw, Criterion c)
{
    // criterion first: a bad mode is reported even for a malformed matrix
    if (c != Criterion::Cost && c != Criterion::Time)
        throw InvalidCriterion("unrecognised optimisation criterion " + std::to_string(int(c)));
    check_rectangular(raw);
    return balance_matrix(transform_matrix(raw, c));
}

Matrix prepare_working_matrix(const Matrix& raw, const string& criterion)
{
    return prepare_working_matrix(raw, parse_criterion(criterion));
}

Solution solve_exact(const Matrix& working)
{
    vector<int> rowsol;
    Solution s;
    hungarian(working, rowsol, s.total_cost);

    s.matches.reserve(rowsol.size());
    for (int i = 0; i < int(rowsol.size()); ++i)
        s.matches.push_back({i, rowsol[i]});
    return s;
}

Solution solve_greedy(const Matrix& working)
{
    vector<pair<int, int>> pairs;
    Solution s;
    greedy(working, pairs, s.total_cost);

    s.matches.reserve(pairs.size());
    for (const auto& [r, c] : pairs)
        s.matches.push_back({r, c});
    return s;
}

// -------- Assigner --------------

Assigner::Assigner(const Matrix& raw, Criterion criterion)
    : criterion_(criterion),
      working_(prepare_working_matrix(raw, criterion)),
      rows_(raw.size()), cols_(raw[0].size())
{
}

Solution Assigner::solve_exact() const { return ::solve_exact(working_); }
Solution Assigner::solve_greedy() const { return ::solve_greedy(working_); }

Solution Assigner::solve(Method method) const
{
    switch (method) {
        case Method::Exact:  return solve_exact();
        case Method::Greedy: return solve_greedy();
    }
    throw invalid_argument("unrecognised solving method " + std::to_string(int(method)));
}

bool Assigner::is_padding(const Match& m) const
{
    return m.agent >= rows_ || m.task >= cols_;
}
