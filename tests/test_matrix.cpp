#include <gtest/gtest.h>
#include "Matrix.hpp"
#include <algorithm>

TEST(Transform, CostIsIdentity) {
    Matrix m = {{4, 1, 3},
                {2, 0, 5}};
    EXPECT_EQ(transform_matrix(m, Criterion::Cost), m);
}

TEST(Transform, TimeInvertsAroundMaximum) {
    Matrix m = {{1, 5},
                {3, 0}};
    // max is 5: every entry becomes 5 - entry
    Matrix expected = {{4, 0},
                       {2, 5}};
    EXPECT_EQ(transform_matrix(m, Criterion::Time), expected);
}

TEST(Transform, TimeMapsMaximumToZero) {
    Matrix m = {{7, 12, 3},
                {12, 1, 9}};
    Matrix t = transform_matrix(m, Criterion::Time);
    for (size_t i = 0; i < m.size(); ++i)
        for (size_t j = 0; j < m[i].size(); ++j)
            if (m[i][j] == 12) EXPECT_DOUBLE_EQ(t[i][j], 0.0);
    EXPECT_DOUBLE_EQ(t[1][1], 11.0);
}

TEST(Transform, TimeLeavesInputUntouched) {
    const Matrix m = {{2, 8}};
    transform_matrix(m, Criterion::Time);
    EXPECT_EQ(m, (Matrix{{2, 8}}));
}

TEST(Transform, UnknownEnumValueThrows) {
    Matrix m = {{1}};
    EXPECT_THROW(transform_matrix(m, static_cast<Criterion>(7)), InvalidCriterion);
}

TEST(ParseCriterion, AcceptsCaseBlanksAndSpanishKeywords) {
    EXPECT_EQ(parse_criterion("cost"), Criterion::Cost);
    EXPECT_EQ(parse_criterion("  Time \n"), Criterion::Time);
    EXPECT_EQ(parse_criterion("COSTO"), Criterion::Cost);
    EXPECT_EQ(parse_criterion("tiempo"), Criterion::Time);
}

TEST(ParseCriterion, UnknownThrows) {
    EXPECT_THROW(parse_criterion("unknown"), InvalidCriterion);
    EXPECT_THROW(parse_criterion(""), InvalidCriterion);
    EXPECT_THROW(parse_criterion("co st"), InvalidCriterion);
}

TEST(Keyword, TrimsEndsAndLowersButKeepsInnerBlanks) {
    EXPECT_EQ(keyword("  Greedy\t"), "greedy");
    EXPECT_EQ(keyword("Gre Edy"), "gre edy");
    EXPECT_EQ(keyword(" \n "), "");
}

TEST(Balance, WideMatrixGetsZeroRows) {
    Matrix m = {{4, 2, 7},
                {3, 5, 1}};
    Matrix b = balance_matrix(m);
    Matrix expected = {{4, 2, 7},
                       {3, 5, 1},
                       {0, 0, 0}};
    EXPECT_EQ(b, expected);
}

TEST(Balance, TallMatrixGetsZeroColumns) {
    Matrix m = {{5}, {2}, {3}};
    Matrix expected = {{5, 0, 0},
                       {2, 0, 0},
                       {3, 0, 0}};
    EXPECT_EQ(balance_matrix(m), expected);
}

TEST(Balance, SquareIsUnchanged) {
    Matrix m = {{1, 2},
                {3, 4}};
    EXPECT_EQ(balance_matrix(m), m);
}

TEST(Balance, AlwaysSquareAndKeepsPositions) {
    for (int r = 1; r <= 5; ++r) {
        for (int c = 1; c <= 5; ++c) {
            Matrix m(r, std::vector<double>(c));
            for (int i = 0; i < r; ++i)
                for (int j = 0; j < c; ++j) m[i][j] = 1 + i * 10 + j;

            Matrix b = balance_matrix(m);
            const size_t n = std::max(r, c);
            ASSERT_EQ(b.size(), n);
            for (size_t i = 0; i < n; ++i) {
                ASSERT_EQ(b[i].size(), n);
                for (size_t j = 0; j < n; ++j) {
                    double want = (int(i) < r && int(j) < c) ? m[i][j] : 0.0;
                    EXPECT_DOUBLE_EQ(b[i][j], want) << r << "x" << c << " at " << i << "," << j;
                }
            }
        }
    }
}

TEST(Balance, RaggedOrEmptyThrows) {
    EXPECT_THROW(balance_matrix({{1, 2}, {3}}), ShapeError);
    EXPECT_THROW(balance_matrix({}), ShapeError);
    EXPECT_THROW(balance_matrix({{}}), ShapeError);
}

TEST(CheckSquare, RejectsRectangularAndEmpty) {
    EXPECT_NO_THROW(check_square({{1, 2}, {3, 4}}, "test"));
    EXPECT_THROW(check_square({{1, 2, 3}, {4, 5, 6}}, "test"), ShapeError);
    EXPECT_THROW(check_square({{1, 2}, {3}}, "test"), ShapeError);
    EXPECT_THROW(check_square({}, "test"), ShapeError);
}
