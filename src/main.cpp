#include "Assigner.hpp"
#include "Config.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <nlohmann/json.hpp>
#include <CLI/CLI.hpp>
#include <algorithm>
#include <fstream>
#include <iostream>
#include <iomanip>
#include <sstream>
#include <utility>

// -----------------------------------------------------------------------------

struct Problem { Matrix matrix; std::string criterion, method; };

// Accepts either [[...], ...] or {"matrix": [[...]], "criterion": ..., "method": ...}
static Problem load_problem(const std::string& path)
{
    std::ifstream in(path);
    if (!in.is_open()) throw std::runtime_error("Failed to open input file: " + path);

    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Malformed JSON in " + path + ": " + e.what());
    }

    Problem pb;
    const nlohmann::json* rows = &j;
    if (j.is_object()) {
        rows = &j.at("matrix");
        if (j.contains("criterion")) pb.criterion = j["criterion"].get<std::string>();
        if (j.contains("method"))    pb.method    = j["method"].get<std::string>();
    }
    if (!rows->is_array())
        throw std::runtime_error("Input " + path + " does not hold a matrix (array of rows)");

    for (const auto& row : *rows) {
        if (!row.is_array()) {
            std::ostringstream msg;
            msg << "Row " << pb.matrix.size() << " of " << path << " is not an array";
            throw std::runtime_error(msg.str());
        }
        pb.matrix.push_back(row.get<std::vector<double>>());
    }
    return pb;
}

template <typename T>
static T ask(const std::string& prompt)
{
    std::cout << prompt;
    T v;
    if (!(std::cin >> v)) throw std::runtime_error("Invalid or missing input for: " + prompt);
    return v;
}

static Matrix prompt_matrix()
{
    int rows = ask<int>("Number of agents: ");
    int cols = ask<int>("Number of tasks: ");
    if (rows < 1 || cols < 1) {
        std::ostringstream msg;
        msg << "matrix must be at least 1x1, got " << rows << "x" << cols;
        throw ShapeError(msg.str());
    }

    std::cout << "\nEnter the cost/time matrix:" << std::endl;
    Matrix m(rows, std::vector<double>(cols));
    int number = 1;
    for (int i = 0; i < rows; ++i) {
        for (int j = 0; j < cols; ++j) {
            std::ostringstream p;
            p << "Value for agent " << i + 1 << ", task " << j + 1 << " (value " << number++ << "): ";
            m[i][j] = ask<double>(p.str());
        }
    }
    return m;
}

static void print_matrix(const std::string& title, const Matrix& m)
{
    std::cout << "\n" << title << ":" << std::endl;
    for (const auto& row : m) {
        for (double v : row) std::cout << std::setw(10) << v;
        std::cout << "\n";
    }
}

static void print_solution(const Assigner& as, const Matrix& raw, const Solution& s)
{
    std::cout << "\nAssignments:" << std::endl;
    double raw_total = 0.0;
    for (const auto& m : s.matches) {
        std::cout << "Agent " << m.agent + 1 << " assigned to Task " << m.task + 1;
        if (as.is_padding(m)) std::cout << (m.agent >= as.rows() ? "  (no real agent)" : "  (no real task)");
        else raw_total += raw[m.agent][m.task];
        std::cout << "\n";
    }
    std::cout << "\nOptimised total (" << to_string(as.criterion()) << "): " << s.total_cost << std::endl;
    if (as.criterion() == Criterion::Time)
        std::cout << "Total time of the real pairs: " << raw_total << std::endl;
}

static void save_solution(const std::string& path, const Assigner& as, Method method, const Solution& s)
{
    nlohmann::ordered_json j;
    j["criterion"] = to_string(as.criterion());
    j["method"] = to_string(method);
    j["working_matrix"] = as.working();
    j["assignments"] = nlohmann::ordered_json::array();
    for (const auto& m : s.matches) {
        j["assignments"].push_back({
            {"agent", m.agent + 1},
            {"task", m.task + 1},
            {"cost", as.working()[m.agent][m.task]},
            {"padding", as.is_padding(m)}
        });
    }
    j["total_cost"] = s.total_cost;

    std::ofstream out(path);
    if (!out.is_open()) throw std::runtime_error("Failed to open output file: " + path);
    out << std::setw(2) << j << std::endl;
    std::cout << "Wrote solution to " << path << std::endl;
}

// Working matrix as a grid: darker means cheaper, assigned cells boxed in green.
static void draw_vis(const std::string& path, const Assigner& as, const Solution& s, int cell = 64)
{
    const Matrix& w = as.working();
    const int n = w.size();
    double lo = w[0][0], hi = w[0][0];
    for (const auto& row : w)
        for (double v : row) { lo = std::min(lo, v); hi = std::max(hi, v); }
    const double span = hi > lo ? hi - lo : 1.0;

    cv::Mat img(n * cell, n * cell, CV_8UC3, cv::Scalar(30, 30, 30));
    for (int i = 0; i < n; ++i) {
        for (int j = 0; j < n; ++j) {
            int shade = int(60 + 180 * (w[i][j] - lo) / span);
            cv::Rect r(j * cell, i * cell, cell, cell);
            bool pad = as.is_padding({i, j});
            cv::rectangle(img, r, pad ? cv::Scalar(shade / 2, shade / 2, shade) : cv::Scalar(shade, shade, shade), cv::FILLED);
            cv::rectangle(img, r, cv::Scalar(80, 80, 80), 1);

            std::ostringstream label; label << w[i][j];
            cv::putText(img, label.str(), {j * cell + 6, i * cell + cell / 2 + 5},
                        cv::FONT_HERSHEY_SIMPLEX, 0.45, cv::Scalar(0, 0, 0), 1);
        }
    }
    for (const auto& m : s.matches) {
        cv::Rect r(m.task * cell + 2, m.agent * cell + 2, cell - 4, cell - 4);
        cv::rectangle(img, r, cv::Scalar(0, 255, 0), 3);
    }

    if (!cv::imwrite(path, img)) throw std::runtime_error("Failed to write picture: " + path);
    std::cout << "Wrote picture to " << path << std::endl;
}

// -----------------------------------------------------------------------------

int main(int argc, char** argv)
{
    // Read defaults from .ini
    std::string config_path = find_config_path(argc, argv);
    std::string in_path   = get_ini_value("assign", "input", config_path);
    std::string out_path  = get_ini_value("assign", "output", config_path);
    std::string vis_path  = get_ini_value("assign", "vis", config_path);
    std::string ini_crit  = get_ini_value("assign", "criterion", config_path);
    std::string ini_meth  = get_ini_value("assign", "method", config_path);
    std::string criterion, method;

    CLI::App app{"Task assignment solver"};
    app.add_option("--config", config_path, "Ini file with defaults (section [assign])");
    app.add_option("--input", in_path, "Input JSON matrix; prompts on stdin when empty");
    app.add_option("--output", out_path, "Output JSON path");
    app.add_option("--vis", vis_path, "PNG picture of the working matrix and assignment");
    app.add_option("--criterion", criterion, "Optimise by 'cost' or 'time'");
    app.add_option("--method", method, "Solve with 'exact' or 'greedy'")
        ->check(CLI::IsMember({"exact", "greedy", "munkres", "manual"}, CLI::ignore_case));
    CLI11_PARSE(app, argc, argv);

    try {
        Matrix raw;
        const bool have_input = !in_path.empty();
        if (have_input) {
            Problem pb = load_problem(in_path);
            std::cout << "Loaded " << pb.matrix.size() << " agents from " << in_path << std::endl;
            raw = std::move(pb.matrix);
            criterion = resolve_setting(criterion, pb.criterion, ini_crit, true);
            method    = resolve_setting(method, pb.method, ini_meth, true);
            if (criterion.empty()) criterion = "cost";
            if (method.empty())    method = "exact";
        } else {
            std::cout << "Task assignment\n" << std::endl;
            raw = prompt_matrix();
            print_matrix("Entered matrix", raw);
            criterion = resolve_setting(criterion, "", ini_crit, false);
            method    = resolve_setting(method, "", ini_meth, false);
            if (criterion.empty()) criterion = ask<std::string>("\nOptimise by 'cost' or 'time': ");
            if (method.empty())    method = ask<std::string>("Solve with 'exact' or 'greedy': ");
        }

        Criterion crit = parse_criterion(criterion);
        Method meth = parse_method(method);
        Assigner assigner(raw, crit);
        print_matrix("Working matrix", assigner.working());

        std::cout << "\nSolving with the " << to_string(meth) << " method..." << std::endl;
        Solution sol = assigner.solve(meth);
        print_solution(assigner, raw, sol);

        if (!out_path.empty()) save_solution(out_path, assigner, meth, sol);
        if (!vis_path.empty()) draw_vis(vis_path, assigner, sol);
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
