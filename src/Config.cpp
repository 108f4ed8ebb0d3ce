#include "Config.hpp"
#include <fstream>
#include <iostream>
#include <regex>

using namespace std;

// -----------------------------------------------------------------------------
// Read defaults from .ini config
string get_ini_value(const string& section, const string& key, const string& path)
{
    ifstream file(path);
    if (!file.is_open()) return "";

    string line, current_section;
    regex section_re(R"(\[(.*?)\])");
    regex keyval_re(R"(^\s*([^=]+?)\s*=\s*(.*?)\s*(?:[#;].*)?$)");
    smatch match;

    while (getline(file, line)) {
        if (regex_match(line, match, section_re)) {
            current_section = match[1];
        } else if (current_section == section && regex_match(line, match, keyval_re)) {
            if (match[1] == key) {
                cout << "loading [" << section << "][" << key << "] from " << path << endl;
                return match[2];
            }
        }
    }
    return "";
}

// --config has to be known before the ini defaults feed the CLI options
string find_config_path(int argc, const char* const* argv)
{
    const string flag = "--config", prefix = "--config=";
    for (int i = 1; i < argc; ++i) {
        string arg = argv[i];
        if (arg == flag && i + 1 < argc) return argv[i + 1];
        if (arg.compare(0, prefix.size(), prefix) == 0) return arg.substr(prefix.size());
    }
    return "defaults.ini";
}

string resolve_setting(const string& cli, const string& file, const string& ini, bool have_input_file)
{
    if (!cli.empty()) return cli;
    if (!have_input_file) return "";
    return !file.empty() ? file : ini;
}
