#pragma once
#include <string>

/** Value of key in [section] of an ini file, "" when the file or key is missing. */
std::string get_ini_value(const std::string& section, const std::string& key,
                          const std::string& path = "defaults.ini");

/** Ini path from "--config path" or "--config=path", defaults.ini otherwise. */
std::string find_config_path(int argc, const char* const* argv);

/**
 * Picks the criterion or method text. The command line wins over the input
 * file, the input file over the ini. Interactive runs (no input file) ignore
 * the ini: an empty result there means the user gets asked.
 */
std::string resolve_setting(const std::string& cli, const std::string& file,
                            const std::string& ini, bool have_input_file);
