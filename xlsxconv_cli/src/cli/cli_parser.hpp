#ifndef XLSXCONV_CLI_PARSER_HPP
#define XLSXCONV_CLI_PARSER_HPP

#include <string>
#include <filesystem>

// forward declaration
namespace CLI { class App; }

/**
 * @brief Everything the user supplies for one run.
 */
struct Settings {
    bool quiet = false;

    std::string input;
    std::string output_dir;
    std::string sheet = "0";
    std::string encoding = "utf-8";

    std::string log_level = "ERROR";
    std::filesystem::path log_file;
    std::filesystem::path report_path;
};

/**
 * @brief Configures the CLI11 parser with all options, flags, and arguments.
 * @param app The CLI::App instance to configure.
 * @param settings The Settings struct to map the options to.
 */
void setup_cli_parser(CLI::App& app, Settings& settings);

#endif //XLSXCONV_CLI_PARSER_HPP
