// =================================================================
// src/Quill/CliParser.cpp
// =================================================================
// Implementation for the CLI parser.

#include "Quill/CliParser.hpp"
#include "Quill/Version.hpp"

namespace Quill {

std::shared_ptr<CLI::App> CliParser::setupCli() {
    m_app = std::make_shared<CLI::App>(
        "Quill: concatenate the text files under one or more paths into a single "
        "<documents> stream for LLM prompts.");
    
    m_app->set_version_flag("--version", std::string(QUILL_VERSION));
    
    // Path existence is checked after stdin paths are merged in
    m_app->add_option("paths", m_commands.paths, "Files or directories to include.");

    setupFilterOptions(*m_app);
    setupOutputOptions(*m_app);
    setupInputOptions(*m_app);

    m_app->add_option("--config", m_commands.config_path, "Path to the YAML configuration file.")
        ->capture_default_str();
    m_app->add_flag("-v,--verbose", m_commands.verbose, "Print debug diagnostics on stderr.");

    return m_app;
}

const Commands& CliParser::getCommands() const {
    return m_commands;
}

void CliParser::setupFilterOptions(CLI::App& app) {
    app.add_option("-e,--extension", m_commands.extensions,
                   "Only include files ending with this suffix (repeatable).")
        ->allow_extra_args(false);
    app.add_flag("--include-hidden", m_commands.include_hidden,
                 "Include files and folders starting with '.'.");
    app.add_flag("--ignore-files-only", m_commands.ignore_files_only,
                 "--ignore patterns only ignore files, never prune directories.");
    app.add_flag("--ignore-gitignore", m_commands.ignore_gitignore,
                 "Ignore .gitignore files and include all files.");
    app.add_option("--ignore", m_commands.ignore_patterns,
                   "Glob pattern to ignore, matched against names and relative paths (repeatable).")
        ->allow_extra_args(false);
    app.add_flag("--no-ignore-default", m_commands.no_ignore_default,
                 "Do not add the default VCS, lockfile and license ignore patterns.");
}

void CliParser::setupOutputOptions(CLI::App& app) {
    app.add_option("-o,--output", m_commands.output_file, "Write to this file instead of stdout.");
    app.add_flag("-n,--line-numbers", m_commands.line_numbers, "Add line numbers to the output.");
    app.add_flag("--extract-sqlite", m_commands.extract_sqlite,
                 "Emit the schema of SQLite3 databases instead of treating them as binary.");
    app.add_flag("--stats", m_commands.stats,
                 "Print a token/size report instead of the documents.");
    app.add_option("--top", m_commands.top_files, "Number of files listed in the --stats ranking.")
        ->check(CLI::PositiveNumber);
    app.add_option("--cwd", m_commands.cwd,
                   "Show paths relative to this directory when files live under it.");
}

void CliParser::setupInputOptions(CLI::App& app) {
    app.add_flag("-0,--null", m_commands.null_separator,
                 "Use NUL as the separator when reading paths from stdin.");
}

} // namespace Quill
