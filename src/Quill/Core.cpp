// =================================================================
// src/Quill/Core.cpp
// =================================================================
// Implementation for the core application logic.

#include "Quill/Core.hpp"
#include "Quill/BinaryClassifier.hpp"
#include "Quill/ConfigParser.hpp"
#include "Quill/DocumentEmitter.hpp"
#include "Quill/Errors.hpp"
#include "Quill/GitignoreResolver.hpp"
#include "Quill/Logger.hpp"
#include "Quill/PathScanner.hpp"
#include "Quill/SqliteSchema.hpp"
#include "Quill/StatsTree.hpp"
#include "Quill/SysInteraction.hpp"
#include "Quill/TokenEncoder.hpp"
#include "Quill/TraversalSession.hpp"
#include <fstream>
#include <iostream>

namespace Quill {

Core::Core(const Commands& commands, std::istream* path_input, std::ostream* output)
    : m_commands(commands),
      m_path_input(path_input),
      m_output(output),
      m_config(std::make_unique<ConfigParser>(commands.config_path)),
      m_sys(std::make_unique<SysInteraction>()),
      m_classifier(std::make_unique<BinaryClassifier>())
{
    m_scan_config.loadFromConfig(*m_config);
    m_scan_config.applyCommandOverrides(m_commands);
}

Core::~Core() = default;

int Core::run() {
    configureLogging();
    m_run_stats = RunStats();
    
    std::vector<std::string> paths = collectInputPaths();
    validateInputPaths(paths);
    
    std::unique_ptr<std::ofstream> file_output;
    std::ostream* out = m_output ? m_output : &std::cout;
    if (!m_scan_config.output_file.empty()) {
        file_output = std::make_unique<std::ofstream>(m_scan_config.output_file,
                                                      std::ios::out | std::ios::trunc);
        if (!file_output->is_open()) {
            throw UsageError("Cannot open output file: " + m_scan_config.output_file);
        }
        out = file_output.get();
    }
    
    TraversalSession session;
    
    PretokenEncoder encoder;
    std::unique_ptr<DocumentEmitter> emitter;
    std::unique_ptr<StatsTree> stats;
    if (m_scan_config.stats) {
        stats = std::make_unique<StatsTree>(encoder, m_scan_config.root_path, m_scan_config.top_files);
    } else {
        emitter = std::make_unique<DocumentEmitter>(*out, session, m_scan_config.line_numbers,
                                                    m_scan_config.root_path);
    }
    
    for (const auto& input_path : paths) {
        // .gitignore cascades start at the input itself, never above it
        GitignoreResolver gitignore(input_path);
        IgnoreContext context = m_scan_config.toIgnoreContext(&gitignore);
        PathScanner scanner(context, session);
        for (const auto& file_path : scanner.resolve(input_path)) {
            processFile(file_path, emitter.get(), stats.get());
        }
    }
    
    if (emitter) {
        emitter->finish();
    } else {
        *out << stats->render();
        out->flush();
    }
    
    if (!*out) {
        throw std::runtime_error("Failed to write output");
    }
    
    Logger::getInstance().logRunSummary(m_run_stats.files_seen, m_run_stats.documents_written,
        m_run_stats.binary_skipped + m_run_stats.decode_failures + m_run_stats.sqlite_failures);
    Logger::getInstance().flush();
    return 0;
}

std::vector<std::string> Core::collectInputPaths() const {
    std::vector<std::string> paths = m_commands.paths;
    
    if (m_path_input != nullptr) {
        auto stdin_paths = m_sys->readPathList(*m_path_input, m_commands.null_separator);
        Logger::getInstance().debug("Core", "Read " + std::to_string(stdin_paths.size()) +
                                    " paths from standard input");
        paths.insert(paths.end(), stdin_paths.begin(), stdin_paths.end());
    }
    
    return paths;
}

void Core::validateInputPaths(const std::vector<std::string>& paths) const {
    if (paths.empty()) {
        throw UsageError("No paths provided");
    }
    for (const auto& path : paths) {
        if (!m_sys->pathExists(path)) {
            throw UsageError("Path does not exist: " + path);
        }
    }
}

void Core::configureLogging() const {
    Logger& logger = Logger::getInstance();
    logger.setConsoleLogLevel(Logger::parseLevel(m_scan_config.log_level, LogLevel::WARNING));
    if (!m_scan_config.log_file.empty()) {
        logger.openLogFile(m_scan_config.log_file);
    }
}

void Core::processFile(const std::string& path, DocumentEmitter* emitter, StatsTree* stats) {
    m_run_stats.files_seen++;
    Logger& logger = Logger::getInstance();
    
    if (m_scan_config.extract_sqlite && SqliteSchema::isSqliteFile(path)) {
        try {
            std::string schema = SqliteSchema::extractSchema(path);
            if (emitter) {
                emitter->emit(path, schema);
            } else {
                stats->record(path, schema, true);
            }
            m_run_stats.documents_written++;
        } catch (const SqliteError& e) {
            logger.warning("Core", "Error processing SQLite file " + path, e.what());
            m_run_stats.sqlite_failures++;
            if (stats) {
                stats->record(path, "", false);
            }
        }
        return;
    }
    
    if (m_classifier->classify(path) == FileKind::Binary) {
        logger.debug("Core", "Skipping binary file", path);
        m_run_stats.binary_skipped++;
        if (stats) {
            stats->record(path, "", false);
        }
        return;
    }
    
    std::string content;
    try {
        content = BinaryClassifier::readTextFile(path);
    } catch (const DecodeError& e) {
        logger.warning("Core", "Skipping file " + path + " due to a decode error", e.what());
        m_run_stats.decode_failures++;
        return;
    } catch (const std::runtime_error& e) {
        // Unreadable after the binary check: treat like binary
        logger.warning("Core", "Skipping unreadable file " + path, e.what());
        m_run_stats.binary_skipped++;
        if (stats) {
            stats->record(path, "", false);
        }
        return;
    }
    
    if (emitter) {
        emitter->emit(path, content);
    } else {
        stats->record(path, content, true);
    }
    m_run_stats.documents_written++;
}

} // namespace Quill
