// =================================================================
// include/Quill/Core.hpp
// =================================================================
// Defines the application orchestrator: merges configuration, resolves
// input paths and feeds every file to the emitter or the stats tree.

#pragma once

#include "Quill/CliParser.hpp"
#include "Quill/ScanConfig.hpp"
#include <istream>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

// Forward declarations to reduce header dependencies
namespace Quill {
    class ConfigParser;
    class SysInteraction;
    class BinaryClassifier;
    class DocumentEmitter;
    class StatsTree;
}

namespace Quill {

/**
 * @brief Counters for one run
 */
struct RunStats {
    size_t files_seen = 0;
    size_t documents_written = 0;
    size_t binary_skipped = 0;
    size_t decode_failures = 0;
    size_t sqlite_failures = 0;
};

class Core {
public:
    /**
     * @brief Constructs the Core application object.
     * @param commands The parsed command-line arguments.
     * @param path_input Stream to read extra input paths from, or nullptr.
     * @param output Destination used when no output file is set; stdout
     *        when nullptr.
     */
    explicit Core(const Commands& commands,
                  std::istream* path_input = nullptr,
                  std::ostream* output = nullptr);

    /**
     * @brief Destructor must be declared here and defined in the .cpp file.
     * This is required because we are using unique_ptr with forward-declared types.
     */
    ~Core();

    /**
     * @brief Runs the scan.
     * @return 0 on success.
     * @throws UsageError when no paths are given or a path does not exist.
     */
    int run();

    const ScanConfig& config() const { return m_scan_config; }
    const RunStats& runStats() const { return m_run_stats; }

private:
    std::vector<std::string> collectInputPaths() const;
    void validateInputPaths(const std::vector<std::string>& paths) const;
    void configureLogging() const;

    /**
     * @brief Handle one resolved file
     * @param path File path from the scanner
     * @param emitter Document sink, or nullptr in stats mode
     * @param stats Stats sink, or nullptr outside stats mode
     */
    void processFile(const std::string& path, DocumentEmitter* emitter, StatsTree* stats);

    const Commands& m_commands;
    std::istream* m_path_input;
    std::ostream* m_output;
    std::unique_ptr<ConfigParser> m_config;
    std::unique_ptr<SysInteraction> m_sys;
    std::unique_ptr<BinaryClassifier> m_classifier;
    ScanConfig m_scan_config;
    RunStats m_run_stats;
};

} // namespace Quill
