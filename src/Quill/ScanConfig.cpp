// =================================================================
// src/Quill/ScanConfig.cpp
// =================================================================
// Implementation for scan configuration management.

#include "Quill/ScanConfig.hpp"
#include "Quill/ConfigParser.hpp"
#include "Quill/CliParser.hpp"
#include "Quill/Logger.hpp"
#include <algorithm>

namespace Quill {

namespace {

void appendUnique(std::vector<std::string>& target, const std::vector<std::string>& values) {
    for (const auto& value : values) {
        if (std::find(target.begin(), target.end(), value) == target.end()) {
            target.push_back(value);
        }
    }
}

} // namespace

void ScanConfig::loadFromConfig(const ConfigParser& config) {
    appendUnique(extensions, config.getStringList("extensions"));
    appendUnique(ignore_patterns, config.getStringList("ignore"));
    
    if (config.hasKey("default_ignore")) {
        default_ignore_patterns = config.getStringList("default_ignore");
    }
    
    use_default_ignore = config.getBoolValue("use_default_ignore").value_or(use_default_ignore);
    include_hidden = config.getBoolValue("include_hidden").value_or(include_hidden);
    ignore_files_only = config.getBoolValue("ignore_files_only").value_or(ignore_files_only);
    ignore_gitignore = config.getBoolValue("ignore_gitignore").value_or(ignore_gitignore);
    line_numbers = config.getBoolValue("line_numbers").value_or(line_numbers);
    extract_sqlite = config.getBoolValue("extract_sqlite").value_or(extract_sqlite);
    
    std::string cwd = config.getStringValue("cwd");
    if (!cwd.empty()) {
        root_path = cwd;
    }
    
    std::string top_files_str = config.getStringValue("top_files");
    if (!top_files_str.empty()) {
        try {
            size_t value = std::stoul(top_files_str);
            if (value > 0) {
                top_files = value;
            }
        } catch (const std::exception&) {
            Logger::getInstance().warning("ScanConfig", "Invalid top_files value, using default", top_files_str);
        }
    }
    
    std::string level = config.getStringValue("log_level");
    if (!level.empty()) {
        log_level = level;
    }
    log_file = config.getStringValue("log_file");
}

void ScanConfig::applyCommandOverrides(const Commands& commands) {
    appendUnique(extensions, commands.extensions);
    appendUnique(ignore_patterns, commands.ignore_patterns);
    
    // Flags can only switch behaviour on
    if (commands.no_ignore_default) use_default_ignore = false;
    if (commands.include_hidden) include_hidden = true;
    if (commands.ignore_files_only) ignore_files_only = true;
    if (commands.ignore_gitignore) ignore_gitignore = true;
    if (commands.line_numbers) line_numbers = true;
    if (commands.extract_sqlite) extract_sqlite = true;
    if (commands.stats) stats = true;
    if (commands.verbose) log_level = "debug";
    
    if (commands.top_files > 0) {
        top_files = commands.top_files;
    }
    if (!commands.cwd.empty()) {
        root_path = commands.cwd;
    }
    output_file = commands.output_file;
}

std::vector<std::string> ScanConfig::getMergedIgnorePatterns() const {
    std::vector<std::string> patterns;
    if (use_default_ignore) {
        patterns = default_ignore_patterns;
    }
    appendUnique(patterns, ignore_patterns);
    return patterns;
}

IgnoreContext ScanConfig::toIgnoreContext(const IgnoreResolver* resolver) const {
    IgnoreContext context;
    context.include_hidden = include_hidden;
    context.use_gitignore = !ignore_gitignore;
    context.ignore_files_only = ignore_files_only;
    context.patterns = getMergedIgnorePatterns();
    context.extensions = extensions;
    context.resolver = ignore_gitignore ? nullptr : resolver;
    return context;
}

std::vector<std::string> ScanConfig::getDefaultIgnorePatterns() {
    return {
        ".git",
        ".svn",
        ".hg",
        "*.lock",
        "package-lock.json",
        "pnpm-lock.yaml",
        "LICENSE",
        "LICENSE.*",
        "LICENCE",
        "LICENCE.*",
        "COPYING"
    };
}

} // namespace Quill
