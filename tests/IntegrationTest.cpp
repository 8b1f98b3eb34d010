// =================================================================
// tests/IntegrationTest.cpp
// =================================================================
// End-to-end tests running Core against a fixture project.

#include "Quill/Core.hpp"
#include "Quill/CliParser.hpp"
#include "Quill/Errors.hpp"
#include <sqlite3.h>
#include <iostream>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <cassert>

namespace fs = std::filesystem;

class IntegrationTest {
private:
    fs::path test_dir;
    fs::path output_path;
    
    void setupTestProject() {
        cleanupTestProject();
        fs::create_directories(test_dir / ".git");
        fs::create_directories(test_dir / "sub");
        
        std::ofstream(test_dir / "a.txt") << "alpha";
        std::ofstream(test_dir / "b.txt") << "bravo";
        std::ofstream(test_dir / "sub" / "c.txt") << "charlie";
        std::ofstream(test_dir / ".hidden") << "hidden";
    }
    
    void cleanupTestProject() {
        if (fs::exists(test_dir)) {
            fs::remove_all(test_dir);
        }
        if (fs::exists(output_path)) {
            fs::remove(output_path);
        }
    }
    
    std::string at(const std::string& relative) const {
        return (test_dir / relative).string();
    }
    
    Quill::Commands baseCommands() const {
        Quill::Commands commands;
        commands.paths = {test_dir.string()};
        commands.cwd = test_dir.string();
        commands.config_path = "";
        return commands;
    }
    
    std::string runCore(const Quill::Commands& commands, std::istream* input = nullptr) {
        std::ostringstream out;
        Quill::Core core(commands, input, &out);
        int result = core.run();
        assert(result == 0);
        return out.str();
    }
    
    static size_t countDocuments(const std::string& output) {
        size_t count = 0;
        for (size_t pos = output.find("<document "); pos != std::string::npos;
             pos = output.find("<document ", pos + 1)) {
            count++;
        }
        return count;
    }
    
public:
    IntegrationTest()
        : test_dir(fs::temp_directory_path() / "quill_integration_test"),
          output_path(fs::temp_directory_path() / "quill_integration_output.txt") {}
    
    void testDocumentsOutput() {
        std::cout << "Testing document output..." << std::endl;
        
        setupTestProject();
        
        const std::string expected =
            "<documents>\n"
            "<document path=\"a.txt\" index=\"1\">\n"
            "alpha\n"
            "</document>\n"
            "<document path=\"b.txt\" index=\"2\">\n"
            "bravo\n"
            "</document>\n"
            "<document path=\"sub/c.txt\" index=\"3\">\n"
            "charlie\n"
            "</document>\n"
            "</documents>\n";
        std::string output = runCore(baseCommands());
        assert(output == expected);
        assert(runCore(baseCommands()) == output && "Output is deterministic");
        
        cleanupTestProject();
        std::cout << "✓ Document output test passed" << std::endl;
    }
    
    void testDeduplicationAndIndexes() {
        std::cout << "Testing deduplication and indexes..." << std::endl;
        
        setupTestProject();
        
        Quill::Commands commands = baseCommands();
        commands.paths = {at("sub/c.txt"), test_dir.string(), at("a.txt")};
        std::string output = runCore(commands);
        
        assert(countDocuments(output) == 3);
        assert(output.find("<document path=\"sub/c.txt\" index=\"1\">") != std::string::npos);
        assert(output.find("<document path=\"a.txt\" index=\"2\">") != std::string::npos);
        assert(output.find("<document path=\"b.txt\" index=\"3\">") != std::string::npos);
        
        cleanupTestProject();
        std::cout << "✓ Deduplication and indexes test passed" << std::endl;
    }
    
    void testHiddenAndIgnoreOptions() {
        std::cout << "Testing hidden and ignore options..." << std::endl;
        
        setupTestProject();
        std::ofstream(test_dir / ".gitignore") << "b.txt\n";
        std::ofstream(test_dir / "LICENSE") << "MIT";
        
        std::string output = runCore(baseCommands());
        assert(countDocuments(output) == 2);
        assert(output.find("b.txt") == std::string::npos && ".gitignore applies");
        assert(output.find("LICENSE") == std::string::npos && "Default ignore applies");
        
        Quill::Commands commands = baseCommands();
        commands.ignore_gitignore = true;
        commands.no_ignore_default = true;
        commands.include_hidden = true;
        output = runCore(commands);
        assert(output.find("path=\"b.txt\"") != std::string::npos);
        assert(output.find("path=\"LICENSE\"") != std::string::npos);
        assert(output.find("path=\".hidden\"") != std::string::npos);
        assert(output.find("path=\".gitignore\"") != std::string::npos);
        
        commands = baseCommands();
        commands.ignore_patterns = {"sub"};
        output = runCore(commands);
        assert(output.find("sub/c.txt") == std::string::npos);
        
        commands.ignore_files_only = true;
        commands.ignore_patterns = {"*.txt"};
        output = runCore(commands);
        assert(output.empty() && "No documents means no wrapper");
        
        cleanupTestProject();
        std::cout << "✓ Hidden and ignore options test passed" << std::endl;
    }
    
    void testExtensionsAndSkippedFiles() {
        std::cout << "Testing extensions and skipped files..." << std::endl;
        
        setupTestProject();
        std::ofstream(test_dir / "script.py") << "print('hi')\n";
        std::ofstream(test_dir / "latin1.py", std::ios::binary) << "name = 'caf\xE9'\n";
        {
            std::ofstream blob(test_dir / "blob.py", std::ios::binary);
            blob.write("\x00\x01\x02\x03", 4);
        }
        
        Quill::Commands commands = baseCommands();
        commands.extensions = {".py"};
        std::ostringstream out;
        Quill::Core core(commands, nullptr, &out);
        assert(core.run() == 0);
        
        std::string output = out.str();
        assert(countDocuments(output) == 1);
        assert(output.find("<document path=\"script.py\" index=\"1\">") != std::string::npos);
        assert(core.runStats().binary_skipped == 1);
        assert(core.runStats().decode_failures == 1);
        assert(core.runStats().files_seen == 3);
        
        cleanupTestProject();
        std::cout << "✓ Extensions and skipped files test passed" << std::endl;
    }
    
    void testLineNumbers() {
        std::cout << "Testing line numbers..." << std::endl;
        
        setupTestProject();
        std::ofstream(test_dir / "four.md") << "one\ntwo\nthree\nfour\n";
        
        Quill::Commands commands = baseCommands();
        commands.paths = {at("four.md")};
        commands.line_numbers = true;
        std::string output = runCore(commands);
        assert(output.find("1  one\n2  two\n3  three\n4  four\n</document>") != std::string::npos);
        
        cleanupTestProject();
        std::cout << "✓ Line numbers test passed" << std::endl;
    }
    
    void testStatsMode() {
        std::cout << "Testing stats mode..." << std::endl;
        
        setupTestProject();
        fs::create_directories(test_dir / "pkg");
        std::ofstream(test_dir / "pkg" / "a.py") << "print('hi')";
        {
            std::ofstream binary(test_dir / "pkg" / "a.bin", std::ios::binary);
            binary.write("\x7f" "ELF\x00\x00", 6);
        }
        
        Quill::Commands commands = baseCommands();
        commands.paths = {at("pkg")};
        commands.stats = true;
        std::string output = runCore(commands);
        
        assert(output.find("Total files: 2\n") == 0);
        assert(output.find("Processed files: 1\n") != std::string::npos);
        assert(output.find("<documents>") == std::string::npos);
        assert(output.find("└─ pkg/ (1 file, ") != std::string::npos);
        assert(output.find("Top 10 files by tokens:\n 1. pkg/a.py: ") != std::string::npos);
        
        commands.top_files = 3;
        output = runCore(commands);
        assert(output.find("Top 3 files by tokens:") != std::string::npos);
        
        cleanupTestProject();
        std::cout << "✓ Stats mode test passed" << std::endl;
    }
    
    void testOutputFile() {
        std::cout << "Testing output file..." << std::endl;
        
        setupTestProject();
        
        Quill::Commands commands = baseCommands();
        commands.output_file = output_path.string();
        std::string console = runCore(commands);
        assert(console.empty());
        
        std::ifstream written(output_path);
        std::stringstream buffer;
        buffer << written.rdbuf();
        assert(buffer.str() == runCore(baseCommands()));
        
        commands.output_file = (test_dir / "no-such-dir" / "out.txt").string();
        bool threw = false;
        try {
            runCore(commands);
        } catch (const Quill::UsageError&) {
            threw = true;
        }
        assert(threw);
        
        cleanupTestProject();
        std::cout << "✓ Output file test passed" << std::endl;
    }
    
    void testPathsFromInput() {
        std::cout << "Testing paths from input stream..." << std::endl;
        
        setupTestProject();
        
        Quill::Commands commands = baseCommands();
        commands.paths.clear();
        std::istringstream input(at("a.txt") + "\n  " + at("sub") + "\n\n");
        std::string output = runCore(commands, &input);
        assert(countDocuments(output) == 2);
        assert(output.find("path=\"a.txt\" index=\"1\"") != std::string::npos);
        assert(output.find("path=\"sub/c.txt\" index=\"2\"") != std::string::npos);
        
        // Arguments come before streamed paths
        commands.paths = {at("b.txt")};
        commands.null_separator = true;
        std::istringstream null_input(at("a.txt") + std::string(1, '\0') + at("b.txt") + std::string(1, '\0'));
        output = runCore(commands, &null_input);
        assert(countDocuments(output) == 2);
        assert(output.find("path=\"b.txt\" index=\"1\"") != std::string::npos);
        assert(output.find("path=\"a.txt\" index=\"2\"") != std::string::npos);
        
        cleanupTestProject();
        std::cout << "✓ Paths from input stream test passed" << std::endl;
    }
    
    void testUsageErrors() {
        std::cout << "Testing usage errors..." << std::endl;
        
        setupTestProject();
        
        Quill::Commands commands = baseCommands();
        commands.paths.clear();
        bool threw = false;
        try {
            runCore(commands);
        } catch (const Quill::UsageError& e) {
            threw = true;
            assert(std::string(e.what()) == "No paths provided");
        }
        assert(threw);
        
        commands.paths = {test_dir.string(), at("missing.txt")};
        threw = false;
        std::ostringstream out;
        try {
            Quill::Core core(commands, nullptr, &out);
            core.run();
        } catch (const Quill::UsageError& e) {
            threw = true;
            assert(std::string(e.what()).find("missing.txt") != std::string::npos);
        }
        assert(threw);
        assert(out.str().empty() && "Nothing is written before validation");
        
        cleanupTestProject();
        std::cout << "✓ Usage errors test passed" << std::endl;
    }
    
    void testSqliteExtraction() {
        std::cout << "Testing SQLite extraction..." << std::endl;
        
        setupTestProject();
        fs::path db_path = test_dir / "data.db";
        sqlite3* db = nullptr;
        int rc = sqlite3_open(db_path.string().c_str(), &db);
        assert(rc == SQLITE_OK);
        rc = sqlite3_exec(db, "CREATE TABLE notes (body TEXT);", nullptr, nullptr, nullptr);
        assert(rc == SQLITE_OK);
        sqlite3_close(db);
        
        Quill::Commands commands = baseCommands();
        commands.paths = {db_path.string()};
        assert(runCore(commands).empty() && "Databases are binary by default");
        
        commands.extract_sqlite = true;
        std::string output = runCore(commands);
        assert(output.find("<document path=\"data.db\" index=\"1\">\n-- SQLite3 Database Schema\n") !=
               std::string::npos);
        assert(output.find("CREATE TABLE notes (body TEXT);") != std::string::npos);
        
        cleanupTestProject();
        std::cout << "✓ SQLite extraction test passed" << std::endl;
    }
    
    void testConfigFile() {
        std::cout << "Testing configuration file..." << std::endl;
        
        setupTestProject();
        fs::path config_path = test_dir / "quill.yml";
        std::ofstream(config_path) << "extensions: [.txt]\n"
                                      "ignore:\n"
                                      "  - sub\n"
                                      "line_numbers: true\n";
        
        Quill::Commands commands = baseCommands();
        commands.config_path = config_path.string();
        std::string output = runCore(commands);
        assert(countDocuments(output) == 2);
        assert(output.find("quill.yml") == std::string::npos);
        assert(output.find("1  alpha") != std::string::npos);
        
        cleanupTestProject();
        std::cout << "✓ Configuration file test passed" << std::endl;
    }
    
    void testGitignoreCascade() {
        std::cout << "Testing cascading .gitignore files..." << std::endl;
        
        setupTestProject();
        fs::create_directories(test_dir / "nested");
        std::ofstream(test_dir / ".gitignore") << "ignored.txt\n";
        std::ofstream(test_dir / "ignored.txt") << "ignored";
        std::ofstream(test_dir / "nested" / ".gitignore") << "*\n";
        std::ofstream(test_dir / "nested" / "inner.txt") << "inner";
        
        std::string output = runCore(baseCommands());
        assert(output.find("path=\"ignored.txt\"") == std::string::npos && "Root .gitignore applies");
        assert(output.find("path=\"nested/inner.txt\"") == std::string::npos && "Nested .gitignore applies");
        assert(countDocuments(output) == 3);
        
        Quill::Commands commands = baseCommands();
        commands.ignore_gitignore = true;
        output = runCore(commands);
        assert(output.find("path=\"ignored.txt\"") != std::string::npos);
        assert(output.find("path=\"nested/inner.txt\"") != std::string::npos);
        assert(countDocuments(output) == 5 && "Hidden .gitignore files stay excluded");
        
        cleanupTestProject();
        std::cout << "✓ Cascading .gitignore files test passed" << std::endl;
    }
    
    void testGitignoreAboveInput() {
        std::cout << "Testing .gitignore above the input directory..." << std::endl;
        
        setupTestProject();
        std::ofstream(test_dir / ".gitignore") << "*.txt\n";
        
        Quill::Commands commands = baseCommands();
        commands.paths = {at("sub")};
        std::string output = runCore(commands);
        assert(countDocuments(output) == 1);
        assert(output.find("path=\"sub/c.txt\"") != std::string::npos && "Outer rules do not reach the input");
        
        // Scanning from the outer directory still applies them
        output = runCore(baseCommands());
        assert(countDocuments(output) == 0);
        
        cleanupTestProject();
        std::cout << "✓ .gitignore above the input directory test passed" << std::endl;
    }
    
    void runAllTests() {
        std::cout << "Running Quill integration tests..." << std::endl;
        
        testDocumentsOutput();
        testDeduplicationAndIndexes();
        testHiddenAndIgnoreOptions();
        testGitignoreCascade();
        testGitignoreAboveInput();
        testExtensionsAndSkippedFiles();
        testLineNumbers();
        testStatsMode();
        testOutputFile();
        testPathsFromInput();
        testUsageErrors();
        testSqliteExtraction();
        testConfigFile();
        
        std::cout << "All integration tests passed!" << std::endl;
    }
};

int main() {
    try {
        IntegrationTest tests;
        tests.runAllTests();
        
        std::cout << "\n🎉 All Quill integration tests passed!" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
