// =================================================================
// tests/IgnorePatternTest.cpp
// =================================================================
// Unit tests for gitignore pattern parsing and matching.

#include "Quill/IgnorePattern.hpp"
#include <iostream>
#include <filesystem>
#include <fstream>
#include <cassert>

namespace fs = std::filesystem;

class IgnorePatternTest {
private:
    std::string test_dir;
    
public:
    IgnorePatternTest()
        : test_dir((fs::temp_directory_path() / "quill_ignore_pattern_test").string()) {}
    
    void testBasicPatterns() {
        std::cout << "Testing basic patterns..." << std::endl;
        
        Quill::IgnorePattern star("*.tmp");
        assert(star.matches("file.tmp"));
        assert(star.matches("deep/nested/file.tmp") && "Unanchored patterns match at any depth");
        assert(!star.matches("file.tmp.txt"));
        
        Quill::IgnorePattern question("file?.c");
        assert(question.matches("file1.c"));
        assert(!question.matches("file10.c"));
        
        Quill::IgnorePattern range("log[0-9].txt");
        assert(range.matches("log3.txt"));
        assert(!range.matches("logx.txt"));
        
        Quill::IgnorePattern negated_range("v[!0-9]");
        assert(negated_range.matches("va"));
        assert(!negated_range.matches("v1"));
        
        Quill::IgnorePattern literal("a+b(c).txt");
        assert(literal.matches("a+b(c).txt") && "Regex metacharacters are literal");
        
        std::cout << "✓ Basic patterns test passed" << std::endl;
    }
    
    void testCommentsAndBlankLines() {
        std::cout << "Testing comments and blank lines..." << std::endl;
        
        assert(Quill::IgnorePattern("").isEmpty());
        assert(Quill::IgnorePattern("# a comment").isEmpty());
        assert(Quill::IgnorePattern("   ").isEmpty());
        assert(!Quill::IgnorePattern("\\#literal").isEmpty());
        assert(Quill::IgnorePattern("\\#literal").matches("#literal"));
        
        Quill::IgnorePattern crlf("build\r");
        assert(crlf.matches("build") && "Carriage return is stripped");
        
        Quill::IgnorePattern trailing("notes.txt   ");
        assert(trailing.matches("notes.txt") && "Unescaped trailing spaces are dropped");
        
        std::cout << "✓ Comments and blank lines test passed" << std::endl;
    }
    
    void testDirectoryOnlyPatterns() {
        std::cout << "Testing directory-only patterns..." << std::endl;
        
        Quill::IgnorePattern dir_only("build/");
        assert(dir_only.isDirectoryOnly());
        assert(!dir_only.isAnchored() && "A trailing slash alone does not anchor");
        assert(dir_only.matches("build", true));
        assert(!dir_only.matches("build", false));
        assert(dir_only.matches("src/build", true));
        
        std::cout << "✓ Directory-only patterns test passed" << std::endl;
    }
    
    void testAnchoredPatterns() {
        std::cout << "Testing anchored patterns..." << std::endl;
        
        Quill::IgnorePattern leading("/config.json");
        assert(leading.isAnchored());
        assert(leading.matches("config.json"));
        assert(!leading.matches("sub/config.json"));
        
        Quill::IgnorePattern inner("docs/*.md");
        assert(inner.isAnchored());
        assert(inner.matches("docs/readme.md"));
        assert(!inner.matches("other/docs/readme.md"));
        assert(!inner.matches("docs/deep/readme.md") && "* does not cross /");
        
        std::cout << "✓ Anchored patterns test passed" << std::endl;
    }
    
    void testDoubleStarPatterns() {
        std::cout << "Testing ** patterns..." << std::endl;
        
        Quill::IgnorePattern leading("**/cache");
        assert(leading.matches("cache"));
        assert(leading.matches("a/b/cache"));
        
        Quill::IgnorePattern trailing("logs/**");
        assert(trailing.matches("logs/today.txt"));
        assert(trailing.matches("logs/2024/01/today.txt"));
        assert(!trailing.matches("other/logs/today.txt"));
        
        Quill::IgnorePattern middle("a/**/z");
        assert(middle.matches("a/z"));
        assert(middle.matches("a/b/c/z"));
        
        std::cout << "✓ ** patterns test passed" << std::endl;
    }
    
    void testNegationAndLastMatch() {
        std::cout << "Testing negation and last-match-wins..." << std::endl;
        
        Quill::IgnorePatternSet set;
        set.addPattern("*.log");
        set.addPattern("!important.log");
        set.addPattern("# comment is skipped");
        assert(set.size() == 2);
        
        assert(set.shouldIgnore("debug.log"));
        assert(!set.shouldIgnore("important.log"));
        assert(set.lastMatch("important.log").has_value());
        assert(set.lastMatch("important.log").value() == false);
        assert(!set.lastMatch("main.cpp").has_value() && "No opinion for unmatched paths");
        
        set.addPattern("important.log");
        assert(set.shouldIgnore("important.log") && "Later rule overrides");
        
        std::cout << "✓ Negation and last-match-wins test passed" << std::endl;
    }
    
    void testLoadFromFile() {
        std::cout << "Testing loading from file..." << std::endl;
        
        fs::create_directories(test_dir);
        std::string path = test_dir + "/.gitignore";
        std::ofstream(path) << "# Build output\n"
                               "build/\n"
                               "\n"
                               "*.o\r\n"
                               "!keep.o\n";
        
        Quill::IgnorePatternSet set;
        assert(set.loadFromFile(path) == 3);
        assert(set.shouldIgnore("build", true));
        assert(set.shouldIgnore("main.o"));
        assert(!set.shouldIgnore("keep.o"));
        
        Quill::IgnorePatternSet missing;
        assert(missing.loadFromFile(test_dir + "/does-not-exist") == 0);
        assert(missing.empty());
        
        fs::remove_all(test_dir);
        std::cout << "✓ Loading from file test passed" << std::endl;
    }
    
    void runAllTests() {
        std::cout << "Running IgnorePattern unit tests..." << std::endl;
        
        testBasicPatterns();
        testCommentsAndBlankLines();
        testDirectoryOnlyPatterns();
        testAnchoredPatterns();
        testDoubleStarPatterns();
        testNegationAndLastMatch();
        testLoadFromFile();
        
        std::cout << "All IgnorePattern tests passed!" << std::endl;
    }
};

int main() {
    try {
        IgnorePatternTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
