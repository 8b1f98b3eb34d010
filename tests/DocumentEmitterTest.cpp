// =================================================================
// tests/DocumentEmitterTest.cpp
// =================================================================
// Unit tests for document record output.

#include "Quill/DocumentEmitter.hpp"
#include "Quill/TraversalSession.hpp"
#include <iostream>
#include <sstream>
#include <cassert>

class DocumentEmitterTest {
public:
    void testDocumentFormat() {
        std::cout << "Testing document format..." << std::endl;
        
        std::ostringstream out;
        Quill::TraversalSession session;
        Quill::DocumentEmitter emitter(out, session);
        
        emitter.emit("src/a.txt", "alpha");
        emitter.emit("src/b.txt", "bravo\n");
        emitter.finish();
        
        const std::string expected =
            "<documents>\n"
            "<document path=\"src/a.txt\" index=\"1\">\n"
            "alpha\n"
            "</document>\n"
            "<document path=\"src/b.txt\" index=\"2\">\n"
            "bravo\n\n"
            "</document>\n"
            "</documents>\n";
        assert(out.str() == expected);
        assert(emitter.documentsWritten() == 2);
        
        std::cout << "✓ Document format test passed" << std::endl;
    }
    
    void testEmptyRun() {
        std::cout << "Testing empty run..." << std::endl;
        
        std::ostringstream out;
        Quill::TraversalSession session;
        Quill::DocumentEmitter emitter(out, session);
        emitter.finish();
        
        assert(out.str().empty() && "No wrapper without documents");
        assert(session.currentIndex() == 1);
        
        std::cout << "✓ Empty run test passed" << std::endl;
    }
    
    void testIndexSharedWithSession() {
        std::cout << "Testing index continuity..." << std::endl;
        
        std::ostringstream out;
        Quill::TraversalSession session;
        Quill::DocumentEmitter emitter(out, session);
        
        emitter.emit("one", "1");
        emitter.emit("two", "2");
        emitter.emit("three", "3");
        assert(session.currentIndex() == 4);
        assert(out.str().find("index=\"3\"") != std::string::npos);
        assert(out.str().find("index=\"4\"") == std::string::npos);
        
        session.reset();
        assert(session.currentIndex() == 1);
        
        std::cout << "✓ Index continuity test passed" << std::endl;
    }
    
    void testLineNumbers() {
        std::cout << "Testing line numbering..." << std::endl;
        
        using Quill::DocumentEmitter;
        assert(DocumentEmitter::addLineNumbers("a\nb\nc\nd\n") == "1  a\n2  b\n3  c\n4  d");
        assert(DocumentEmitter::addLineNumbers("x\r\ny\rz") == "1  x\n2  y\n3  z");
        assert(DocumentEmitter::addLineNumbers("") == "");
        
        std::string ten_lines;
        for (int i = 0; i < 10; ++i) {
            ten_lines += "l\n";
        }
        std::string numbered = DocumentEmitter::addLineNumbers(ten_lines);
        assert(numbered.compare(0, 5, " 1  l") == 0 && "Numbers are right-aligned");
        assert(numbered.find("10  l") != std::string::npos);
        
        std::ostringstream out;
        Quill::TraversalSession session;
        DocumentEmitter emitter(out, session, true);
        emitter.emit("f.txt", "first\nsecond");
        emitter.finish();
        assert(out.str().find("1  first\n2  second\n</document>") != std::string::npos);
        
        std::cout << "✓ Line numbering test passed" << std::endl;
    }
    
    void testDisplayPath() {
        std::cout << "Testing display paths..." << std::endl;
        
        using Quill::DocumentEmitter;
        assert(DocumentEmitter::displayPath("/work/project/src/main.cpp", "/work/project") == "src/main.cpp");
        assert(DocumentEmitter::displayPath("/work/project/src/main.cpp", "") == "/work/project/src/main.cpp");
        assert(DocumentEmitter::displayPath("/elsewhere/file.txt", "/work/project") == "/elsewhere/file.txt" &&
               "Paths outside the root are shown as given");
        assert(DocumentEmitter::displayPath("/work/project/../projectX/a", "/work/project") ==
               "/work/project/../projectX/a");
        
        std::cout << "✓ Display paths test passed" << std::endl;
    }
    
    void runAllTests() {
        std::cout << "Running DocumentEmitter unit tests..." << std::endl;
        
        testDocumentFormat();
        testEmptyRun();
        testIndexSharedWithSession();
        testLineNumbers();
        testDisplayPath();
        
        std::cout << "All DocumentEmitter tests passed!" << std::endl;
    }
};

int main() {
    try {
        DocumentEmitterTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
