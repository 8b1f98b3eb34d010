// =================================================================
// src/Quill/BinaryClassifier.cpp
// =================================================================
// Implementation for binary/text classification.

#include "Quill/BinaryClassifier.hpp"
#include "Quill/Errors.hpp"
#include "Quill/SysInteraction.hpp"
#include <fstream>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <unordered_set>

namespace Quill {

namespace {

const std::unordered_set<std::string>& binaryExtensions() {
    static const std::unordered_set<std::string> extensions = {
        // Images
        ".png", ".jpg", ".jpeg", ".gif", ".bmp", ".ico", ".webp", ".tif", ".tiff", ".psd",
        // Audio
        ".mp3", ".wav", ".flac", ".ogg", ".aac", ".m4a", ".wma",
        // Video
        ".mp4", ".avi", ".mov", ".mkv", ".webm", ".wmv", ".flv",
        // Compiled objects and executables
        ".o", ".obj", ".a", ".lib", ".so", ".dll", ".dylib", ".exe", ".bin",
        ".class", ".pyc", ".pyo", ".wasm",
        // Archives
        ".zip", ".tar", ".gz", ".tgz", ".bz2", ".xz", ".7z", ".rar", ".jar", ".whl",
        // Databases
        ".db", ".sqlite", ".sqlite3",
        // Documents
        ".pdf",
        // Logs
        ".log"
    };
    return extensions;
}

} // namespace

FileKind BinaryClassifier::classify(const std::string& path) const {
    if (hasBinaryExtension(path)) {
        return FileKind::Binary;
    }
    return sampleIsBinary(path) ? FileKind::Binary : FileKind::Text;
}

bool BinaryClassifier::hasBinaryExtension(const std::string& path) {
    std::string extension = std::filesystem::path(path).extension().string();
    if (extension.empty()) {
        return false;
    }
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return binaryExtensions().count(extension) > 0;
}

bool BinaryClassifier::looksBinary(const char* data, size_t size) {
    size_t high_bytes = 0;
    for (size_t i = 0; i < size; ++i) {
        unsigned char byte = static_cast<unsigned char>(data[i]);
        if (byte == 0) {
            return true;
        }
        if (byte > 127) {
            high_bytes++;
        }
    }
    
    return size > 0 && (static_cast<double>(high_bytes) / size) > kHighByteRatio;
}

bool BinaryClassifier::sampleIsBinary(const std::string& path) const {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return true;
    }
    
    char buffer[kSampleSize];
    file.read(buffer, kSampleSize);
    if (file.bad()) {
        return true;
    }
    size_t bytes_read = static_cast<size_t>(file.gcount());
    
    return looksBinary(buffer, bytes_read);
}

std::string BinaryClassifier::readTextFile(const std::string& path) {
    SysInteraction sys;
    std::string content = sys.readFile(path);
    
    size_t invalid_at = findInvalidUtf8(content);
    if (invalid_at != std::string::npos) {
        throw DecodeError(path, invalid_at);
    }
    return content;
}

size_t BinaryClassifier::findInvalidUtf8(const std::string& text) {
    const size_t length = text.size();
    size_t i = 0;
    
    while (i < length) {
        unsigned char lead = static_cast<unsigned char>(text[i]);
        if (lead < 0x80) {
            ++i;
            continue;
        }
        
        size_t continuation = 0;
        unsigned int code_point = 0;
        unsigned int minimum = 0;
        if ((lead & 0xE0) == 0xC0) {
            continuation = 1;
            code_point = lead & 0x1F;
            minimum = 0x80;
        } else if ((lead & 0xF0) == 0xE0) {
            continuation = 2;
            code_point = lead & 0x0F;
            minimum = 0x800;
        } else if ((lead & 0xF8) == 0xF0) {
            continuation = 3;
            code_point = lead & 0x07;
            minimum = 0x10000;
        } else {
            return i;
        }
        
        if (i + continuation >= length) {
            return i;
        }
        for (size_t k = 1; k <= continuation; ++k) {
            unsigned char byte = static_cast<unsigned char>(text[i + k]);
            if ((byte & 0xC0) != 0x80) {
                return i;
            }
            code_point = (code_point << 6) | (byte & 0x3F);
        }
        
        // Overlong forms, UTF-16 surrogates and values past U+10FFFF
        if (code_point < minimum ||
            (code_point >= 0xD800 && code_point <= 0xDFFF) ||
            code_point > 0x10FFFF) {
            return i;
        }
        
        i += continuation + 1;
    }
    
    return std::string::npos;
}

} // namespace Quill
