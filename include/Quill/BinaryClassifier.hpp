// =================================================================
// include/Quill/BinaryClassifier.hpp
// =================================================================
// Header for deciding whether a file is opaque binary or readable text.

#pragma once

#include <string>
#include <cstddef>

namespace Quill {

enum class FileKind {
    Binary,
    Text
};

/**
 * @brief Classifies files as binary or text before their content is read
 *
 * A file is binary when its extension is on a fixed denylist, when the
 * first kSampleSize bytes contain a NUL, or when more than kHighByteRatio
 * of those bytes have the high bit set. Files that cannot be opened are
 * treated as binary.
 */
class BinaryClassifier {
public:
    static constexpr size_t kSampleSize = 1024;
    static constexpr double kHighByteRatio = 0.30;

    /**
     * @brief Classify a file on disk
     * @param path Path to the file
     * @return FileKind::Binary or FileKind::Text
     */
    FileKind classify(const std::string& path) const;

    /**
     * @brief Check the extension denylist (case-insensitive)
     * @param path Path or file name
     * @return true if the extension is a known binary format
     */
    static bool hasBinaryExtension(const std::string& path);

    /**
     * @brief Apply the NUL and high-bit heuristics to a byte sample
     * @param data Sample bytes
     * @param size Number of bytes in the sample
     * @return true if the sample looks binary
     */
    static bool looksBinary(const char* data, size_t size);

    /**
     * @brief Read a whole file and validate it as UTF-8
     * @param path Path to the file
     * @return File content, unchanged
     * @throws DecodeError if the content is not valid UTF-8
     * @throws std::runtime_error if the file cannot be read
     */
    static std::string readTextFile(const std::string& path);

    /**
     * @brief Find the first invalid UTF-8 sequence
     * @param text Bytes to validate
     * @return Offset of the first invalid byte, or std::string::npos
     */
    static size_t findInvalidUtf8(const std::string& text);

private:
    bool sampleIsBinary(const std::string& path) const;
};

} // namespace Quill
