/**
 * @file Document.hpp
 * @brief Domain entity for a decoded input document.
 */

#pragma once
#include <string>
#include <sstream>
#include <cstddef>
#include <utility>

namespace learnpath::domain {

/**
 * @struct DocumentMeta
 * @brief Descriptive metadata carried into the persisted plan.
 */
struct DocumentMeta {
    std::string title;
    std::string author;
    std::string sourcePath;
    std::size_t wordCount = 0;
    std::size_t charCount = 0;
};

/**
 * @class Document
 * @brief Immutable raw text plus metadata. Never mutated after load.
 */
class Document {
public:
    Document(DocumentMeta meta, std::string text)
        : m_meta(std::move(meta)), m_text(std::move(text)) {
        m_meta.charCount = m_text.size();
        m_meta.wordCount = CountWords(m_text);
    }

    /** @brief Builds a document from text with only a title. */
    static Document fromText(const std::string& title, std::string text) {
        DocumentMeta meta;
        meta.title = title;
        return Document(meta, std::move(text));
    }

    const DocumentMeta& getMeta() const { return m_meta; }
    const std::string& getText() const { return m_text; }

    /** @brief True when the text holds nothing but whitespace. */
    bool isBlank() const {
        return m_text.find_first_not_of(" \t\r\n\f\v") == std::string::npos;
    }

    static std::size_t CountWords(const std::string& text) {
        std::istringstream ss(text);
        std::string word;
        std::size_t count = 0;
        while (ss >> word) ++count;
        return count;
    }

private:
    DocumentMeta m_meta;
    std::string m_text;
};

} // namespace learnpath::domain
