/**
 * @file DocumentLoader.hpp
 * @brief Turns a file on disk into a Document (plain text or PDF via pdftotext).
 */

#pragma once
#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <utility>

#include "domain/Document.hpp"

namespace learnpath::infrastructure {

class DocumentLoader {
public:
    /**
     * @brief Loads the file; the document title is the file stem.
     * @return nullopt when the file cannot be read or a PDF yields no text.
     */
    static std::optional<domain::Document> Load(const std::string& path,
                                                std::function<void(std::string)> statusCallback = nullptr) {
        std::filesystem::path p(path);
        std::string ext = p.extension().string();
        std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c){ return std::tolower(c); });

        std::optional<std::string> content;
        if (ext == ".pdf") {
            if (statusCallback) statusCallback("Extracting text with pdftotext...");
            content = ExtractPdf(path);
        } else {
            content = ReadText(path);
        }
        if (!content) {
            return std::nullopt;
        }

        domain::DocumentMeta meta;
        meta.title = p.stem().string();
        meta.sourcePath = std::filesystem::absolute(p).string();
        return domain::Document(meta, std::move(*content));
    }

    /** @brief Reads a whole text file (used for TOC files too). */
    static std::optional<std::string> ReadText(const std::string& path) {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open()) {
            std::cerr << "[DocumentLoader] Could not open " << path << std::endl;
            return std::nullopt;
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    /**
     * @brief Single-quotes a value for /bin/sh. Embedded quotes become '\''
     * so $, backticks, backslashes and double quotes stay literal.
     */
    static std::string ShellQuote(const std::string& value) {
        std::string quoted = "'";
        for (char c : value) {
            if (c == '\'') {
                quoted += "'\\''";
            } else {
                quoted.push_back(c);
            }
        }
        quoted.push_back('\'');
        return quoted;
    }

    /** @brief Runs a shell command and captures stdout. nullopt if it cannot start or exits non-zero. */
    static std::optional<std::string> RunCommand(const std::string& cmd) {
        FILE* pipe = popen(cmd.c_str(), "r");
        if (!pipe) {
            std::cerr << "[DocumentLoader] Could not start: " << cmd << std::endl;
            return std::nullopt;
        }
        std::string output;
        char buffer[4096];
        std::size_t read = 0;
        while ((read = fread(buffer, 1, sizeof(buffer), pipe)) > 0) {
            output.append(buffer, read);
        }
        const int status = pclose(pipe);
        if (status != 0) {
            std::cerr << "[DocumentLoader] Command failed with status " << status << ": " << cmd << std::endl;
            return std::nullopt;
        }
        return output;
    }

private:
    static bool IsValidContent(const std::string& content) {
        std::size_t nonWhitespace = 0;
        for (char c : content) {
            if (!std::isspace(static_cast<unsigned char>(c))) {
                ++nonWhitespace;
                if (nonWhitespace >= 10) return true;
            }
        }
        return false;
    }

    static std::optional<std::string> ExtractPdf(const std::string& path) {
        if (!std::filesystem::exists(path)) {
            std::cerr << "[DocumentLoader] No such file: " << path << std::endl;
            return std::nullopt;
        }
        auto content = RunCommand("pdftotext " + ShellQuote(path) + " - 2>/dev/null");
        if (!content) {
            std::cerr << "[DocumentLoader] pdftotext failed for " << path
                      << " (is poppler-utils installed?)" << std::endl;
            return std::nullopt;
        }
        if (!IsValidContent(*content)) {
            std::cerr << "[DocumentLoader] pdftotext produced no text for " << path
                      << " (scanned PDFs need OCR first)" << std::endl;
            return std::nullopt;
        }
        return content;
    }
};

} // namespace learnpath::infrastructure
