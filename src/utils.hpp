#pragma once
#include <vector>
#include <string>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <optional>

namespace utils {

    static inline bool is_ascii_alpha(char c) {
        return std::isalpha(static_cast<unsigned char>(c)) != 0;
    }

    static inline bool is_ascii_digit(char c) {
        return c >= '0' && c <= '9';
    }

    static inline bool is_ascii_upper(char c) {
        return c >= 'A' && c <= 'Z';
    }

    static inline std::string to_lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        return s;
    }

    static inline std::string trim(const std::string& s) {
        size_t first = s.find_first_not_of(" \t\n\r");
        if (first == std::string::npos) return "";
        size_t last = s.find_last_not_of(" \t\n\r");
        return s.substr(first, (last - first + 1));
    }

    // Подготовка текста для классификатора: нижний регистр, только буквы и пробелы,
    // пробельные последовательности схлопываются в один пробел
    static inline std::string normalize_text_for_classifier(const std::string& src) {
        std::string out;
        out.reserve(src.size());
        bool pending_space = false;
        for (char ch : src) {
            unsigned char c = static_cast<unsigned char>(ch);
            if (std::isspace(c)) {
                pending_space = !out.empty();
                continue;
            }
            if (!is_ascii_alpha(ch)) {
                continue;
            }
            if (pending_space) {
                out.push_back(' ');
                pending_space = false;
            }
            out.push_back(static_cast<char>(std::tolower(c)));
        }
        return out;
    }

    // Разбиение на слова из минимум двух алфавитно-цифровых символов (как token_pattern в TF-IDF)
    static inline std::vector<std::string> split_words(const std::string& text) {
        std::vector<std::string> words;
        std::string current;
        for (char ch : text) {
            if (std::isalnum(static_cast<unsigned char>(ch)) || ch == '_') {
                current.push_back(ch);
                continue;
            }
            if (current.size() >= 2) words.push_back(current);
            current.clear();
        }
        if (current.size() >= 2) words.push_back(current);
        return words;
    }

    // Чтение строк файла; пустые строки и комментарии (#) пропускаются
    static inline std::optional<std::vector<std::string>> read_list_file(const std::string& path) {
        std::ifstream ifs(path);
        if (!ifs.is_open()) {
            return std::nullopt;
        }
        std::vector<std::string> lines;
        std::string line;
        while (std::getline(ifs, line)) {
            line = trim(line);
            if (line.empty() || line[0] == '#') continue;
            lines.push_back(line);
        }
        return lines;
    }
}
