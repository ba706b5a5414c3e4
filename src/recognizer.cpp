#include "recognizer.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <array>
#include <string_view>

namespace ner {

    namespace {

        struct Word {
            size_t start;
            size_t end;
        };

        constexpr std::array<std::string_view, 5> kHonorifics = { "Mr.", "Mrs.", "Ms.", "Dr.", "Prof." };

        // Слова из латинских букв, дефис допускается внутри слова
        std::vector<Word> split_ascii_words(const std::string& text) {
            std::vector<Word> words;
            size_t i = 0;
            while (i < text.size()) {
                if (!utils::is_ascii_alpha(text[i])) {
                    ++i;
                    continue;
                }
                size_t start = i;
                while (i < text.size()) {
                    if (utils::is_ascii_alpha(text[i])) {
                        ++i;
                    }
                    else if (text[i] == '-' && i + 1 < text.size() && utils::is_ascii_alpha(text[i + 1])) {
                        ++i;
                    }
                    else {
                        break;
                    }
                }
                words.push_back({ start, i });
            }
            return words;
        }

        // Начало обращения, стоящего перед именем через один пробел, либо start без изменений
        size_t absorb_honorific(const std::string& text, size_t start) {
            if (start == 0 || text[start - 1] != ' ') {
                return start;
            }
            for (auto h : kHonorifics) {
                if (start < h.size() + 1) continue;
                size_t h_start = start - 1 - h.size();
                if (std::string_view(text).substr(h_start, h.size()) != h) continue;
                if (h_start > 0 && utils::is_ascii_alpha(text[h_start - 1])) continue;
                return h_start;
            }
            return start;
        }
    }

    GazetteerRecognizer::GazetteerRecognizer(std::unordered_set<std::string> given_names) {
        for (const auto& n : given_names) {
            given_names_.insert(utils::to_lower(n));
        }
    }

    std::shared_ptr<GazetteerRecognizer> GazetteerRecognizer::load_from_file(const std::string& path) {
        auto lines = utils::read_list_file(path);
        if (!lines) {
            throw errors::RecognizerUnavailable("cannot open name list " + path);
        }
        if (lines->empty()) {
            throw errors::RecognizerUnavailable("name list " + path + " is empty");
        }
        return std::make_shared<GazetteerRecognizer>(
            std::unordered_set<std::string>(lines->begin(), lines->end()));
    }

    std::vector<RecognizedSpan> GazetteerRecognizer::recognize(const std::string& text) const {
        std::vector<RecognizedSpan> spans;
        auto words = split_ascii_words(text);

        auto is_capitalized = [&](const Word& w) { return utils::is_ascii_upper(text[w.start]); };

        size_t i = 0;
        while (i < words.size()) {
            const Word& first = words[i];
            std::string key = utils::to_lower(text.substr(first.start, first.end - first.start));
            if (!is_capitalized(first) || given_names_.count(key) == 0) {
                ++i;
                continue;
            }

            size_t last = i;
            while (last + 1 < words.size() && last + 1 - i < kMaxNameTokens) {
                const Word& cur = words[last];
                const Word& next = words[last + 1];
                if (next.start != cur.end + 1 || text[cur.end] != ' ' || !is_capitalized(next)) {
                    break;
                }
                ++last;
            }

            spans.push_back({ absorb_honorific(text, first.start), words[last].end, kPersonLabel });
            i = last + 1;
        }
        return spans;
    }
}
