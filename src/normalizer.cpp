#include "normalizer.h"
#include "logger.h"
#include "utils.h"
#include <cctype>
#include <regex>
#include <unordered_map>
#include <unordered_set>

namespace domo_nlu {

namespace {

// Outputs are already normalized and never appear as keys, which keeps normalize() idempotent.
const std::unordered_map<std::string, std::string>& colloquial_forms() {
    static const std::unordered_map<std::string, std::string> forms = {
        {"porfa", "por favor"},
        {"porfavor", "por favor"},
        {"xfa", "por favor"},
        {"xfavor", "por favor"},
        {"pls", "please"},
        {"plz", "please"},
        {"q", "que"},
        {"k", "que"},
        {"xq", "porque"},
        {"pq", "porque"},
        {"tb", "tambien"},
        {"tmb", "tambien"},
        {"x", "por"},
        {"d", "de"},
        {"dl", "del"},
        {"pa", "para"},
        {"pal", "para el"},
        {"toy", "estoy"},
        {"ta", "esta"},
        {"tan", "estan"},
    };
    return forms;
}

const std::unordered_map<std::string, std::string>& common_typos() {
    static const std::unordered_map<std::string, std::string> typos = {
        {"ensender", "encender"},
        {"ensendido", "encendido"},
        {"ensiende", "enciende"},
        {"presder", "prender"},
        {"preder", "prender"},
        {"abier", "abrir"},
        {"cerarr", "cerrar"},
        {"lus", "luz"},
        {"puertta", "puerta"},
        {"ventanna", "ventana"},
        {"cocinaa", "cocina"},
        {"cuuarto", "cuarto"},
        {"dormitiorio", "dormitorio"},
        {"habiitacion", "habitacion"},
        {"vanio", "baño"},
        {"bano", "baño"},
        {"cala", "sala"},
        {"slaa", "sala"},
    };
    return typos;
}

bool is_digit_byte(char c) {
    return c >= '0' && c <= '9';
}

/// Fold a lowercase Latin-1 letter (second byte of a C3 sequence) to ASCII; empty = keep as is
const char* fold_latin1(unsigned char d) {
    if (d >= 0xA0 && d <= 0xA5) return "a";
    if (d == 0xA6) return "ae";
    if (d == 0xA7) return "c";
    if (d >= 0xA8 && d <= 0xAB) return "e";
    if (d >= 0xAC && d <= 0xAF) return "i";
    if ((d >= 0xB2 && d <= 0xB6) || d == 0xB8) return "o";
    if (d >= 0xB9 && d <= 0xBC) return "u";
    if (d == 0xBD || d == 0xBF) return "y";
    if (d == 0xB7) return " ";  // division sign
    return "";
}

} // namespace

Normalizer::Normalizer(const NormalizerConfig& config) : config_(config) {}

std::string Normalizer::fold_characters(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    const size_t n = text.size();

    for (size_t i = 0; i < n; ++i) {
        unsigned char c = static_cast<unsigned char>(text[i]);

        if (c < 0x80) {
            if (c == '\t' || c == '\n' || c == '\r') {
                out += ' ';
            } else if (std::isupper(c)) {
                out += static_cast<char>(std::tolower(c));
            } else if (std::ispunct(c)) {
                bool after_digit = !out.empty() && is_digit_byte(out.back());
                bool before_digit = i + 1 < n && is_digit_byte(text[i + 1]);
                if ((c == '.' || c == ',') && after_digit && before_digit) {
                    out += static_cast<char>(c);
                } else if (c == '%' && after_digit) {
                    out += '%';
                } else {
                    out += ' ';
                }
            } else {
                out += static_cast<char>(c);
            }
            continue;
        }

        if (c == 0xC3 && i + 1 < n) {
            unsigned char d = static_cast<unsigned char>(text[i + 1]);
            if (d >= 0x80 && d <= 0x9E && d != 0x97) {
                d = static_cast<unsigned char>(d + 0x20);  // Latin-1 capital -> small
            }
            const char* folded = fold_latin1(d);
            if (*folded) {
                out += folded;
            } else {
                out += static_cast<char>(0xC3);
                out += static_cast<char>(d);
            }
            ++i;
            continue;
        }

        if (c == 0xC2 && i + 1 < n) {
            unsigned char d = static_cast<unsigned char>(text[i + 1]);
            // nbsp ¡ « ¨ ´ · » ¿
            if (d == 0xA0 || d == 0xA1 || d == 0xAB || d == 0xA8 || d == 0xB4 ||
                d == 0xB7 || d == 0xBB || d == 0xBF) {
                out += ' ';
            } else {
                out += static_cast<char>(c);
                out += static_cast<char>(d);
            }
            ++i;
            continue;
        }

        // Combining diacritical marks U+0300..U+036F (decomposed input)
        if (i + 1 < n && (c == 0xCC || (c == 0xCD && static_cast<unsigned char>(text[i + 1]) <= 0xAF))) {
            unsigned char d = static_cast<unsigned char>(text[i + 1]);
            if (c == 0xCC && d == 0x83 && !out.empty() && out.back() == 'n') {
                out.back() = static_cast<char>(0xC3);
                out += static_cast<char>(0xB1);
            }
            ++i;
            continue;
        }

        // General punctuation U+2000..U+203F: dashes, curly quotes, ellipsis, special spaces
        if (c == 0xE2 && i + 2 < n && static_cast<unsigned char>(text[i + 1]) == 0x80) {
            out += ' ';
            i += 2;
            continue;
        }

        out += static_cast<char>(c);
    }

    return out;
}

std::string Normalizer::normalize(const std::string& text) const {
    if (utils::is_empty_or_whitespace(text)) {
        return "";
    }

    std::vector<std::string> words;
    for (const auto& token : utils::split_words(fold_characters(text))) {
        std::string current = token;
        if (config_.expand_colloquialisms) {
            auto it = colloquial_forms().find(current);
            if (it != colloquial_forms().end()) {
                current = it->second;
            }
        }
        if (config_.fix_typos) {
            auto it = common_typos().find(current);
            if (it != common_typos().end()) {
                current = it->second;
            }
        }
        words.push_back(current);
    }

    std::string result = utils::collapse_spaces(utils::join_words(words));
    if (Logger::get_level() == LogLevel::DEBUG && result != text) {
        LOG_NORM("\"" + text + "\" -> \"" + result + "\"");
    }
    return result;
}

std::vector<std::string> Normalizer::tokenize(const std::string& text) const {
    return utils::split_words(normalize(text));
}

std::vector<std::string> Normalizer::extract_numbers(const std::string& normalized_text) {
    static const std::regex number_pattern("\\d+(?:[.,]\\d+)?%?");
    std::vector<std::string> numbers;
    auto begin = std::sregex_iterator(normalized_text.begin(), normalized_text.end(), number_pattern);
    for (auto it = begin; it != std::sregex_iterator(); ++it) {
        numbers.push_back(it->str());
    }
    return numbers;
}

bool Normalizer::is_stopword(const std::string& token) {
    static const std::unordered_set<std::string> stopwords = {
        "el", "la", "los", "las", "un", "una", "unos", "unas", "lo",
        "de", "del", "al", "a", "en", "por", "para", "con", "sin", "y",
        "mi", "tu", "su", "mis", "tus", "sus",
        "me", "te", "se", "nos", "les", "le",
        "que", "cual", "cuales", "como", "donde",
        "favor", "please",
        "the", "an", "of", "in", "on", "at", "to", "my", "and", "for",
    };
    return stopwords.count(token) > 0;
}

} // namespace domo_nlu
