#include "recognizer/entity_model.hpp"
#include "core/error.hpp"
#include "core/utf8.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <charconv>
#include <format>
#include <fstream>
#include <sstream>

namespace promptguard {

namespace {

bool is_upper(wchar_t c) {
    return (c >= L'A' && c <= L'Z') || (c >= 0xC0 && c <= 0xDE && c != 0xD7);
}

bool is_lower(wchar_t c) {
    return (c >= L'a' && c <= L'z') || (c >= 0xDF && c <= 0xFF && c != 0xF7);
}

bool is_token_char(wchar_t c) {
    return is_upper(c) || is_lower(c) || (c >= L'0' && c <= L'9') || c == L'_';
}

wchar_t fold(wchar_t c) {
    if (c >= L'A' && c <= L'Z') return static_cast<wchar_t>(c + 0x20);
    if (c >= 0xC0 && c <= 0xDE && c != 0xD7) return static_cast<wchar_t>(c + 0x20);
    return c;
}

bool gap_matches(std::wstring_view text, size_t from, size_t to, std::wstring_view allowed) {
    for (size_t i = from; i < to; ++i) {
        const wchar_t c = text[i];
        if (c != L' ' && c != L'\t' && allowed.find(c) == std::wstring_view::npos) {
            return false;
        }
    }
    return true;
}

// Between tokens of one phrase or run
bool is_space_gap(std::wstring_view text, size_t from, size_t to) {
    return from < to && gap_matches(text, from, to, L"");
}

// Between a cue and its run ("Sr. Pérez", "nombre: Ana")
bool is_cue_gap(std::wstring_view text, size_t from, size_t to) {
    return from < to && gap_matches(text, from, to, L".,:");
}

std::vector<std::string_view> split_tabs(std::string_view line) {
    std::vector<std::string_view> fields;
    size_t pos = 0;
    while (true) {
        const auto tab = line.find('\t', pos);
        if (tab == std::string_view::npos) {
            fields.push_back(line.substr(pos));
            break;
        }
        fields.push_back(line.substr(pos, tab - pos));
        pos = tab + 1;
    }
    return fields;
}

} // anonymous namespace

std::vector<LexiconEntityModel::Token> LexiconEntityModel::tokenize(std::wstring_view text) {
    std::vector<Token> tokens;
    size_t i = 0;
    while (i < text.size()) {
        if (!is_token_char(text[i])) {
            ++i;
            continue;
        }
        Token token{};
        token.start = i;
        size_t letters = 0;
        bool has_lower = false;
        while (i < text.size() && is_token_char(text[i])) {
            if (is_lower(text[i])) has_lower = true;
            if (is_lower(text[i]) || is_upper(text[i])) ++letters;
            token.folded.push_back(fold(text[i]));
            ++i;
        }
        token.end = i;
        token.capitalised = is_upper(text[token.start]);
        token.all_caps = letters >= 2 && !has_lower;
        token.placeholder = token.start > 0 && text[token.start - 1] == L'<';
        tokens.push_back(std::move(token));
    }
    return tokens;
}

bool LexiconEntityModel::add_phrase(
    std::unordered_map<std::wstring, std::vector<Phrase>>& index,
    std::wstring_view phrase, std::string label, double score) {

    Phrase entry{{}, std::move(label), score};
    for (auto& token : tokenize(phrase)) {
        entry.tokens.push_back(std::move(token.folded));
    }
    if (entry.tokens.empty()) {
        return false;
    }
    index[entry.tokens.front()].push_back(std::move(entry));
    return true;
}

const LexiconEntityModel::Phrase* LexiconEntityModel::match_at(
    const std::unordered_map<std::wstring, std::vector<Phrase>>& index,
    std::wstring_view text, const std::vector<Token>& tokens, size_t pos) {

    const auto it = index.find(tokens[pos].folded);
    if (it == index.end()) {
        return nullptr;
    }
    for (const auto& phrase : it->second) {
        const size_t n = phrase.tokens.size();
        if (pos + n > tokens.size()) {
            continue;
        }
        bool ok = true;
        for (size_t k = 1; k < n && ok; ++k) {
            ok = tokens[pos + k].folded == phrase.tokens[k]
                && is_space_gap(text, tokens[pos + k - 1].end, tokens[pos + k].start);
        }
        if (ok) {
            return &phrase;
        }
    }
    return nullptr;
}

size_t LexiconEntityModel::extend_run(std::wstring_view text,
                                      const std::vector<Token>& tokens, size_t first) const {
    size_t last = first;
    size_t count = 1;
    size_t j = first + 1;
    while (j < tokens.size() && count < kMaxRunTokens) {
        const auto& t = tokens[j];
        if (t.placeholder || !is_space_gap(text, tokens[j - 1].end, t.start)) {
            break;
        }
        if (t.capitalised) {
            last = j;
            ++count;
            ++j;
            continue;
        }
        // "Ana de Luca": connector only counts when a capitalised token follows
        if (connectors_.contains(t.folded) && j + 1 < tokens.size()) {
            const auto& next = tokens[j + 1];
            if (next.capitalised && !next.placeholder && is_space_gap(text, t.end, next.start)) {
                last = j + 1;
                ++count;
                j += 2;
                continue;
            }
        }
        break;
    }
    return last;
}

std::vector<EntitySpan> LexiconEntityModel::predict(std::wstring_view text,
                                                    std::stop_token stop) const {
    const auto tokens = tokenize(text);
    std::vector<EntitySpan> spans;

    size_t next_poll = 0;
    const auto poll = [&](size_t i) {
        if (i < next_poll) {
            return;
        }
        if (stop.stop_requested()) {
            throw RequestCancelled("entity model inference cancelled");
        }
        next_poll = i + kStopCheckTokens;
    };

    for (size_t i = 0; i < tokens.size();) {
        poll(i);
        const Phrase* entry = match_at(entries_, text, tokens, i);
        if (entry == nullptr) {
            ++i;
            continue;
        }
        const size_t last = i + entry->tokens.size() - 1;
        spans.push_back({entry->label, tokens[i].start, tokens[last].end, entry->score});
        i = last + 1;
    }

    next_poll = 0;
    for (size_t i = 0; i < tokens.size();) {
        poll(i);
        const Phrase* cue = match_at(cues_, text, tokens, i);
        if (cue == nullptr) {
            ++i;
            continue;
        }
        const size_t first = i + cue->tokens.size();
        if (first >= tokens.size()) {
            break;
        }
        const auto& head = tokens[first];
        if (!head.capitalised || head.all_caps || head.placeholder
            || !is_cue_gap(text, tokens[first - 1].end, head.start)) {
            i = first;
            continue;
        }
        const size_t last = extend_run(text, tokens, first);
        spans.push_back({cue->label, head.start, tokens[last].end, cue->score});
        i = last + 1;
    }

    return spans;
}

LexiconEntityModel LexiconEntityModel::load_from_string(std::string_view content,
                                                        std::string language,
                                                        std::string_view origin) {
    LexiconEntityModel model;
    model.language_ = std::move(language);

    size_t line_no = 0;
    size_t pos = 0;
    while (pos <= content.size()) {
        auto nl = content.find('\n', pos);
        if (nl == std::string_view::npos) nl = content.size();
        std::string_view line = content.substr(pos, nl - pos);
        pos = nl + 1;
        ++line_no;

        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        if (utils::trim(line).empty() || line.front() == '#') {
            continue;
        }

        const auto fields = split_tabs(line);
        const auto kind = fields[0];

        if (kind == "CONNECTOR") {
            if (fields.size() != 2 || utils::trim(fields[1]).empty()) {
                throw ConfigurationError(std::format(
                    "{}:{}: CONNECTOR expects one word", origin, line_no));
            }
            for (auto& token : tokenize(utf8::widen(fields[1]))) {
                model.connectors_.insert(std::move(token.folded));
            }
            continue;
        }

        if (kind != "ENT" && kind != "CUE") {
            throw ConfigurationError(std::format(
                "{}:{}: unknown entry type '{}'", origin, line_no, kind));
        }
        if (fields.size() < 3 || fields.size() > 4 || fields[1].empty()) {
            throw ConfigurationError(std::format(
                "{}:{}: {} expects label, phrase and optional score", origin, line_no, kind));
        }

        double score = (kind == "ENT") ? kDefaultEntryScore : kDefaultCueScore;
        if (fields.size() == 4) {
            const auto text = fields[3];
            const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), score);
            if (ec != std::errc{} || ptr != text.data() + text.size() || score < 0.0 || score > 1.0) {
                throw ConfigurationError(std::format(
                    "{}:{}: score must be a number in [0, 1]", origin, line_no));
            }
        }

        auto& index = (kind == "ENT") ? model.entries_ : model.cues_;
        if (!add_phrase(index, utf8::widen(fields[2]), std::string(fields[1]), score)) {
            throw ConfigurationError(std::format(
                "{}:{}: phrase has no word characters", origin, line_no));
        }
        ++(kind == "ENT" ? model.entry_count_ : model.cue_count_);
    }

    if (model.entry_count_ == 0 && model.cue_count_ == 0) {
        throw ConfigurationError(std::format("entity model {} holds no entries", origin));
    }

    for (auto* index : {&model.entries_, &model.cues_}) {
        for (auto& [first, phrases] : *index) {
            std::stable_sort(phrases.begin(), phrases.end(),
                [](const Phrase& a, const Phrase& b) { return a.tokens.size() > b.tokens.size(); });
        }
    }

    return model;
}

LexiconEntityModel LexiconEntityModel::load_from_file(const std::string& path,
                                                      std::string language) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw ConfigurationError("entity model file not found: " + path);
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw ConfigurationError("failed to read entity model file: " + path);
    }

    auto model = load_from_string(buffer.str(), std::move(language), path);
    utils::log::info(std::format("Entity model loaded: {} ({} entries, {} cues, language {})",
        path, model.entry_count_, model.cue_count_, model.language_));
    return model;
}

} // namespace promptguard
