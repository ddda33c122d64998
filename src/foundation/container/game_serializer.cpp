/// @file game_serializer.cpp
/// @brief Token-level JSON helpers and the non-template parts of GameSerializer.

#include "tbc/foundation/game_serializer.hpp"

#include <charconv>

namespace tbc::foundation {

namespace detail {

// ── Escaping ────────────────────────────────────────────────────────────────

std::string escapeJson(std::string_view sv) {
    std::string out;
    out.reserve(sv.size());
    for (char c : sv) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:   out += c; break;
        }
    }
    return out;
}

// ── Scalar parsing ──────────────────────────────────────────────────────────

bool parseBool(std::string_view raw, bool& out) {
    if (raw == "true") { out = true; return true; }
    if (raw == "false") { out = false; return true; }
    return false;
}

template <typename N>
static bool parseWhole(std::string_view raw, N& out) {
    const char* first = raw.data();
    const char* last = raw.data() + raw.size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc() && ptr == last;
}

bool parseSigned(std::string_view raw, int64_t& out) {
    return parseWhole(raw, out);
}

bool parseUnsigned(std::string_view raw, uint64_t& out) {
    return parseWhole(raw, out);
}

bool parseDouble(std::string_view raw, double& out) {
    return parseWhole(raw, out);
}

// ── JsonReader ──────────────────────────────────────────────────────────────

void JsonReader::skipWhitespace() {
    while (pos_ < data_.size() &&
           (data_[pos_] == ' ' || data_[pos_] == '\t' ||
            data_[pos_] == '\n' || data_[pos_] == '\r')) {
        ++pos_;
    }
}

bool JsonReader::expect(char c) {
    skipWhitespace();
    if (pos_ < data_.size() && data_[pos_] == c) {
        ++pos_;
        return true;
    }
    return false;
}

bool JsonReader::peek(char c) {
    skipWhitespace();
    return pos_ < data_.size() && data_[pos_] == c;
}

bool JsonReader::atEnd() {
    skipWhitespace();
    return pos_ >= data_.size();
}

bool JsonReader::readQuotedString(std::string& out) {
    skipWhitespace();
    if (pos_ >= data_.size() || data_[pos_] != '"') return false;
    ++pos_;
    out.clear();
    while (pos_ < data_.size() && data_[pos_] != '"') {
        if (data_[pos_] == '\\') {
            ++pos_;
            if (pos_ >= data_.size()) return false;
            switch (data_[pos_]) {
                case 'b': out += '\b'; break;
                case 'f': out += '\f'; break;
                case 'n': out += '\n'; break;
                case 'r': out += '\r'; break;
                case 't': out += '\t'; break;
                default:  out += data_[pos_]; break;
            }
        } else {
            out += data_[pos_];
        }
        ++pos_;
    }
    if (pos_ >= data_.size()) return false;
    ++pos_;  // closing quote
    return true;
}

bool JsonReader::readScalar(std::string& out, bool& quoted) {
    skipWhitespace();
    if (pos_ >= data_.size()) return false;
    if (data_[pos_] == '"') {
        quoted = true;
        return readQuotedString(out);
    }
    quoted = false;
    // Nested containers are not part of the flat object format.
    if (data_[pos_] == '{' || data_[pos_] == '[') return false;
    std::size_t start = pos_;
    while (pos_ < data_.size() && data_[pos_] != ',' && data_[pos_] != '}' &&
           data_[pos_] != ' ' && data_[pos_] != '\t' &&
           data_[pos_] != '\n' && data_[pos_] != '\r') {
        ++pos_;
    }
    out.assign(data_.substr(start, pos_ - start));
    return !out.empty();
}

}  // namespace detail

// ── GameSerializer ──────────────────────────────────────────────────────────

struct GameSerializer::Impl {};

GameSerializer::GameSerializer() : impl_(std::make_unique<Impl>()) {}

GameSerializer::~GameSerializer() = default;

GameSerializer::GameSerializer(GameSerializer&&) noexcept = default;

GameSerializer& GameSerializer::operator=(GameSerializer&&) noexcept = default;

GameSerializer& GameSerializer::instance() {
    static GameSerializer inst;
    return inst;
}

}  // namespace tbc::foundation
