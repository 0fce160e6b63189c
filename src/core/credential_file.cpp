#include "credential_file.hpp"
#include "utils.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <sstream>

// ── Character helpers ─────────────────────────────────────────

static bool is_bare_char(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
           (c >= '0' && c <= '9') || c == '_' || c == '-';
}

static bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

static int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Encode a code point as UTF-8. Rejects surrogates and values past U+10FFFF.
static bool append_utf8(std::string& out, unsigned long cp) {
    if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
    return true;
}

bool is_bare_key(const std::string& name) {
    return !name.empty() && std::all_of(name.begin(), name.end(), is_bare_char);
}

// ── Line parser ───────────────────────────────────────────────

namespace {

// Cursor over a single trimmed line. Errors are plain messages;
// CredentialFile::parse() adds the line number.
struct LineParser {
    const std::string& line;
    size_t pos = 0;
    std::string error;

    explicit LineParser(const std::string& l) : line(l) {}

    bool at_end() const { return pos >= line.size(); }
    char peek() const { return at_end() ? '\0' : line[pos]; }

    void skip_ws() {
        while (!at_end() && (line[pos] == ' ' || line[pos] == '\t')) pos++;
    }

    bool fail(const std::string& msg) {
        error = msg;
        return false;
    }

    // Only whitespace or a comment may follow
    bool expect_line_end() {
        skip_ws();
        if (at_end() || peek() == '#') return true;
        return fail(fmt::format("unexpected '{}'", line.substr(pos)));
    }

    bool parse_name(std::string& out);
    bool parse_basic_string(std::string& out);
    bool parse_literal_string(std::string& out);
    bool parse_value(Value& out);
    bool parse_number(const std::string& token, Value& out);
};

bool LineParser::parse_name(std::string& out) {
    char c = peek();
    bool ok;
    if (c == '"') {
        ok = parse_basic_string(out);
    } else if (c == '\'') {
        ok = parse_literal_string(out);
    } else {
        size_t start = pos;
        while (!at_end() && is_bare_char(line[pos])) pos++;
        if (pos == start) return fail("expected a name");
        out = line.substr(start, pos - start);
        ok = true;
    }
    if (ok && out.empty()) return fail("empty names are not supported");
    return ok;
}

bool LineParser::parse_basic_string(std::string& out) {
    if (line.compare(pos, 3, "\"\"\"") == 0) {
        return fail("multi-line strings are not supported");
    }
    pos++;  // opening quote
    out.clear();

    while (!at_end()) {
        char c = line[pos++];
        if (c == '"') return true;
        if (c != '\\') {
            out += c;
            continue;
        }
        if (at_end()) break;

        char e = line[pos++];
        switch (e) {
            case '"':  out += '"';  break;
            case '\\': out += '\\'; break;
            case 'b':  out += '\b'; break;
            case 't':  out += '\t'; break;
            case 'n':  out += '\n'; break;
            case 'f':  out += '\f'; break;
            case 'r':  out += '\r'; break;
            case 'u':
            case 'U': {
                size_t len = (e == 'u') ? 4 : 8;
                if (pos + len > line.size()) return fail("truncated unicode escape");
                unsigned long cp = 0;
                for (size_t k = 0; k < len; ++k) {
                    int d = hex_digit(line[pos + k]);
                    if (d < 0) return fail("invalid unicode escape");
                    cp = cp * 16 + static_cast<unsigned long>(d);
                }
                pos += len;
                if (!append_utf8(out, cp)) return fail("invalid unicode code point");
                break;
            }
            default:
                return fail(fmt::format("invalid escape '\\{}'", e));
        }
    }
    return fail("unterminated string");
}

bool LineParser::parse_literal_string(std::string& out) {
    if (line.compare(pos, 3, "'''") == 0) {
        return fail("multi-line strings are not supported");
    }
    pos++;
    auto close = line.find('\'', pos);
    if (close == std::string::npos) return fail("unterminated string");
    out = line.substr(pos, close - pos);
    pos = close + 1;
    return true;
}

bool LineParser::parse_value(Value& out) {
    char c = peek();
    if (at_end() || c == '#') return fail("missing value");

    if (c == '"' || c == '\'') {
        std::string s;
        bool ok = (c == '"') ? parse_basic_string(s) : parse_literal_string(s);
        if (!ok) return false;
        out = std::move(s);
        return true;
    }
    if (c == '[') return fail("arrays are not supported");
    if (c == '{') return fail("inline tables are not supported");

    size_t start = pos;
    while (!at_end() && line[pos] != ' ' && line[pos] != '\t' && line[pos] != '#') pos++;
    std::string token = line.substr(start, pos - start);

    if (token == "true") {
        out = true;
        return true;
    }
    if (token == "false") {
        out = false;
        return true;
    }
    return parse_number(token, out);
}

// Decimal integers and floats: optional sign, '_' only between digits,
// no leading zeros, inf / nan.
bool LineParser::parse_number(const std::string& token, Value& out) {
    std::string body = token;
    bool negative = false;
    if (!body.empty() && (body[0] == '+' || body[0] == '-')) {
        negative = body[0] == '-';
        body.erase(0, 1);
    }

    if (body == "inf" || body == "nan") {
        double d = (body == "inf") ? std::numeric_limits<double>::infinity()
                                   : std::numeric_limits<double>::quiet_NaN();
        out = negative ? -d : d;
        return true;
    }

    auto scan_digits = [&body](size_t& i) {
        size_t start = i;
        while (i < body.size()) {
            if (is_digit(body[i])) {
                i++;
            } else if (body[i] == '_' && i > start && i + 1 < body.size() &&
                       is_digit(body[i - 1]) && is_digit(body[i + 1])) {
                i++;
            } else {
                break;
            }
        }
        return i > start;
    };

    const std::string unsupported = fmt::format("unsupported value '{}'", token);

    size_t i = 0;
    if (!scan_digits(i)) return fail(unsupported);
    size_t int_len = i;
    bool is_float = false;

    if (i < body.size() && body[i] == '.') {
        i++;
        if (!scan_digits(i)) return fail(unsupported);
        is_float = true;
    }
    if (i < body.size() && (body[i] == 'e' || body[i] == 'E')) {
        i++;
        if (i < body.size() && (body[i] == '+' || body[i] == '-')) i++;
        if (!scan_digits(i)) return fail(unsupported);
        is_float = true;
    }
    if (i != body.size()) return fail(unsupported);
    if (int_len > 1 && body[0] == '0') {
        return fail(fmt::format("leading zeros are not allowed in '{}'", token));
    }

    std::string clean;
    clean.reserve(token.size());
    for (char ch : token) {
        if (ch != '_') clean += ch;
    }

    errno = 0;
    char* end = nullptr;
    if (is_float) {
        double d = std::strtod(clean.c_str(), &end);
        if (errno == ERANGE && std::isinf(d)) {
            return fail(fmt::format("float '{}' is out of range", token));
        }
        out = d;
    } else {
        long long v = std::strtoll(clean.c_str(), &end, 10);
        if (errno == ERANGE) {
            return fail(fmt::format("integer '{}' is out of range", token));
        }
        out = static_cast<int64_t>(v);
    }
    return true;
}

} // namespace

// ── CredentialFile ────────────────────────────────────────────

Result<CredentialFile> CredentialFile::parse(const std::string& text) {
    CredentialFile file;
    constexpr size_t kNoSection = static_cast<size_t>(-1);
    size_t current = kNoSection;

    // Editors on Windows like to start the file with a UTF-8 byte order mark
    static const std::string kBom = "\xEF\xBB\xBF";
    const bool has_bom = text.compare(0, kBom.size(), kBom) == 0;
    std::istringstream in(has_bom ? text.substr(kBom.size()) : text);
    std::string line;
    int line_no = 0;

    auto error = [&line_no](const std::string& msg) {
        return Result<CredentialFile>::Err(ErrorKind::ParseError,
                                           fmt::format("line {}: {}", line_no, msg));
    };

    while (std::getline(in, line)) {
        line_no++;
        trim(line);
        if (line.empty() || line[0] == '#') continue;

        LineParser p(line);

        // ── [section] ──
        if (line[0] == '[') {
            if (line.size() > 1 && line[1] == '[') {
                return error("arrays of tables are not supported");
            }
            p.pos = 1;
            p.skip_ws();
            std::string name;
            if (!p.parse_name(name)) return error(p.error);
            p.skip_ws();
            if (p.peek() == '.') {
                return error(fmt::format("nested table under [{}] is not supported", name));
            }
            if (p.peek() != ']') return error("expected ']'");
            p.pos++;
            if (!p.expect_line_end()) return error(p.error);

            // A repeated header re-opens the section where it first appeared
            current = file.section_index(name);
            continue;
        }

        // ── key = value ──
        std::string key;
        if (!p.parse_name(key)) return error(p.error);
        p.skip_ws();
        if (p.peek() == '.') {
            return error(fmt::format("dotted key '{}.' is not supported, values must be scalars", key));
        }
        if (p.peek() != '=') return error("expected '='");
        p.pos++;
        p.skip_ws();

        Value value;
        if (!p.parse_value(value)) return error(p.error);
        if (!p.expect_line_end()) return error(p.error);

        if (current == kNoSection) {
            return error(fmt::format("key '{}' is outside of any [section]", key));
        }

        auto& section = file.sections_[current];
        auto it = std::find_if(section.entries.begin(), section.entries.end(),
                               [&key](const auto& e) { return e.first == key; });
        if (it == section.entries.end()) {
            section.entries.emplace_back(key, std::move(value));
        } else if (it->second.index() != value.index()) {
            return error(fmt::format("key '{}' in [{}] redefined as {} (was {})", key,
                                     section.name, value_kind_name(value),
                                     value_kind_name(it->second)));
        } else {
            it->second = std::move(value);  // last one wins
        }
    }

    return Result<CredentialFile>::Ok(std::move(file));
}

static std::string format_name(const std::string& name) {
    return is_bare_key(name) ? name : value_literal(Value{name});
}

std::string CredentialFile::serialize() const {
    std::string out;
    for (size_t i = 0; i < sections_.size(); ++i) {
        const auto& section = sections_[i];
        if (i > 0) out += "\n";
        out += fmt::format("[{}]\n", format_name(section.name));
        for (const auto& [key, value] : section.entries) {
            out += fmt::format("{} = {}\n", format_name(key), value_literal(value));
        }
    }
    return out;
}

const CredentialFile::Section* CredentialFile::find_section(const std::string& name) const {
    for (const auto& s : sections_) {
        if (s.name == name) return &s;
    }
    return nullptr;
}

const Value* CredentialFile::find(const std::string& section, const std::string& key) const {
    const Section* s = find_section(section);
    if (!s) return nullptr;
    for (const auto& [k, v] : s->entries) {
        if (k == key) return &v;
    }
    return nullptr;
}

void CredentialFile::set(const std::string& section, const std::string& key, Value value) {
    auto& entries = sections_[section_index(section)].entries;
    for (auto& [k, v] : entries) {
        if (k == key) {
            v = std::move(value);
            return;
        }
    }
    entries.emplace_back(key, std::move(value));
}

bool CredentialFile::remove(const std::string& section, const std::string& key) {
    for (auto& s : sections_) {
        if (s.name != section) continue;
        auto it = std::find_if(s.entries.begin(), s.entries.end(),
                               [&key](const auto& e) { return e.first == key; });
        if (it == s.entries.end()) return false;
        s.entries.erase(it);
        return true;
    }
    return false;
}

std::vector<SectionListing> CredentialFile::listing() const {
    std::vector<SectionListing> out;
    out.reserve(sections_.size());
    for (const auto& s : sections_) {
        SectionListing l;
        l.name = s.name;
        for (const auto& e : s.entries) l.keys.push_back(e.first);
        out.push_back(std::move(l));
    }
    return out;
}

size_t CredentialFile::section_index(const std::string& name) {
    for (size_t i = 0; i < sections_.size(); ++i) {
        if (sections_[i].name == name) return i;
    }
    sections_.push_back(Section{name, {}});
    return sections_.size() - 1;
}

// ── Value formatting ──────────────────────────────────────────

static std::string quote(const std::string& s) {
    std::string out = "\"";
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b";  break;
            case '\t': out += "\\t";  break;
            case '\n': out += "\\n";  break;
            case '\f': out += "\\f";  break;
            case '\r': out += "\\r";  break;
            default: {
                auto u = static_cast<unsigned char>(c);
                if (u < 0x20 || u == 0x7F) {
                    out += fmt::format("\\u{:04X}", static_cast<unsigned>(u));
                } else {
                    out += c;
                }
            }
        }
    }
    out += '"';
    return out;
}

static std::string float_literal(double d) {
    if (std::isnan(d)) return "nan";
    if (std::isinf(d)) return d < 0 ? "-inf" : "inf";

    // Shortest round-trip form; "1" must become "1.0" to stay a float
    std::string s = fmt::format("{}", d);
    if (s.find_first_of(".eE") == std::string::npos) s += ".0";
    return s;
}

std::string value_literal(const Value& v) {
    if (const auto* s = std::get_if<std::string>(&v)) return quote(*s);
    if (const auto* i = std::get_if<int64_t>(&v)) return fmt::format("{}", *i);
    if (const auto* d = std::get_if<double>(&v)) return float_literal(*d);
    return std::get<bool>(v) ? "true" : "false";
}

std::string format_value(const Value& v) {
    if (const auto* s = std::get_if<std::string>(&v)) return *s;
    return value_literal(v);
}

const char* value_kind_name(const Value& v) {
    switch (v.index()) {
        case 0:  return "string";
        case 1:  return "integer";
        case 2:  return "float";
        default: return "boolean";
    }
}
