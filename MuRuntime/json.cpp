#include "MuRuntime.h"

namespace MuRuntime {

// ============================================================================
// Parser helpers
// ============================================================================

namespace {

const int kMaxDepth = 64;

struct ParseError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

void skip_whitespace(const char*& p) {
    while (*p && std::isspace(static_cast<unsigned char>(*p))) p++;
}

void append_utf8(std::string& out, uint32_t cp) {
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
}

uint32_t parse_hex4(const char*& p) {
    uint32_t cp = 0;
    for (int i = 0; i < 4; ++i) {
        char c = *p;
        cp <<= 4;
        if (c >= '0' && c <= '9') cp |= static_cast<uint32_t>(c - '0');
        else if (c >= 'a' && c <= 'f') cp |= static_cast<uint32_t>(c - 'a' + 10);
        else if (c >= 'A' && c <= 'F') cp |= static_cast<uint32_t>(c - 'A' + 10);
        else throw ParseError("Invalid \\u escape");
        p++;
    }
    return cp;
}

std::string parse_string(const char*& p) {
    if (*p != '"') throw ParseError("Expected '\"'");
    p++;

    std::string result;
    while (*p && *p != '"') {
        if (*p == '\\') {
            p++;
            switch (*p) {
                case 'n': result += '\n'; p++; break;
                case 't': result += '\t'; p++; break;
                case 'r': result += '\r'; p++; break;
                case 'b': result += '\b'; p++; break;
                case 'f': result += '\f'; p++; break;
                case '/': result += '/'; p++; break;
                case '\\': result += '\\'; p++; break;
                case '"': result += '"'; p++; break;
                case 'u': {
                    p++;
                    uint32_t cp = parse_hex4(p);
                    if (cp >= 0xD800 && cp <= 0xDBFF && p[0] == '\\' && p[1] == 'u') {
                        p += 2;
                        uint32_t low = parse_hex4(p);
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                    }
                    append_utf8(result, cp);
                    break;
                }
                default:
                    throw ParseError("Invalid escape sequence");
            }
        } else {
            result += *p++;
        }
    }

    if (*p != '"') throw ParseError("Unterminated string");
    p++;
    return result;
}

double parse_number(const char*& p) {
    const char* start = p;
    if (*p == '-') p++;
    if (!std::isdigit(static_cast<unsigned char>(*p))) throw ParseError("Expected digit");
    while (std::isdigit(static_cast<unsigned char>(*p))) p++;
    if (*p == '.') {
        p++;
        while (std::isdigit(static_cast<unsigned char>(*p))) p++;
    }
    if (*p == 'e' || *p == 'E') {
        p++;
        if (*p == '+' || *p == '-') p++;
        while (std::isdigit(static_cast<unsigned char>(*p))) p++;
    }
    return std::strtod(std::string(start, p - start).c_str(), nullptr);
}

Json parse_value(const char*& p, int depth) {
    if (depth > kMaxDepth) throw ParseError("Nesting too deep");
    skip_whitespace(p);

    if (*p == '"') return Json(parse_string(p));

    if (*p == '{') {
        p++;
        Json::Object obj;
        skip_whitespace(p);
        if (*p == '}') { p++; return Json(std::move(obj)); }
        while (true) {
            skip_whitespace(p);
            std::string key = parse_string(p);
            skip_whitespace(p);
            if (*p != ':') throw ParseError("Expected ':'");
            p++;
            obj[key] = parse_value(p, depth + 1);
            skip_whitespace(p);
            if (*p == ',') { p++; continue; }
            if (*p == '}') { p++; break; }
            throw ParseError("Expected ',' or '}'");
        }
        return Json(std::move(obj));
    }

    if (*p == '[') {
        p++;
        Json::Array arr;
        skip_whitespace(p);
        if (*p == ']') { p++; return Json(std::move(arr)); }
        while (true) {
            arr.push_back(parse_value(p, depth + 1));
            skip_whitespace(p);
            if (*p == ',') { p++; continue; }
            if (*p == ']') { p++; break; }
            throw ParseError("Expected ',' or ']'");
        }
        return Json(std::move(arr));
    }

    if (std::isdigit(static_cast<unsigned char>(*p)) || *p == '-') return Json(parse_number(p));

    if (strncmp(p, "true", 4) == 0) { p += 4; return Json(true); }
    if (strncmp(p, "false", 5) == 0) { p += 5; return Json(false); }
    if (strncmp(p, "null", 4) == 0) { p += 4; return Json(); }

    throw ParseError(*p ? std::string("Unexpected character '") + *p + "'" : "Unexpected end of input");
}

void format_number(std::ostringstream& ss, double d) {
    if (!std::isfinite(d)) {
        ss << "null";
        return;
    }
    if (d == std::floor(d) && std::fabs(d) < 1e15) {
        ss << static_cast<long long>(d);
        return;
    }
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.15g", d);
    ss << buf;
}

void dump_into(std::ostringstream& ss, const Json& j) {
    switch (j.type()) {
        case Json::Type::NUL: ss << "null"; break;
        case Json::Type::BOOL: ss << (j.as_bool() ? "true" : "false"); break;
        case Json::Type::NUMBER: format_number(ss, j.as_number()); break;
        case Json::Type::STRING: ss << '"' << json_escape(j.as_string()) << '"'; break;
        case Json::Type::ARRAY: {
            ss << '[';
            bool first = true;
            for (const auto& item : j.as_array()) {
                if (!first) ss << ',';
                first = false;
                dump_into(ss, item);
            }
            ss << ']';
            break;
        }
        case Json::Type::OBJECT: {
            ss << '{';
            bool first = true;
            for (const auto& [key, value] : j.as_object()) {
                if (!first) ss << ',';
                first = false;
                ss << '"' << json_escape(key) << "\":";
                dump_into(ss, value);
            }
            ss << '}';
            break;
        }
    }
}

const Json& null_json() {
    static const Json null;
    return null;
}

} // namespace

// ============================================================================
// Json
// ============================================================================

Json::Type Json::type() const {
    switch (v.index()) {
        case 0: return Type::NUL;
        case 1: return Type::BOOL;
        case 2: return Type::NUMBER;
        case 3: return Type::STRING;
        case 4: return Type::ARRAY;
        default: return Type::OBJECT;
    }
}

bool Json::as_bool(bool fallback) const {
    if (auto* b = std::get_if<bool>(&v)) return *b;
    return fallback;
}

double Json::as_number(double fallback) const {
    if (auto* d = std::get_if<double>(&v)) return *d;
    return fallback;
}

int64_t Json::as_int(int64_t fallback) const {
    if (auto* d = std::get_if<double>(&v)) return static_cast<int64_t>(*d);
    return fallback;
}

std::string Json::as_string(const std::string& fallback) const {
    if (auto* s = std::get_if<std::string>(&v)) return *s;
    return fallback;
}

const Json::Array& Json::as_array() const {
    static const Array empty;
    if (auto* a = std::get_if<Array>(&v)) return *a;
    return empty;
}

const Json::Object& Json::as_object() const {
    static const Object empty;
    if (auto* o = std::get_if<Object>(&v)) return *o;
    return empty;
}

bool Json::has(const std::string& key) const {
    auto* o = std::get_if<Object>(&v);
    return o && o->count(key) > 0;
}

const Json& Json::operator[](const std::string& key) const {
    auto* o = std::get_if<Object>(&v);
    if (!o) return null_json();
    auto it = o->find(key);
    return it == o->end() ? null_json() : it->second;
}

Json& Json::operator[](const std::string& key) {
    if (!is_object()) v = Object{};
    return std::get<Object>(v)[key];
}

void Json::push_back(Json item) {
    if (!is_array()) v = Array{};
    std::get<Array>(v).push_back(std::move(item));
}

size_t Json::size() const {
    if (auto* a = std::get_if<Array>(&v)) return a->size();
    if (auto* o = std::get_if<Object>(&v)) return o->size();
    return 0;
}

std::string Json::dump() const {
    std::ostringstream ss;
    dump_into(ss, *this);
    return ss.str();
}

std::optional<Json> Json::parse(const std::string& text, std::string* error) {
    const char* p = text.c_str();
    try {
        Json result = parse_value(p, 0);
        skip_whitespace(p);
        if (*p) throw ParseError("Trailing characters after JSON value");
        return result;
    } catch (const ParseError& e) {
        if (error) *error = e.what();
        return std::nullopt;
    }
}

std::string json_escape(const std::string& s) {
    std::ostringstream ss;
    for (unsigned char c : s) {
        if (c == '"') ss << "\\\"";
        else if (c == '\\') ss << "\\\\";
        else if (c == '\n') ss << "\\n";
        else if (c == '\r') ss << "\\r";
        else if (c == '\t') ss << "\\t";
        else if (c == '\b') ss << "\\b";
        else if (c == '\f') ss << "\\f";
        else if (c < 32) {
            ss << "\\u" << std::hex << std::setfill('0') << std::setw(4) << static_cast<int>(c);
            ss << std::dec;
        }
        else ss << c;
    }
    return ss.str();
}

} // namespace MuRuntime
