#include "JsonValue.h"
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iterator>

namespace ribbon {

// ============================================================
// JsonValue
// ============================================================

static const JsonValue& nullValue()
{
    static const JsonValue null;
    return null;
}

const std::string& JsonValue::str() const
{
    static const std::string empty;
    return m_type == Str ? m_str : empty;
}

bool JsonValue::has(const std::string& key) const
{
    if (m_type != Obj) return false;
    for (auto& kv : *m_obj) if (kv.first == key) return true;
    return false;
}

const JsonValue& JsonValue::operator[](const std::string& key) const
{
    if (m_type != Obj) return nullValue();
    for (auto& kv : *m_obj) if (kv.first == key) return kv.second;
    return nullValue();
}

const JsonValue& JsonValue::operator[](size_t i) const
{
    if (m_type != Arr || i >= m_arr->size()) return nullValue();
    return (*m_arr)[i];
}

size_t JsonValue::size() const
{
    if (m_type == Arr) return m_arr->size();
    if (m_type == Obj) return m_obj->size();
    return 0;
}

JsonValue JsonValue::makeBool(bool b)
{
    JsonValue v; v.m_type = Bool; v.m_bool = b; return v;
}

JsonValue JsonValue::makeNumber(double n)
{
    JsonValue v; v.m_type = Num; v.m_num = n; return v;
}

JsonValue JsonValue::makeString(std::string s)
{
    JsonValue v; v.m_type = Str; v.m_str = std::move(s); return v;
}

JsonValue JsonValue::makeArray()
{
    JsonValue v; v.m_type = Arr; v.m_arr = std::make_shared<Array>(); return v;
}

JsonValue JsonValue::makeObject()
{
    JsonValue v; v.m_type = Obj; v.m_obj = std::make_shared<Object>(); return v;
}

void JsonValue::append(JsonValue v)
{
    if (m_type == Arr) m_arr->push_back(std::move(v));
}

void JsonValue::set(std::string key, JsonValue v)
{
    if (m_type != Obj) return;
    for (auto& kv : *m_obj) {
        if (kv.first == key) { kv.second = std::move(v); return; }
    }
    m_obj->emplace_back(std::move(key), std::move(v));
}

// ============================================================
// Parser
// ============================================================
// Recursive descent over the raw buffer. The first error wins; every
// production returns false as soon as one is recorded.
namespace {

struct JsonParser {
    static constexpr int kMaxDepth = 64;

    const char* begin;
    const char* p;
    const char* end;
    std::string error;
    int         depth = 0;

    JsonParser(const char* d, size_t len) : begin(d), p(d), end(d + len) {}

    bool fail(const char* msg)
    {
        if (error.empty())
            error = std::string(msg) + " at offset " + std::to_string(p - begin);
        return false;
    }

    void ws()
    {
        while (p < end && (*p == ' ' || *p == '\t' || *p == '\n' || *p == '\r')) ++p;
    }

    bool literal(const char* word)
    {
        const char* q = p;
        for (; *word; ++word, ++q)
            if (q >= end || *q != *word) return fail("invalid literal");
        p = q;
        return true;
    }

    bool value(JsonValue& out)
    {
        ws();
        if (p >= end) return fail("unexpected end of input");
        switch (*p) {
            case '{': return object(out);
            case '[': return array(out);
            case '"': {
                std::string s;
                if (!string(s)) return false;
                out = JsonValue::makeString(std::move(s));
                return true;
            }
            case 't': if (!literal("true"))  return false; out = JsonValue::makeBool(true);  return true;
            case 'f': if (!literal("false")) return false; out = JsonValue::makeBool(false); return true;
            case 'n': if (!literal("null"))  return false; out = JsonValue();                return true;
            default:  return number(out);
        }
    }

    bool object(JsonValue& out)
    {
        if (++depth > kMaxDepth) return fail("nesting too deep");
        ++p;  // '{'
        out = JsonValue::makeObject();
        ws();
        if (p < end && *p == '}') { ++p; --depth; return true; }

        while (true) {
            ws();
            if (p >= end || *p != '"') return fail("expected object key");
            std::string key;
            if (!string(key)) return false;
            ws();
            if (p >= end || *p != ':') return fail("expected ':'");
            ++p;
            JsonValue v;
            if (!value(v)) return false;
            out.set(std::move(key), std::move(v));
            ws();
            if (p < end && *p == ',') { ++p; continue; }
            if (p < end && *p == '}') { ++p; break; }
            return fail("expected ',' or '}'");
        }
        --depth;
        return true;
    }

    bool array(JsonValue& out)
    {
        if (++depth > kMaxDepth) return fail("nesting too deep");
        ++p;  // '['
        out = JsonValue::makeArray();
        ws();
        if (p < end && *p == ']') { ++p; --depth; return true; }

        while (true) {
            JsonValue v;
            if (!value(v)) return false;
            out.append(std::move(v));
            ws();
            if (p < end && *p == ',') { ++p; continue; }
            if (p < end && *p == ']') { ++p; break; }
            return fail("expected ',' or ']'");
        }
        --depth;
        return true;
    }

    static void appendUtf8(std::string& s, unsigned cp)
    {
        if (cp < 0x80) {
            s += (char)cp;
        } else if (cp < 0x800) {
            s += (char)(0xC0 | (cp >> 6));
            s += (char)(0x80 | (cp & 0x3F));
        } else if (cp < 0x10000) {
            s += (char)(0xE0 | (cp >> 12));
            s += (char)(0x80 | ((cp >> 6) & 0x3F));
            s += (char)(0x80 | (cp & 0x3F));
        } else {
            s += (char)(0xF0 | (cp >> 18));
            s += (char)(0x80 | ((cp >> 12) & 0x3F));
            s += (char)(0x80 | ((cp >> 6) & 0x3F));
            s += (char)(0x80 | (cp & 0x3F));
        }
    }

    bool hex4(unsigned& out)
    {
        if (end - p < 4) return fail("truncated \\u escape");
        out = 0;
        for (int i = 0; i < 4; ++i, ++p) {
            char c = *p;
            out <<= 4;
            if      (c >= '0' && c <= '9') out |= (unsigned)(c - '0');
            else if (c >= 'a' && c <= 'f') out |= (unsigned)(c - 'a' + 10);
            else if (c >= 'A' && c <= 'F') out |= (unsigned)(c - 'A' + 10);
            else return fail("invalid \\u escape");
        }
        return true;
    }

    bool string(std::string& s)
    {
        ++p;  // opening quote
        while (p < end && *p != '"') {
            char c = *p++;
            if ((unsigned char)c < 0x20) return fail("control character in string");
            if (c != '\\') { s += c; continue; }

            if (p >= end) break;
            char e = *p++;
            switch (e) {
                case '"':  s += '"';  break;
                case '\\': s += '\\'; break;
                case '/':  s += '/';  break;
                case 'b':  s += '\b'; break;
                case 'f':  s += '\f'; break;
                case 'n':  s += '\n'; break;
                case 'r':  s += '\r'; break;
                case 't':  s += '\t'; break;
                case 'u': {
                    unsigned cp = 0;
                    if (!hex4(cp)) return false;
                    if (cp >= 0xDC00 && cp <= 0xDFFF) return fail("unpaired surrogate");
                    // High surrogate: a low one must follow.
                    if (cp >= 0xD800 && cp <= 0xDBFF) {
                        if (end - p < 2 || p[0] != '\\' || p[1] != 'u')
                            return fail("unpaired surrogate");
                        p += 2;
                        unsigned lo = 0;
                        if (!hex4(lo)) return false;
                        if (lo < 0xDC00 || lo > 0xDFFF) return fail("unpaired surrogate");
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
                    }
                    appendUtf8(s, cp);
                    break;
                }
                default: return fail("invalid escape");
            }
        }
        if (p >= end) return fail("unterminated string");
        ++p;  // closing quote
        return true;
    }

    bool number(JsonValue& out)
    {
        const char* s = p;
        if (p < end && *p == '-') ++p;
        if (p >= end || !std::isdigit((unsigned char)*p)) return fail("unexpected character");
        while (p < end && (std::isdigit((unsigned char)*p) || *p == '.' ||
                           *p == 'e' || *p == 'E' || *p == '+' || *p == '-'))
            ++p;

        std::string tok(s, p);
        char* stop = nullptr;
        double n = std::strtod(tok.c_str(), &stop);
        if (stop != tok.c_str() + tok.size()) { p = s; return fail("malformed number"); }
        out = JsonValue::makeNumber(n);
        return true;
    }
};

} // namespace

bool parseJson(const std::string& text, JsonValue& out, std::string& error)
{
    JsonParser parser(text.data(), text.size());
    JsonValue root;
    if (!parser.value(root)) {
        error = parser.error;
        out = JsonValue();
        return false;
    }
    parser.ws();
    if (parser.p != parser.end) {
        parser.fail("trailing characters");
        error = parser.error;
        out = JsonValue();
        return false;
    }
    out = std::move(root);
    error.clear();
    return true;
}

bool readTextFile(const std::string& path, std::string& out)
{
    std::ifstream f(path, std::ios::binary);
    if (!f) return false;
    out.assign(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
    return true;
}

} // namespace ribbon
