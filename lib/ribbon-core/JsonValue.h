#pragma once
// JsonValue — minimal JSON document model and reader for the small files
// this project reads (pair sets, themes). No external dependency.
//
//   JsonValue root;
//   std::string err;
//   if (!parseJson(text, root, err)) { ... }
//   const JsonValue& pairs = root["pairs"];
//   for (size_t i = 0; i < pairs.size(); ++i) pairs[i]["id"].inum();
//
// Lookups on a missing key / index return a shared Null value, so chained
// access never fails; check type() where presence matters.

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace ribbon {

class JsonValue
{
public:
    enum Type { Null, Bool, Num, Str, Arr, Obj };

    using Array  = std::vector<JsonValue>;
    using Object = std::vector<std::pair<std::string, JsonValue>>;

    Type type() const { return m_type; }
    bool isNull()   const { return m_type == Null; }
    bool isString() const { return m_type == Str; }
    bool isNumber() const { return m_type == Num; }
    bool isArray()  const { return m_type == Arr; }
    bool isObject() const { return m_type == Obj; }

    double             num()     const { return m_type == Num ? m_num : 0.0; }
    int                inum()    const { return (int)num(); }
    const std::string& str()     const;
    bool               boolean() const { return m_type == Bool ? m_bool : false; }

    bool has(const std::string& key) const;
    const JsonValue& operator[](const std::string& key) const;
    const JsonValue& operator[](size_t i) const;
    size_t size() const;

    static JsonValue makeBool(bool b);
    static JsonValue makeNumber(double n);
    static JsonValue makeString(std::string s);
    static JsonValue makeArray();
    static JsonValue makeObject();

    // Builders used by the parser. No-ops on the wrong type.
    void append(JsonValue v);
    void set(std::string key, JsonValue v);

private:
    Type        m_type = Null;
    bool        m_bool = false;
    double      m_num  = 0.0;
    std::string m_str;
    std::shared_ptr<Array>  m_arr;
    std::shared_ptr<Object> m_obj;
};

// Parse a complete document. On failure returns false and writes a message
// with the byte offset into `error`; `out` is left Null.
bool parseJson(const std::string& text, JsonValue& out, std::string& error);

// Read a whole file into `out`. Returns false if the file cannot be opened.
bool readTextFile(const std::string& path, std::string& out);

} // namespace ribbon
