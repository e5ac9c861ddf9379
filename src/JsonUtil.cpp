#include "JsonUtil.hpp"

#include <cstdio>
#include <sstream>

namespace JsonUtil {

JsonPtr parse(const std::string &text)
{
    return JsonPtr(parse_json_string(text.c_str()));
}

bool isObject(const JsonValue *v)
{
    return v && v->type == JSON_OBJECT;
}

const JsonValue *member(const JsonValue *obj, const char *key)
{
    if (!isObject(obj))
        return nullptr;
    return get_object_item(const_cast<JsonValue *>(obj), key);
}

std::string getString(const JsonValue *obj, const char *key, const std::string &def)
{
    const JsonValue *v = member(obj, key);
    if (v && v->type == JSON_STRING && v->value.string)
        return v->value.string;
    return def;
}

double getNumber(const JsonValue *obj, const char *key, double def)
{
    const JsonValue *v = member(obj, key);
    if (v && v->type == JSON_NUMBER)
        return v->value.number;
    return def;
}

bool getBool(const JsonValue *obj, const char *key, bool def)
{
    const JsonValue *v = member(obj, key);
    if (v && v->type == JSON_BOOL)
        return v->value.boolean != 0;
    return def;
}

std::string escape(const std::string &s)
{
    std::string out;
    out.reserve(s.size() + 2);
    for (unsigned char c : s)
    {
        switch (c)
        {
        case '"':  out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        case '\b': out += "\\b"; break;
        case '\f': out += "\\f"; break;
        default:
            if (c < 0x20)
            {
                char b[8];
                std::snprintf(b, sizeof(b), "\\u%04x", c);
                out += b;
            }
            else
            {
                out.push_back(static_cast<char>(c));
            }
        }
    }
    return out;
}

void add_key(std::string &out, bool &sep, const char *k, const char *open)
{
    if (sep) out.push_back(','); else sep = true;
    out.push_back('"'); out += k; out.push_back('"'); out.push_back(':'); out += open;
}

void add_str(std::string &out, const std::string &s)
{
    out.push_back('"'); out += escape(s); out.push_back('"');
}

void add_num(std::string &out, long long v)
{
    out += std::to_string(v);
}

void add_float(std::string &out, double v)
{
    char b[32];
    std::snprintf(b, sizeof(b), "%g", v);
    out += b;
}

void add_bool(std::string &out, bool v)
{
    out += (v ? "true" : "false");
}

void add_str_array(std::string &out, const std::vector<std::string> &items)
{
    out.push_back('[');
    for (size_t i = 0; i < items.size(); i++)
    {
        if (i) out.push_back(',');
        add_str(out, items[i]);
    }
    out.push_back(']');
}

std::vector<std::string> splitList(const std::string &csv)
{
    std::vector<std::string> items;
    std::stringstream ss(csv);
    std::string item;
    while (std::getline(ss, item, ','))
    {
        size_t b = item.find_first_not_of(" \t");
        size_t e = item.find_last_not_of(" \t");
        if (b != std::string::npos)
            items.push_back(item.substr(b, e - b + 1));
    }
    return items;
}

} // namespace JsonUtil
