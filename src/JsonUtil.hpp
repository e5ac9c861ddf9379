#ifndef JSON_UTIL_HPP
#define JSON_UTIL_HPP

#include <json_config.h>

#include <memory>
#include <string>
#include <vector>

extern "C" {
// String parser present in jct's json_parse.c but not exported by the header
JsonValue *parse_json_string(const char *json_str);
}

namespace JsonUtil {

struct JsonDeleter
{
    void operator()(JsonValue *v) const
    {
        if (v)
            free_json_value(v);
    }
};
using JsonPtr = std::unique_ptr<JsonValue, JsonDeleter>;

// Returns an empty pointer if the text is not valid JSON.
JsonPtr parse(const std::string &text);

const JsonValue *member(const JsonValue *obj, const char *key);
bool isObject(const JsonValue *v);

// Typed lookups that fall back to def when the member is missing or mistyped.
std::string getString(const JsonValue *obj, const char *key, const std::string &def = "");
double getNumber(const JsonValue *obj, const char *key, double def);
bool getBool(const JsonValue *obj, const char *key, bool def);

// String-based JSON builder helpers
std::string escape(const std::string &s);
void add_key(std::string &out, bool &sep, const char *k, const char *open = "");
void add_str(std::string &out, const std::string &s);
void add_num(std::string &out, long long v);
void add_float(std::string &out, double v);
void add_bool(std::string &out, bool v);
void add_str_array(std::string &out, const std::vector<std::string> &items);

// Splits "en, de,fr" into {"en", "de", "fr"}; empty entries are skipped.
std::vector<std::string> splitList(const std::string &csv);

} // namespace JsonUtil

#endif // JSON_UTIL_HPP
