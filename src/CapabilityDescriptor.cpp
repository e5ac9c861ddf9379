#include "CapabilityDescriptor.hpp"

#include "Config.hpp"
#include "JsonUtil.hpp"

using namespace JsonUtil;

namespace {

void add_attribution(std::string &out, bool &sep, const Attribution &a)
{
    add_key(out, sep, "attribution", "{"); bool s = false;
    add_key(out, s, "name"); add_str(out, a.name);
    add_key(out, s, "url"); add_str(out, a.url);
    out += "}";
}

void add_program(std::string &out, const ProgramInfo &p, const char *entriesKey)
{
    out += "{"; bool sep = false;
    add_key(out, sep, "name"); add_str(out, p.name);
    add_key(out, sep, "description"); add_str(out, p.description);
    add_attribution(out, sep, p.attribution);
    add_key(out, sep, "installed"); add_bool(out, p.installed);
    add_key(out, sep, "version"); add_str(out, p.version);

    add_key(out, sep, entriesKey, "[");
    for (size_t i = 0; i < p.entries.size(); i++)
    {
        const ProgramEntry &e = p.entries[i];
        if (i) out += ",";
        out += "{"; bool s2 = false;
        add_key(out, s2, "name"); add_str(out, e.name);
        add_key(out, s2, "description"); add_str(out, e.description);
        add_attribution(out, s2, e.attribution);
        add_key(out, s2, "installed"); add_bool(out, e.installed);
        add_key(out, s2, "version"); add_str(out, e.version);
        add_key(out, s2, "languages"); add_str_array(out, e.languages);
        out += "}";
    }
    out += "]}";
}

void add_programs(std::string &out, bool &sep, const char *key,
                  const std::vector<ProgramInfo> &programs, const char *entriesKey)
{
    add_key(out, sep, key, "[");
    for (size_t i = 0; i < programs.size(); i++)
    {
        if (i) out += ",";
        add_program(out, programs[i], entriesKey);
    }
    out += "]";
}

} // namespace

std::string CapabilityDescriptor::toJson() const
{
    std::string out = "{";
    bool sep = false;
    add_programs(out, sep, "asr", asr, "models");
    add_programs(out, sep, "tts", tts, "voices");
    out += "}";
    return out;
}

std::vector<std::string> CapabilityDescriptor::modelNames() const
{
    std::vector<std::string> names;
    for (const auto &p : asr)
        for (const auto &e : p.entries)
            names.push_back(e.name);
    return names;
}

std::vector<std::string> CapabilityDescriptor::voiceNames() const
{
    std::vector<std::string> names;
    for (const auto &p : tts)
        for (const auto &e : p.entries)
            names.push_back(e.name);
    return names;
}

std::shared_ptr<const CapabilityDescriptor> CapabilityDescriptor::fromConfig(const CFG &cfg)
{
    auto desc = std::make_shared<CapabilityDescriptor>();

    if (cfg.asr.enabled)
    {
        ProgramInfo p;
        p.name = cfg.asr.program_name;
        p.description = cfg.asr.description;
        p.attribution = {cfg.asr.attribution_name, cfg.asr.attribution_url};
        p.version = cfg.asr.version;

        ProgramEntry model;
        model.name = cfg.asr.model;
        model.description = std::string(cfg.asr.description) + " - " + cfg.asr.model;
        model.attribution = p.attribution;
        model.version = cfg.asr.version;
        model.languages = splitList(cfg.asr.languages);
        p.entries.push_back(model);

        desc->asr.push_back(p);
    }

    if (cfg.tts.enabled)
    {
        ProgramInfo p;
        p.name = cfg.tts.program_name;
        p.description = cfg.tts.description;
        p.attribution = {cfg.tts.attribution_name, cfg.tts.attribution_url};
        p.version = cfg.tts.version;

        std::vector<std::string> voices = splitList(cfg.tts.voices);
        if (voices.empty())
            voices.push_back(cfg.tts.voice);
        for (const auto &v : voices)
        {
            ProgramEntry voice;
            voice.name = v;
            voice.description = std::string(cfg.tts.program_name) + " - " + v;
            voice.attribution = p.attribution;
            voice.version = cfg.tts.version;
            voice.languages = splitList(cfg.tts.languages);
            p.entries.push_back(voice);
        }

        desc->tts.push_back(p);
    }

    return desc;
}
