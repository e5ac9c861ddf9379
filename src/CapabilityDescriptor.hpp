#ifndef CAPABILITY_DESCRIPTOR_HPP
#define CAPABILITY_DESCRIPTOR_HPP

#include <memory>
#include <string>
#include <vector>

class CFG;

struct Attribution
{
    std::string name;
    std::string url;
};

// A model (ASR) or a voice (TTS) advertised by a program.
struct ProgramEntry
{
    std::string name;
    std::string description;
    Attribution attribution;
    bool installed = true;
    std::string version;
    std::vector<std::string> languages;
};

struct ProgramInfo
{
    std::string name;
    std::string description;
    Attribution attribution;
    bool installed = true;
    std::string version;
    std::vector<ProgramEntry> entries;
};

/**
 * What this gateway advertises in answer to describe.
 * Built once at startup and never modified afterwards.
 */
class CapabilityDescriptor
{
public:
    std::vector<ProgramInfo> asr;
    std::vector<ProgramInfo> tts;

    // The data object of an info event.
    std::string toJson() const;

    std::vector<std::string> modelNames() const;
    std::vector<std::string> voiceNames() const;

    static std::shared_ptr<const CapabilityDescriptor> fromConfig(const CFG &cfg);
};

#endif // CAPABILITY_DESCRIPTOR_HPP
