#ifndef RESAMPLER_HPP
#define RESAMPLER_HPP

#include <cstdint>
#include <memory>
#include <vector>

/**
 * Mono PCM16 sample-rate converter.
 *
 * Implementations are stateless between calls: every call converts one
 * complete utterance, so a single instance may be shared by all sessions.
 */
class Resampler
{
public:
    virtual ~Resampler() = default;

    virtual const char *name() const = 0;

    // Throws std::runtime_error if the underlying library reports an error.
    virtual std::vector<int16_t> process(const std::vector<int16_t> &in,
                                         uint32_t inRateHz,
                                         uint32_t outRateHz) = 0;

    // Returns nullptr when no resampling library was available at build time.
    static std::shared_ptr<Resampler> createDefault(int quality);
};

#endif // RESAMPLER_HPP
