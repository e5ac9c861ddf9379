#include "Resampler.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

#if defined(HAVE_SPEEXDSP)
#include <speex/speex_resampler.h>
#endif

#define MODULE "RESAMPLER"

#if defined(HAVE_SPEEXDSP)

namespace {

struct SpeexStateDeleter
{
    void operator()(SpeexResamplerState *st) const
    {
        if (st)
            speex_resampler_destroy(st);
    }
};
using SpeexStatePtr = std::unique_ptr<SpeexResamplerState, SpeexStateDeleter>;

class SpeexResampler : public Resampler
{
public:
    explicit SpeexResampler(int quality) : quality_(quality) {}

    const char *name() const override { return "speexdsp"; }

    std::vector<int16_t> process(const std::vector<int16_t> &in,
                                 uint32_t inRateHz,
                                 uint32_t outRateHz) override
    {
        if (in.empty() || inRateHz == outRateHz)
            return in;

        int err = RESAMPLER_ERR_SUCCESS;
        SpeexStatePtr st(speex_resampler_init(1, inRateHz, outRateHz, quality_, &err));
        if (!st || err != RESAMPLER_ERR_SUCCESS)
        {
            throw std::runtime_error(std::string("speex_resampler_init failed: ")
                                     + speex_resampler_strerror(err));
        }
        speex_resampler_skip_zeros(st.get());

        // Pad with the filter latency so the tail is flushed out.
        std::vector<int16_t> padded(in);
        padded.resize(in.size() + speex_resampler_get_input_latency(st.get()), 0);

        size_t expected = static_cast<size_t>(
            (static_cast<uint64_t>(in.size()) * outRateHz + inRateHz / 2) / inRateHz);
        std::vector<int16_t> out(expected + 256);

        size_t consumed = 0;
        size_t produced = 0;
        while (consumed < padded.size() && produced < out.size())
        {
            spx_uint32_t inLen = static_cast<spx_uint32_t>(padded.size() - consumed);
            spx_uint32_t outLen = static_cast<spx_uint32_t>(out.size() - produced);
            err = speex_resampler_process_int(st.get(), 0, padded.data() + consumed, &inLen,
                                              out.data() + produced, &outLen);
            if (err != RESAMPLER_ERR_SUCCESS)
            {
                throw std::runtime_error(std::string("speex_resampler_process_int failed: ")
                                         + speex_resampler_strerror(err));
            }
            if (inLen == 0 && outLen == 0)
                break;
            consumed += inLen;
            produced += outLen;
        }

        out.resize(std::min(produced, expected));
        return out;
    }

private:
    int quality_;
};

} // namespace

std::shared_ptr<Resampler> Resampler::createDefault(int quality)
{
    LOG_DEBUG("Using speexdsp resampler, quality " << quality);
    return std::make_shared<SpeexResampler>(quality);
}

#else

std::shared_ptr<Resampler> Resampler::createDefault(int quality)
{
    LOG_WARN("Built without a resampling library; audio at rates other than the "
             "backend rate is passed through unchanged");
    return nullptr;
}

#endif // HAVE_SPEEXDSP
