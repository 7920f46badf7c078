#pragma once

#include "../audio/AudioChunk.h"
#include <cstdint>
#include <vector>

// G.711 companding between RTP payloads and 16-bit linear PCM chunks.
class G711Utils {
public:
    static constexpr int PT_PCMU = 0;
    static constexpr int PT_PCMA = 8;
    static constexpr int SAMPLE_RATE = 8000;

    static int16_t ulawToLinear(uint8_t ulaw) {
        ulaw = ~ulaw;
        int t = ((ulaw & 0x0F) << 3) + 0x84;
        t <<= (ulaw & 0x70) >> 4;
        return static_cast<int16_t>((ulaw & 0x80) ? (0x84 - t) : (t - 0x84));
    }

    static int16_t alawToLinear(uint8_t alaw) {
        alaw ^= 0x55;
        int t = (alaw & 0x0F) << 4;
        int seg = (alaw & 0x70) >> 4;
        if (seg) t = (t + 0x108) << (seg - 1);
        else t += 8;
        return static_cast<int16_t>((alaw & 0x80) ? t : -t);
    }

    static uint8_t linearToULaw(int16_t sample) {
        const int BIAS = 0x84;
        const int CLIP = 32635;
        int pcm = sample;
        int mask = 0xFF;
        if (pcm < 0) {
            pcm = -pcm;
            mask = 0x7F;
        }
        if (pcm > CLIP) pcm = CLIP;
        pcm += BIAS;

        int seg = 0;
        for (int t = pcm >> 7; t > 1 && seg < 7; t >>= 1) seg++;
        uint8_t uval = static_cast<uint8_t>((seg << 4) | ((pcm >> (seg + 3)) & 0x0F));
        return static_cast<uint8_t>(uval ^ mask);
    }

    static uint8_t linearToALaw(int16_t sample) {
        int pcm = sample;
        int mask = 0xD5;
        if (pcm < 0) {
            pcm = -pcm - 1;
            mask = 0x55;
        }
        if (pcm > 32767) pcm = 32767;

        int seg = 0;
        for (int t = pcm >> 8; t > 0 && seg < 7; t >>= 1) seg++;
        uint8_t aval;
        if (seg == 0) aval = static_cast<uint8_t>((pcm >> 4) & 0x0F);
        else aval = static_cast<uint8_t>((seg << 4) | ((pcm >> (seg + 3)) & 0x0F));
        return static_cast<uint8_t>(aval ^ mask);
    }

    static bool isSupported(int payloadType) {
        return payloadType == PT_PCMU || payloadType == PT_PCMA;
    }

    // One byte of payload becomes one PCM16 sample (two bytes).
    static AudioChunk decode(int payloadType, const uint8_t* payload, size_t len) {
        AudioChunk pcm;
        pcm.reserve(len * 2);
        for (size_t i = 0; i < len; ++i) {
            int16_t s = (payloadType == PT_PCMA) ? alawToLinear(payload[i])
                                                 : ulawToLinear(payload[i]);
            Pcm16::append(pcm, s);
        }
        return pcm;
    }

    static std::vector<uint8_t> encode(int payloadType, const AudioChunk& pcm) {
        size_t n = Pcm16::sampleCount(pcm);
        std::vector<uint8_t> out(n);
        for (size_t i = 0; i < n; ++i) {
            int16_t s = Pcm16::sampleAt(pcm, i);
            out[i] = (payloadType == PT_PCMA) ? linearToALaw(s) : linearToULaw(s);
        }
        return out;
    }
};
