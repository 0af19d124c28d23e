#include "pcm_codec.h"
#include <openssl/evp.h>
#include <algorithm>
#include <climits>

namespace calcvox {
namespace pcm {

PcmBuffer float_to_pcm16(const FloatFrame& samples) {
    PcmBuffer out(samples.size());
    for (size_t i = 0; i < samples.size(); ++i) {
        float s = std::max(-1.0f, std::min(1.0f, samples[i]));
        int32_t v = static_cast<int32_t>(s * 32768.0f);
        out[i] = static_cast<Sample>(std::max(-32768, std::min(32767, v)));
    }
    return out;
}

FloatBuffer pcm16_to_float(const PcmBuffer& samples) {
    FloatBuffer out(samples.size());
    for (size_t i = 0; i < samples.size(); ++i) {
        out[i] = static_cast<float>(samples[i]) / 32768.0f;
    }
    return out;
}

std::string base64_encode(const std::vector<uint8_t>& bytes) {
    if (bytes.empty()) {
        return "";
    }
    std::string out(4 * ((bytes.size() + 2) / 3) + 1, '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                  bytes.data(), static_cast<int>(bytes.size()));
    out.resize(written > 0 ? static_cast<size_t>(written) : 0);
    return out;
}

Result<std::vector<uint8_t>> base64_decode(const std::string& text) {
    if (text.empty()) {
        return make_decode_error("empty base64 payload");
    }
    if (text.size() % 4 != 0 || text.size() > static_cast<size_t>(INT_MAX)) {
        return make_decode_error("base64 length " + std::to_string(text.size()) + " is not a multiple of 4");
    }

    // EVP_DecodeBlock reads '=' as zero bits anywhere; only trailing "=" or "==" is padding
    const size_t first_pad = text.find('=');
    if (first_pad != std::string::npos) {
        if (first_pad < text.size() - 2) {
            return make_decode_error("base64 padding before the final quantum");
        }
        if (first_pad == text.size() - 2 && text[text.size() - 1] != '=') {
            return make_decode_error("base64 padding followed by data");
        }
    }

    std::vector<uint8_t> out(3 * (text.size() / 4));
    int decoded = EVP_DecodeBlock(out.data(),
                                  reinterpret_cast<const unsigned char*>(text.data()),
                                  static_cast<int>(text.size()));
    if (decoded < 0) {
        return make_decode_error("invalid base64 payload");
    }

    // EVP_DecodeBlock counts padding as zero bytes
    size_t padding = 0;
    if (text[text.size() - 1] == '=') padding++;
    if (text[text.size() - 2] == '=') padding++;
    out.resize(static_cast<size_t>(decoded) - padding);
    return out;
}

std::string encode_frame(const FloatFrame& samples) {
    PcmBuffer pcm = float_to_pcm16(samples);
    std::vector<uint8_t> bytes(pcm.size() * 2);
    for (size_t i = 0; i < pcm.size(); ++i) {
        uint16_t v = static_cast<uint16_t>(pcm[i]);
        bytes[2 * i] = static_cast<uint8_t>(v & 0xFF);
        bytes[2 * i + 1] = static_cast<uint8_t>(v >> 8);
    }
    return base64_encode(bytes);
}

Result<FloatBuffer> decode_fragment(const std::string& base64_data) {
    auto bytes = base64_decode(base64_data);
    if (!bytes) {
        return bytes.error();
    }
    const auto& raw = bytes.value();
    if (raw.empty()) {
        return make_decode_error("fragment decodes to zero bytes");
    }
    if (raw.size() % 2 != 0) {
        return make_decode_error("odd PCM byte count " + std::to_string(raw.size()));
    }

    PcmBuffer pcm(raw.size() / 2);
    for (size_t i = 0; i < pcm.size(); ++i) {
        uint16_t v = static_cast<uint16_t>(raw[2 * i]) |
                     static_cast<uint16_t>(static_cast<uint16_t>(raw[2 * i + 1]) << 8);
        pcm[i] = static_cast<Sample>(v);
    }
    return pcm16_to_float(pcm);
}

} // namespace pcm
} // namespace calcvox
