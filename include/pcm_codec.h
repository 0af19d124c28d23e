#pragma once

#include "common.h"
#include "errors.h"
#include <cstdint>
#include <string>
#include <vector>

namespace calcvox {

/**
 * @brief Wire encoding of audio exchanged with the agent
 *
 * Both directions carry 16-bit signed little-endian mono PCM, base64 encoded
 * inside JSON. Devices work in float samples in [-1, 1].
 */
namespace pcm {

/// Clamp to [-1, 1] and scale to int16
PcmBuffer float_to_pcm16(const FloatFrame& samples);

/// Scale int16 samples to [-1, 1)
FloatBuffer pcm16_to_float(const PcmBuffer& samples);

std::string base64_encode(const std::vector<uint8_t>& bytes);

/**
 * @brief Strict base64 decode
 * @return Bytes, or DecodeFailure on malformed input
 */
Result<std::vector<uint8_t>> base64_decode(const std::string& text);

/// Float frame -> base64 of little-endian int16 PCM (capture path)
std::string encode_frame(const FloatFrame& samples);

/**
 * @brief base64 little-endian int16 PCM -> float samples (playback path)
 * @return Samples, or DecodeFailure for empty payloads, bad base64 or an odd byte count
 */
Result<FloatBuffer> decode_fragment(const std::string& base64_data);

} // namespace pcm

} // namespace calcvox
