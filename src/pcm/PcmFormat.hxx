// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The fpkit Project

#ifndef FPKIT_PCM_FORMAT_HXX
#define FPKIT_PCM_FORMAT_HXX

#include <string>
#include <string_view>

static constexpr unsigned MAX_CHANNELS = 8;

/**
 * Parameters of a 16 bit signed little-endian interleaved PCM stream.
 */
struct PcmFormat {
	unsigned sample_rate;

	unsigned channels;

	bool operator==(const PcmFormat &) const noexcept = default;

	constexpr bool IsValid() const noexcept;

	/**
	 * The size of one frame (one sample per channel) in bytes.
	 */
	constexpr unsigned GetFrameSize() const noexcept {
		return channels * 2;
	}
};

constexpr bool
pcm_valid_sample_rate(unsigned sample_rate) noexcept
{
	return sample_rate > 0 && sample_rate < (1 << 30);
}

constexpr bool
pcm_valid_channel_count(unsigned channels) noexcept
{
	return channels >= 1 && channels <= MAX_CHANNELS;
}

constexpr bool
PcmFormat::IsValid() const noexcept
{
	return pcm_valid_sample_rate(sample_rate) &&
		pcm_valid_channel_count(channels);
}

/**
 * Parse a string in the form "SAMPLE_RATE:CHANNELS", e.g. "44100:2".
 * The sample format is implied; for compatibility with MPD-style
 * audio format strings, "SAMPLE_RATE:16:CHANNELS" is accepted as
 * well.
 *
 * Throws std::invalid_argument on error.
 */
PcmFormat
ParsePcmFormat(std::string_view src);

/**
 * Renders the format in the form accepted by ParsePcmFormat().
 */
std::string
ToString(PcmFormat format);

#endif
