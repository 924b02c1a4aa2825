// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The fpkit Project

#include "PcmFormat.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "util/NumberParser.hxx"

#include <fmt/format.h>

#include <cassert>
#include <utility>

using std::string_view_literals::operator""sv;

static std::pair<std::string_view, std::string_view>
Split(std::string_view src, char ch) noexcept
{
	const auto i = src.find(ch);
	if (i == src.npos)
		return {src, {}};

	return {src.substr(0, i), src.substr(i + 1)};
}

static unsigned
ParseSampleRate(std::string_view src)
{
	const auto value = ParseInteger<unsigned>(src);
	if (!value)
		throw std::invalid_argument("Failed to parse the sample rate");

	if (!pcm_valid_sample_rate(*value))
		throw FmtInvalidArgument("Invalid sample rate: {}", *value);

	return *value;
}

static unsigned
ParseChannelCount(std::string_view src)
{
	const auto value = ParseInteger<unsigned>(src);
	if (!value)
		throw std::invalid_argument("Failed to parse the channel count");

	if (!pcm_valid_channel_count(*value))
		throw FmtInvalidArgument("Invalid channel count: {}", *value);

	return *value;
}

PcmFormat
ParsePcmFormat(std::string_view src)
{
	const auto [sample_rate_s, rest] = Split(src, ':');
	if (rest.data() == nullptr)
		throw std::invalid_argument("Channel count missing");

	PcmFormat dest;
	dest.sample_rate = ParseSampleRate(sample_rate_s);

	auto [format_s, channels_s] = Split(rest, ':');
	if (channels_s.data() == nullptr) {
		/* "RATE:CHANNELS" */
		channels_s = format_s;
	} else if (format_s != "16"sv) {
		throw FmtInvalidArgument("Unsupported sample format: \"{}\"",
					 format_s);
	}

	dest.channels = ParseChannelCount(channels_s);

	assert(dest.IsValid());
	return dest;
}

std::string
ToString(PcmFormat format)
{
	return fmt::format("{}:{}", format.sample_rate, format.channels);
}
