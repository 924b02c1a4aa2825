// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The fpkit Project

/*
 * Decode a stored fingerprint and print its algorithm and raw items.
 */

#include "fingerprint/Codec.hxx"
#include "fingerprint/Algorithm.hxx"
#include "lib/chromaprint/Init.hxx"
#include "cmdline/OptionDef.hxx"
#include "cmdline/OptionParser.hxx"
#include "Log.hxx"
#include "LogBackend.hxx"

#include <fmt/core.h>

#include <cerrno>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

#include <stdlib.h>
#include <unistd.h>

struct CommandLine {
	std::string_view fingerprint;

	bool binary = false;
	bool verbose = false;
};

enum Option {
	OPTION_BINARY,
	OPTION_VERBOSE,
};

static constexpr OptionDef option_defs[] = {
	{"binary", 'b', false, "Read the binary form from stdin"},
	{"verbose", 'v', false, "Verbose logging"},
};

static CommandLine
ParseCommandLine(int argc, char **argv)
{
	CommandLine c;

	OptionParser option_parser(option_defs, argc, argv);
	while (auto o = option_parser.Next()) {
		switch (Option(o.index)) {
		case OPTION_BINARY:
			c.binary = true;
			break;

		case OPTION_VERBOSE:
			c.verbose = true;
			break;
		}
	}

	auto args = option_parser.GetRemaining();
	if (c.binary ? !args.empty() : args.size() != 1)
		throw std::runtime_error("Usage: DumpFingerprint [--verbose] FINGERPRINT\n"
					 "       DumpFingerprint [--verbose] --binary <FILE");

	if (!c.binary)
		c.fingerprint = args[0];
	return c;
}

static std::string
ReadAll(int fd)
{
	std::string result;
	char buffer[4096];

	while (true) {
		const ssize_t nbytes = read(fd, buffer, sizeof(buffer));
		if (nbytes < 0) {
			if (errno == EINTR)
				continue;

			throw std::system_error(errno, std::system_category(),
						"Failed to read fingerprint");
		}

		if (nbytes == 0)
			return result;

		result.append(buffer, nbytes);
	}
}

int
main(int argc, char **argv)
try {
	const auto c = ParseCommandLine(argc, argv);

	SetLogThreshold(c.verbose ? LogLevel::DEBUG : LogLevel::INFO);
	ScopeChromaprintInit chromaprint_init;
	auto &engine = chromaprint_init.GetEngine();

	const std::string input = c.binary
		? ReadAll(STDIN_FILENO)
		: std::string{c.fingerprint};

	const auto decoded = Fingerprint::DecodeFingerprint(engine, input,
							    !c.binary);

	fmt::print("algorithm: {}\n", Fingerprint::ToString(decoded.algorithm));
	fmt::print("length: {}\n", decoded.raw.size());
	fmt::print("hash: {:08x}\n",
		   Fingerprint::HashFingerprint(engine, decoded.raw));

	for (const int32_t i : decoded.raw)
		fmt::print("{:08x}\n", static_cast<uint32_t>(i));

	return EXIT_SUCCESS;
} catch (...) {
	LogError(std::current_exception());
	return EXIT_FAILURE;
}
