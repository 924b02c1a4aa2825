// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The fpkit Project

#ifndef FPKIT_OPTION_PARSER_HXX
#define FPKIT_OPTION_PARSER_HXX

#include "OptionDef.hxx"

#include <span>

/**
 * Command line option parser.  Options and positional arguments may
 * be mixed; the positional ones are collected in place and are
 * available from GetRemaining() after Next() has returned false.
 */
class OptionParser
{
	std::span<const OptionDef> options;

	std::span<const char *const> args;

	const char **const remaining_head, **remaining_tail;

public:
	OptionParser(std::span<const OptionDef> _options,
		     int _argc, char **_argv) noexcept
		:options(_options), args(_argv + 1, _argc - 1),
		 remaining_head(const_cast<const char **>(_argv + 1)),
		 remaining_tail(remaining_head) {}

	struct Result {
		int index;
		const char *value;

		constexpr operator bool() const noexcept {
			return index >= 0;
		}
	};

	/**
	 * Parses the next option.  Returns a result which evaluates
	 * to false when there are no more options.
	 *
	 * Throws std::invalid_argument on unknown options or a
	 * missing value.
	 */
	Result Next();

	/**
	 * Returns the remaining non-option arguments.
	 */
	std::span<const char *const> GetRemaining() const noexcept {
		return {remaining_head, remaining_tail};
	}

private:
	const char *CheckShiftValue(const char *s, const OptionDef &option);
	Result IdentifyOption(const char *s);
};

/**
 * Print a short usage summary of all options to stderr.
 */
void
PrintOptionHelp(std::span<const OptionDef> options) noexcept;

#endif
