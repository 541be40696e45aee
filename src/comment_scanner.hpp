#pragma once

#include <cstddef>

#include <string>
#include <string_view>
#include <vector>

#include "comment_dialects.hpp"

namespace decomment
{
enum class Scan_phase
{
	normal,
	in_string,
	escaped,
};

/*!
 * String literal context of one line at a given column. @p delimiter_ is the
 * character that opened the current string and is kept while the phase is
 * `escaped` inside a string, so that the escape knows where to return.
 */
struct Scan_state
{
	Scan_phase phase_ = Scan_phase::normal;
	char delimiter_ = '\0';
	
	[[nodiscard]] constexpr bool inside_string() const noexcept
	{
		return delimiter_ != '\0';
	}
	
	friend constexpr bool operator==(const Scan_state&, const Scan_state&) = default;
};

/*!
 * The transition table of the string literal state machine.
 *
 * normal    + backslash        -> escaped
 * normal    + delimiter d      -> in_string(d)
 * in_string + backslash        -> escaped (inside d)
 * in_string + d                -> normal
 * escaped   + any character    -> the phase the backslash was read in
 *
 * Any other character leaves the state unchanged. A delimiter other than the
 * one which opened the string is literal text.
 */
constexpr Scan_state next_state(Scan_state state, char c, std::string_view delimiters) noexcept
{
	switch (state.phase_)
	{
	case Scan_phase::escaped:
		return Scan_state{state.inside_string() ? Scan_phase::in_string : Scan_phase::normal, state.delimiter_};
	
	case Scan_phase::normal:
		if (c == '\\')
		{
			return Scan_state{Scan_phase::escaped, '\0'};
		}
		else if (c != '\0' and delimiters.find(c) != delimiters.npos)
		{
			return Scan_state{Scan_phase::in_string, c};
		}
		
		return state;
	
	case Scan_phase::in_string:
		if (c == '\\')
		{
			return Scan_state{Scan_phase::escaped, state.delimiter_};
		}
		else if (c == state.delimiter_)
		{
			return Scan_state();
		}
		
		return state;
	}
	
	return state;
}

inline bool is_space(char c) noexcept
{
	return c == ' ' or (c >= '\t' and c <= '\r') or (c >= '\x1c' and c <= '\x1f');
}

inline std::string_view trim_right(std::string_view value) noexcept
{
	while (not value.empty() and is_space(value.back()))
	{
		value.remove_suffix(1);
	}
	
	return value;
}

inline std::string_view trim(std::string_view value) noexcept
{
	while (not value.empty() and is_space(value.front()))
	{
		value.remove_prefix(1);
	}
	
	return trim_right(value);
}

/*!
 * Splits @p text at `\n`, `\r\n`, `\r`, vertical tab, form feed and the
 * file, group and record separators. A terminator at the very end does not
 * produce an empty last line.
 */
inline std::vector<std::string_view> split_lines(std::string_view text)
{
	constexpr auto line_terminators = std::string_view("\n\r\v\f\x1c\x1d\x1e");
	
	auto result = std::vector<std::string_view>();
	auto position = std::size_t(0);
	
	while (position < text.size())
	{
		auto end = text.find_first_of(line_terminators, position);
		
		if (end == text.npos)
		{
			result.push_back(text.substr(position));
			break;
		}
		
		result.push_back(text.substr(position, end - position));
		position = end + 1;
		
		if (text[end] == '\r' and position < text.size() and text[position] == '\n')
		{
			++position;
		}
	}
	
	return result;
}

/*!
 * Removes every block comment delimited by @p open and @p close from
 * @p text. The scan is leftmost, does not nest and does not look at string
 * literals. The closing marker is searched for after the end of the opening
 * one, except for the C markers "/" "*" and "*" "/" which may share the
 * star, so that slash-star-slash is a
 * complete comment. If the closing marker is missing, everything from the
 * opening marker on is dropped.
 */
inline std::string strip_block_comments(std::string_view text, std::string_view open, std::string_view close)
{
	if (open.empty() or close.empty())
	{
		return std::string(text);
	}
	
	const bool shared_star = open == "/*" and close == "*/";
	auto result = std::string();
	result.reserve(text.size());
	auto position = std::size_t(0);
	
	while (position < text.size())
	{
		auto start = text.find(open, position);
		
		if (start == text.npos)
		{
			result += text.substr(position);
			break;
		}
		
		result += text.substr(position, start - position);
		auto end = text.find(close, shared_star ? start : start + open.size());
		
		if (end == text.npos)
		{
			break;
		}
		
		position = end + close.size();
	}
	
	return result;
}

/*!
 * Finds where a single-line comment starts in @p line. A match of @p marker
 * counts only outside of string literals (as tracked by @ref next_state over
 * @p delimiters) and only if it does not directly follow a colon, so that
 * `http://` is not taken for a comment.
 *
 * @return The index of the first valid marker or the length of @p line.
 */
inline std::ptrdiff_t find_line_comment(std::string_view line, std::string_view marker, std::string_view delimiters) noexcept
{
	if (marker.empty())
	{
		return std::ssize(line);
	}
	
	auto state = Scan_state();
	
	for (std::ptrdiff_t i = 0; i + std::ssize(marker) <= std::ssize(line); ++i)
	{
		if (line.substr(i, marker.size()) == marker
			and not state.inside_string()
			and not (i > 0 and line[i - 1] == ':'))
		{
			return i;
		}
		
		state = next_state(state, line[i], delimiters);
	}
	
	return std::ssize(line);
}

/*!
 * Removes single-line comments from each line of @p text. A line which is
 * nothing but a comment becomes empty; a trailing comment is cut off together
 * with the whitespace before it. Lines without a comment are kept verbatim.
 * The lines are joined with `\n`.
 */
inline std::string strip_line_comments(std::string_view text, std::string_view marker, std::string_view delimiters)
{
	auto result = std::string();
	result.reserve(text.size());
	bool first = true;
	
	for (auto line : split_lines(text))
	{
		if (not first)
		{
			result += '\n';
		}
		
		first = false;
		
		if (auto content = trim(line); not content.empty() and content.starts_with(marker))
		{
			continue;
		}
		
		if (auto position = find_line_comment(line, marker, delimiters); position != std::ssize(line))
		{
			result += trim_right(line.substr(0, position));
		}
		else
		{
			result += line;
		}
	}
	
	return result;
}

/*!
 * Collapses every run of blank (empty or whitespace-only) lines to a single
 * empty line, trims the whole text and terminates it with one newline.
 */
inline std::string normalize_blank_lines(std::string_view text)
{
	auto collapsed = std::string();
	collapsed.reserve(text.size() + 1);
	auto position = std::size_t(0);
	
	while (position < text.size())
	{
		if (text[position] != '\n')
		{
			collapsed += text[position];
			++position;
			continue;
		}
		
		auto last_newline = text.npos;
		
		for (auto i = position + 1; i < text.size() and is_space(text[i]); ++i)
		{
			if (text[i] == '\n')
			{
				last_newline = i;
			}
		}
		
		if (last_newline != text.npos)
		{
			collapsed += "\n\n";
			position = last_newline + 1;
		}
		else
		{
			collapsed += '\n';
			++position;
		}
	}
	
	auto result = std::string(trim(collapsed));
	result += '\n';
	return result;
}

/*!
 * Removes the comments of the dialect described by @p dialect from @p text:
 * first block comments, then single-line comments, then the blank lines left
 * behind are normalized.
 *
 * Python strings delimited by triple quotes are removed in both quote styles
 * after the block comment pass, whichever style the descriptor names.
 * Malformed input never fails; an unterminated block comment swallows the
 * rest of the text.
 */
inline std::string strip_comments(std::string_view text, std::string_view dialect_name, const Dialect_descriptor& dialect)
{
	auto content = std::string(text);
	
	if (dialect.multi_line_markers_)
	{
		content = strip_block_comments(content, dialect.multi_line_markers_->open_, dialect.multi_line_markers_->close_);
	}
	
	if (dialect_name == descriptor(Dialect::python).name_)
	{
		content = strip_block_comments(content, "'''", "'''");
		content = strip_block_comments(content, R"(""")", R"(""")");
	}
	
	if (dialect.single_line_marker_)
	{
		content = strip_line_comments(content, *dialect.single_line_marker_, dialect.string_delimiters_);
	}
	
	return normalize_blank_lines(content);
}

inline std::string strip_comments(std::string_view text, const Resolution& resolution)
{
	return strip_comments(text, resolution.name_, *resolution.descriptor_);
}
} // namespace decomment
