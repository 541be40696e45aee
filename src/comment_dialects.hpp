#pragma once

#include <cctype>
#include <cstddef>

#include <algorithm>
#include <array>
#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <string_view>

namespace decomment
{
struct Comment_markers
{
	std::string_view open_;
	std::string_view close_;
};

/*!
 * Immutable comment syntax of one dialect. Every descriptor has at least a
 * single-line marker or a pair of multi-line markers.
 */
struct Dialect_descriptor
{
	std::string_view name_;
	std::span<const std::string_view> extensions_;
	std::optional<std::string_view> single_line_marker_;
	std::optional<Comment_markers> multi_line_markers_;
	std::string_view string_delimiters_;
};

enum class Dialect : std::size_t
{
	c_style,
	shell,
	python,
	ruby,
	markup,
	css,
	sql,
	lua,
	powershell,
	yaml,
	perl,
	r,
	haskell,
	batch,
};

namespace extensions
{
inline constexpr std::string_view c_style[] = {".c", ".cpp", ".h", ".hpp", ".java", ".js", ".jsx", ".ts", ".tsx", ".cs", ".php", ".swift", ".go", ".kt", ".scala"};
inline constexpr std::string_view shell[] = {".sh", ".bash", ".zsh", ".ksh"};
inline constexpr std::string_view python[] = {".py", ".pyw", ".pyc", ".pyo", ".pyd"};
inline constexpr std::string_view ruby[] = {".rb", ".rake", ".gemspec"};
inline constexpr std::string_view markup[] = {".html", ".htm", ".xml", ".svg", ".xhtml", ".jsp", ".asp", ".aspx"};
inline constexpr std::string_view css[] = {".css", ".scss", ".sass", ".less"};
inline constexpr std::string_view sql[] = {".sql", ".sqlite", ".pgsql"};
inline constexpr std::string_view lua[] = {".lua"};
inline constexpr std::string_view powershell[] = {".ps1", ".psm1", ".psd1"};
inline constexpr std::string_view yaml[] = {".yaml", ".yml"};
inline constexpr std::string_view perl[] = {".pl", ".pm", ".t"};
inline constexpr std::string_view r[] = {".r"};
inline constexpr std::string_view haskell[] = {".hs", ".lhs"};
inline constexpr std::string_view batch[] = {".bat", ".cmd"};
} // namespace extensions

/*!
 * The dialect table, indexed by @ref Dialect. Lookup by extension walks it
 * in this order and the first match wins.
 */
inline constexpr auto dialects = std::array<Dialect_descriptor, 14>
{{
	{"c_style", extensions::c_style, "//", Comment_markers{"/*", "*/"}, "\"'`"},
	{"shell", extensions::shell, "#", std::nullopt, "\"'"},
	{"python", extensions::python, "#", Comment_markers{R"(""")", R"(""")"}, "\"'"},
	{"ruby", extensions::ruby, "#", Comment_markers{"=begin", "=end"}, "\"'"},
	{"markup", extensions::markup, std::nullopt, Comment_markers{"<!--", "-->"}, "\"'"},
	{"css", extensions::css, "//", Comment_markers{"/*", "*/"}, "\"'"},
	{"sql", extensions::sql, "--", Comment_markers{"/*", "*/"}, "\"'"},
	{"lua", extensions::lua, "--", Comment_markers{"--[[", "]]"}, "\"'"},
	{"powershell", extensions::powershell, "#", Comment_markers{"<#", "#>"}, "\"'"},
	{"yaml", extensions::yaml, "#", std::nullopt, "\"'"},
	{"perl", extensions::perl, "#", Comment_markers{"=pod", "=cut"}, "\"'`"},
	{"r", extensions::r, "#", std::nullopt, "\"'"},
	{"haskell", extensions::haskell, "--", Comment_markers{"{-", "-}"}, "\"'"},
	{"batch", extensions::batch, "REM", std::nullopt, "\""},
}};

static_assert(std::all_of(dialects.begin(), dialects.end(), [](const Dialect_descriptor& dialect)
{
	return dialect.single_line_marker_.has_value() or dialect.multi_line_markers_.has_value();
}), "every dialect needs a comment marker");

inline constexpr std::string_view unknown_dialect_name = "unknown";

[[nodiscard]] inline const Dialect_descriptor& descriptor(Dialect dialect) noexcept
{
	return dialects[static_cast<std::size_t>(dialect)];
}

/*!
 * @return The descriptor called @p name or nullptr if there is none.
 */
inline const Dialect_descriptor* find_dialect(std::string_view name) noexcept
{
	for (const auto& dialect : dialects)
	{
		if (dialect.name_ == name)
		{
			return &dialect;
		}
	}
	
	return nullptr;
}

inline std::string to_lower(std::string_view value)
{
	auto result = std::string(value);
	
	for (auto& c : result)
	{
		c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
	}
	
	return result;
}

/*!
 * Extracts the suffix of the last component of @p path, including the dot,
 * lower-cased. A leading dot of the file name does not start a suffix, so
 * `.bashrc` has none.
 */
inline std::string file_extension(std::string_view path)
{
	if (auto pos = path.find_last_of("/\\"); pos != path.npos)
	{
		path.remove_prefix(pos + 1);
	}
	
	auto dot = path.rfind('.');
	
	if (dot == path.npos or dot == 0 or dot + 1 == path.size())
	{
		return std::string();
	}
	
	return to_lower(path.substr(dot));
}

/*!
 * @return The first dialect in table order listing @p extension (expected in
 * lower case) or nullptr.
 */
inline const Dialect_descriptor* find_by_extension(std::string_view extension) noexcept
{
	if (extension.empty())
	{
		return nullptr;
	}
	
	for (const auto& dialect : dialects)
	{
		if (std::find(dialect.extensions_.begin(), dialect.extensions_.end(), extension) != dialect.extensions_.end())
		{
			return &dialect;
		}
	}
	
	return nullptr;
}

/*!
 * Guesses a MIME type from the extension of @p path. Only extensions that are
 * not already claimed by the dialect table are worth listing here.
 *
 * @return The MIME type or an empty view if the extension is not known.
 */
inline std::string_view guess_content_type(std::string_view path)
{
	static constexpr std::array<std::array<std::string_view, 2>, 15> content_types
	{{
		{".mjs", "text/javascript"},
		{".cjs", "text/javascript"},
		{".json5", "application/javascript"},
		{".pyi", "text/x-python"},
		{".pyx", "text/x-python"},
		{".shtml", "text/html"},
		{".xsl", "application/xml"},
		{".xslt", "application/xml"},
		{".xsd", "application/xml"},
		{".rdf", "application/xml"},
		{".wsdl", "application/xml"},
		{".xpdl", "application/xml"},
		{".plist", "application/xml"},
		{".ddl", "text/x-sql"},
		{".hql", "text/x-sql"},
	}};
	
	auto extension = file_extension(path);
	
	for (const auto& [suffix, content_type] : content_types)
	{
		if (suffix == extension)
		{
			return content_type;
		}
	}
	
	return std::string_view();
}

/*!
 * Classifies @p content by its first line: a python interpreter line, an XML
 * declaration or an HTML document type. Used for inputs that have no usable
 * file name.
 *
 * @return The MIME type or an empty view if nothing is recognized.
 */
inline std::string_view sniff_content_type(std::string_view content)
{
	auto first_line = content.substr(0, content.find('\n'));
	
	if (first_line.starts_with("\xEF\xBB\xBF"))
	{
		first_line.remove_prefix(3);
	}
	
	if (first_line.starts_with("#!"))
	{
		if (first_line.find("python") != first_line.npos)
		{
			return "text/x-python";
		}
		
		return std::string_view();
	}
	
	while (not first_line.empty() and std::isspace(static_cast<unsigned char>(first_line.front())))
	{
		first_line.remove_prefix(1);
	}
	
	auto lowered = to_lower(first_line.substr(0, 14));
	
	if (lowered.starts_with("<?xml"))
	{
		return "application/xml";
	}
	
	if (lowered.starts_with("<!doctype html") or lowered.starts_with("<html"))
	{
		return "text/html";
	}
	
	return std::string_view();
}

/*!
 * Maps a MIME type to the family of dialects that handles it.
 *
 * @return The dialect or nullptr for types with no known family.
 */
inline const Dialect_descriptor* find_by_content_type(std::string_view content_type) noexcept
{
	if (content_type.starts_with("text/x-python"))
	{
		return &descriptor(Dialect::python);
	}
	else if (content_type.starts_with("text/html") or content_type.starts_with("application/xml"))
	{
		return &descriptor(Dialect::markup);
	}
	else if (content_type.starts_with("text/css"))
	{
		return &descriptor(Dialect::css);
	}
	else if (content_type.starts_with("application/javascript") or content_type.starts_with("text/javascript"))
	{
		return &descriptor(Dialect::c_style);
	}
	else if (content_type.starts_with("text/x-sql"))
	{
		return &descriptor(Dialect::sql);
	}
	
	return nullptr;
}

struct Resolution
{
	std::string_view name_;
	const Dialect_descriptor* descriptor_ = nullptr;
	bool forced_name_ignored_ = false;
};

/*!
 * Selects the dialect for the file @p path. The extension is tried first,
 * then @p content_type if given, otherwise the type guessed from the
 * extension. When nothing matches the result is the C-style descriptor named
 * `unknown`; resolution never fails.
 */
inline Resolution resolve_dialect(std::string_view path, std::string_view content_type = {})
{
	if (const auto* dialect = find_by_extension(file_extension(path)))
	{
		return Resolution{dialect->name_, dialect};
	}
	
	if (content_type.empty())
	{
		content_type = guess_content_type(path);
	}
	
	if (const auto* dialect = find_by_content_type(content_type))
	{
		return Resolution{dialect->name_, dialect};
	}
	
	return Resolution{unknown_dialect_name, &descriptor(Dialect::c_style)};
}

/*!
 * Like the overload without @p forced_name, but a recognized
 * @p forced_name takes precedence over detection. An unrecognized one is
 * reported through @ref Resolution::forced_name_ignored_.
 */
inline Resolution resolve_dialect(std::string_view path, std::string_view forced_name, std::string_view content_type)
{
	if (not forced_name.empty())
	{
		if (const auto* dialect = find_dialect(forced_name))
		{
			return Resolution{dialect->name_, dialect};
		}
	}
	
	auto result = resolve_dialect(path, content_type);
	result.forced_name_ignored_ = not forced_name.empty();
	return result;
}

inline std::ostream& describe_markers(std::ostream& os, const Dialect_descriptor& dialect)
{
	os << "    Single-line comment: " << dialect.single_line_marker_.value_or("None") << "\n";
	os << "    Multi-line comment: ";
	
	if (dialect.multi_line_markers_)
	{
		os << dialect.multi_line_markers_->open_ << " ... " << dialect.multi_line_markers_->close_;
	}
	else
	{
		os << "None";
	}
	
	return os << "\n";
}

/*!
 * Writes the listing of all dialects in table order.
 */
inline std::ostream& describe_dialects(std::ostream& os)
{
	os << "Supported file types:\n";
	
	for (const auto& dialect : dialects)
	{
		os << "  " << dialect.name_ << ":\n";
		os << "    Extensions: ";
		
		for (std::size_t i = 0; i != dialect.extensions_.size(); ++i)
		{
			os << (i == 0 ? "" : ", ") << dialect.extensions_[i];
		}
		
		os << "\n";
		describe_markers(os, dialect) << "\n";
	}
	
	return os;
}
} // namespace decomment
