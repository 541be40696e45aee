#pragma once

#include <cctype>
#include <cstddef>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <iterator>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <syncstream>
#include <system_error>
#include <thread>
#include <vector>

#include "comment_dialects.hpp"
#include "comment_scanner.hpp"

namespace decomment
{
using String_view_set = std::set<std::string_view, std::less<>>;
using Parameter_dict = std::map<std::string_view, std::vector<std::string_view>, std::less<>>;

template<typename Type, typename Mutex_type>
struct Locked : std::reference_wrapper<Type>
{
	Locked(Type& value, Mutex_type& mutex)
		:
		std::reference_wrapper<Type>::reference_wrapper(value),
		lock_(mutex)
	{
	}

private:
	std::lock_guard<Mutex_type> lock_;
};

template<typename Type>
struct Mutex
{
	[[nodiscard]] Locked<Type, std::mutex> lock()
	{
		return Locked(value_, mutex_);
	}

private:
	std::mutex mutex_;
	Type value_;
};

struct Parameters
{
	std::string_view forced_dialect_;
	std::string_view content_type_;
	std::string_view output_path_;
	bool in_place_ = false;
	bool list_dialects_ = false;
	bool verbose_ = false;
};

inline const String_view_set no_argument_flags = {"-i", "--in-place", "-l", "--list-types", "-v", "--verbose"};
inline const String_view_set argument_flags = {"-t", "--type", "-m", "--mime-type", "-o", "--output"};

/*!
 * Sorts @p args into a dictionary of flags and their values. Values that do
 * not follow a flag which takes one are stored under the empty key, which is
 * always present.
 *
 * @return The dictionary or nothing if help was requested.
 */
inline std::optional<Parameter_dict> parse_arguments(std::span<const char*> args)
{
	auto result = Parameter_dict();
	auto unflagged_parameters = result.try_emplace("").first;
	auto last_flag = unflagged_parameters;
	
	for (std::string_view arg : args)
	{
		if (arg == "-h" or arg == "--help")
		{
			return std::nullopt;
		}
		else if (arg.size() >= 2 and arg[0] == '-' and (std::isalnum(static_cast<unsigned char>(arg[1])) or (arg[1] == '-')))
		{
			last_flag = result.try_emplace(arg).first;
			
			if (no_argument_flags.contains(arg))
			{
				last_flag = unflagged_parameters;
			}
		}
		else
		{
			last_flag->second.emplace_back(arg);
			last_flag = unflagged_parameters;
		}
	}
	
	return result;
}

/*!
 * @return The last value given to a flag, the long spelling taking precedence
 * over the short one, or an empty view if the flag is absent.
 *
 * @throws std::invalid_argument If the flag was given without a value.
 */
inline std::string_view flag_value(const Parameter_dict& parameters, std::string_view short_name, std::string_view long_name)
{
	auto result = std::string_view();
	
	for (auto name : {short_name, long_name})
	{
		if (auto it = parameters.find(name); it != parameters.end())
		{
			if (it->second.empty())
			{
				throw std::invalid_argument("option " + std::string(name) + " requires an argument");
			}
			
			result = it->second.back();
		}
	}
	
	return result;
}

/*!
 * @throws std::invalid_argument On unrecognized flags, missing values or
 * conflicting flags.
 */
inline Parameters interpret_args(const Parameter_dict& parameters)
{
	for (const auto& [flag, values] : parameters)
	{
		if (not flag.empty() and not no_argument_flags.contains(flag) and not argument_flags.contains(flag))
		{
			throw std::invalid_argument("unrecognized option: " + std::string(flag));
		}
	}
	
	auto result = Parameters();
	
	result.forced_dialect_ = flag_value(parameters, "-t", "--type");
	result.content_type_ = flag_value(parameters, "-m", "--mime-type");
	result.output_path_ = flag_value(parameters, "-o", "--output");
	
	if (parameters.contains("-i") or parameters.contains("--in-place"))
	{
		result.in_place_ = true;
		
		if (not result.output_path_.empty())
		{
			throw std::invalid_argument("cannot use --in-place (-i) and --output (-o) together");
		}
	}
	
	if (parameters.contains("-l") or parameters.contains("--list-types"))
	{
		result.list_dialects_ = true;
	}
	
	if (parameters.contains("-v") or parameters.contains("--verbose"))
	{
		result.verbose_ = true;
	}
	
	return result;
}

////////////////////////////////////////////////////////////////////////////////

/*!
 * Picks the dialect for an input. Without an explicit content type the type
 * is guessed from the extension of @p path and, failing that, from the first
 * line of @p content.
 */
inline Resolution resolve_input(std::string_view path, std::string_view content, const Parameters& parameters)
{
	auto content_type = parameters.content_type_;
	
	if (content_type.empty())
	{
		content_type = guess_content_type(path);
	}
	
	if (content_type.empty())
	{
		content_type = sniff_content_type(content);
	}
	
	return resolve_dialect(path, parameters.forced_dialect_, content_type);
}

inline std::string to_upper(std::string_view value)
{
	auto result = std::string(value);
	
	for (auto& c : result)
	{
		c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
	}
	
	return result;
}

inline std::string read_file(const std::filesystem::path& path)
{
	auto ifs = std::ifstream(path, std::ios_base::binary);
	
	if (ifs.fail())
	{
		throw std::ios_base::failure("Could not open file for reading");
	}
	
	ifs.exceptions(std::ios_base::badbit);
	return std::string(std::istreambuf_iterator<char>(ifs), {});
}

inline void write_file(const std::filesystem::path& path, std::string_view content)
{
	auto ofs = std::ofstream(path, std::ios_base::binary);
	
	if (ofs.fail())
	{
		throw std::ios_base::failure("Could not open file for writing");
	}
	
	ofs.exceptions(std::ios_base::badbit | std::ios_base::failbit);
	ofs << content;
	ofs.close();
}

/*!
 * @return `<stem>.<seconds since epoch>.bak` next to @p path, or
 * `<path>.bak` if the former already exists.
 */
inline std::filesystem::path backup_path(const std::filesystem::path& path)
{
	auto seconds = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count();
	auto result = path;
	result.replace_extension();
	result += "." + std::to_string(seconds) + ".bak";
	
	if (std::filesystem::exists(result))
	{
		result = path;
		result += ".bak";
	}
	
	return result;
}

/*!
 * Moves @p path aside to a backup and writes @p content in its place through
 * @p writer. If writing fails, the partial file is removed, the backup is moved back and
 * the error is rethrown.
 *
 * @return The path of the backup.
 */
inline std::filesystem::path replace_with_backup(const std::filesystem::path& path, std::string_view content,
	const std::function<void(const std::filesystem::path&, std::string_view)>& writer = write_file)
{
	auto backup = backup_path(path);
	
	if (std::filesystem::exists(backup))
	{
		std::osyncstream(std::clog) << "decomment: warning: overwriting existing backup " << backup.native() << "\n";
	}
	
	std::filesystem::rename(path, backup);
	
	try
	{
		writer(path, content);
	}
	catch (std::exception&)
	{
		auto ec = std::error_code();
		std::filesystem::remove(path, ec);
		std::filesystem::rename(backup, path, ec);
		
		if (not ec)
		{
			std::osyncstream(std::clog) << "decomment: original file restored from backup: " << path.native() << "\n";
		}
		
		throw;
	}
	
	return backup;
}

/*!
 * Removes comments from the file @p path, or from the standard input if
 * @p path is empty, and delivers the result as requested by @p parameters.
 *
 * @return The cleaned content.
 *
 * @throws std::runtime_error Any failure, with the message prefixed by the
 * path.
 */
inline std::string handle_file(const std::filesystem::path& path, const Parameters& parameters)
try
{
	auto original_content = std::string();
	
	if (path.empty())
	{
		original_content = std::string(std::istreambuf_iterator<char>(std::cin), {});
	}
	else
	{
		original_content = read_file(path);
	}
	
	auto resolution = resolve_input(path.native(), original_content, parameters);
	
	if (resolution.forced_name_ignored_)
	{
		std::osyncstream(std::clog) << "decomment: warning: file type '" << parameters.forced_dialect_
			<< "' not recognized, detecting automatically\n";
	}
	
	if (parameters.verbose_)
	{
		auto osyncstream = std::osyncstream(std::clog);
		osyncstream << "decomment: " << (path.empty() ? "<stdin>" : path.native()) << ": file type " << resolution.name_ << "\n";
		describe_markers(osyncstream, *resolution.descriptor_);
	}
	
	auto content = strip_comments(original_content, resolution);
	
	if (parameters.in_place_)
	{
		if (content != original_content)
		{
			auto backup = replace_with_backup(path, content);
			std::osyncstream(std::clog) << "Removing comments from file " << path.native()
				<< " (original backed up to " << backup.native() << ")\n";
		}
		else if (parameters.verbose_)
		{
			std::osyncstream(std::clog) << "decomment: " << path.native() << ": nothing to remove\n";
		}
	}
	else if (not parameters.output_path_.empty())
	{
		write_file(std::filesystem::path(parameters.output_path_), content);
		std::osyncstream(std::clog) << "Processed file written to: " << parameters.output_path_ << "\n";
	}
	else if (path.empty())
	{
		std::osyncstream(std::cout) << content;
	}
	else
	{
		auto osyncstream = std::osyncstream(std::cout);
		osyncstream << "--- Processed " << to_upper(resolution.name_) << " file: " << path.native() << " ---\n";
		osyncstream << content;
		osyncstream << "----------------------\n";
	}
	
	return content;
}
catch (std::exception& ex)
{
	auto message = (path.native().empty() ? "" : path.native() + ": ") + ex.what();
	throw std::runtime_error(message);
}

/*!
 * Expands @p fileroots into the list of files to process. Directories are
 * walked recursively and contribute the regular files whose extension
 * belongs to a known dialect.
 *
 * @throws std::invalid_argument If a file root does not exist.
 */
inline std::vector<std::filesystem::path> collect_files(std::span<const std::string_view> fileroots)
{
	auto files = std::vector<std::filesystem::path>();
	files.reserve(32);
	
	for (auto fileroot : fileroots)
	{
		auto to_handle = std::filesystem::path(fileroot);
		
		if (not std::filesystem::exists(to_handle))
		{
			throw std::invalid_argument("file does not exist: " + to_handle.native());
		}
		
		if (std::filesystem::is_regular_file(to_handle) and not std::filesystem::is_symlink(to_handle))
		{
			files.emplace_back(std::move(to_handle));
		}
		else if (std::filesystem::is_directory(to_handle))
		{
			for (const auto& dir_entry : std::filesystem::recursive_directory_iterator(to_handle))
			{
				if (dir_entry.is_regular_file()
					and not dir_entry.is_symlink()
					and find_by_extension(file_extension(dir_entry.path().native())) != nullptr)
				{
					files.emplace_back(dir_entry.path());
				}
			}
		}
	}
	
	return files;
}
////////////////////////////////////////////////////////////////////////////////

/*!
 * Runs the tool on the command line arguments @p args (without the program
 * name).
 *
 * @return The exit code: 0 on success, 1 on usage errors, 2 if any input
 * could not be processed.
 */
inline int run(std::span<const char*> args)
{
	auto parameter_dict = parse_arguments(args);
	
	if (not parameter_dict)
	{
		std::cout << 1 + (R"""(
Usage: decomment [optional flags] [file path]...
    Removes multi-line comments, strips trailing single-line comments and
    replaces full-line single-line comments with blank lines.
    Reads the standard input if no file is given.

    Optional flags:
        -t, --type <type>
                force a file type (e.g. python, c_style, css), the default is
                detection from the file extension
        -m, --mime-type <type>
                content type used when the file extension is not recognized
        -o, --output <path>
                write the result to a file instead of the console
        -i, --in-place
                replace the contents of files, keeping a backup of each
        -l, --list-types
                list all supported file types
        -v, --verbose
                print information about the file type detection

        -h, --help
                print help message
)""");
		return 0;
	}
	
	auto parameters = Parameters();
	
	try
	{
		parameters = interpret_args(*parameter_dict);
	}
	catch (std::invalid_argument& ex)
	{
		std::cout << "decomment: " << ex.what() << "\n";
		return 1;
	}
	
	if (parameters.list_dialects_)
	{
		describe_dialects(std::cout);
		return 0;
	}
	
	const auto fileroots = std::span<const std::string_view>(parameter_dict->find("")->second);
	
	if (fileroots.empty())
	{
		if (parameters.in_place_)
		{
			std::cout << "decomment: no input files" << "\n";
			return 1;
		}
		
		try
		{
			handle_file({}, parameters);
		}
		catch (std::exception& ex)
		{
			std::cout << "decomment: " << ex.what() << "\n";
			return 2;
		}
		
		return 0;
	}
	
	auto files = std::vector<std::filesystem::path>();
	
	try
	{
		files = collect_files(fileroots);
	}
	catch (std::exception& ex)
	{
		std::cout << "decomment: " << ex.what() << "\n";
		return 2;
	}
	
	if (files.empty())
	{
		std::cout << "decomment: no valid input files" << "\n";
		return 1;
	}
	
	if (not parameters.output_path_.empty() and files.size() > 1)
	{
		std::cout << "decomment: --output (-o) accepts a single input file" << "\n";
		return 1;
	}
	
	auto files_count = std::atomic<std::ptrdiff_t>(0);
	auto threads = std::vector<std::thread>(std::min(std::size(files), std::max<std::size_t>(1, std::thread::hardware_concurrency())));
	
	auto errors = Mutex<std::vector<std::string>>();
	
	for (auto& thread : threads)
	{
		thread = std::thread([&]() noexcept -> void
		{
			while (true)
			{
				auto index = files_count.fetch_add(1, std::memory_order_acq_rel);
				
				if (index >= std::ssize(files))
				{
					break;
				}
				
				try
				{
					handle_file(files[index], parameters);
				}
				catch (std::exception& ex)
				{
					errors.lock().get().emplace_back(ex.what());
				}
			}
		});
	}
	
	for (auto& thread : threads)
	{
		thread.join();
	}
	
	threads.clear();
	
	if (auto& errors_unlocked = errors.lock().get(); not errors_unlocked.empty())
	{
		std::cout << "decomment: exceptions occurred during the process:\n";
		
		for (const auto& error : errors_unlocked)
		{
			std::cout << "* " << error << "\n";
		}
		
		return 2;
	}
	
	return 0;
}
} // namespace decomment
