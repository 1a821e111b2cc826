#ifndef FILE_HPP
#define FILE_HPP

#include <memory>
#include <string>
#include <string_view>
#include <cstdio>
#include <filesystem>
#include <functional>

namespace fs = ::std::filesystem;

// Holds the contents of the syntax file in a buffer, along with its name.
// The buffer is always followed by two NUL bytes so that scanning code
// can look ahead by one character without bounds checks.
struct file_contents_t
{
public:
    file_contents_t() = default;

    // Reads the file from disk. An empty path reads standard input.
    explicit file_contents_t(fs::path const& path) { reset(path); }

    // Wraps an in-memory string. Used by tests and '--simulate'.
    file_contents_t(std::string name, std::string_view contents) { assign(std::move(name), contents); }

    file_contents_t(file_contents_t&&) = default;
    file_contents_t& operator=(file_contents_t&&) = default;

    std::string const& name() const { return m_name; }
    char const* source() const { return m_source.get(); }
    std::size_t size() const { return m_size; }
    std::string_view view() const { return std::string_view(source(), size()); }

    void reset(fs::path const& path);
    void assign(std::string name, std::string_view contents);
private:
    std::string m_name;
    std::size_t m_size = 0;
    std::unique_ptr<char[]> m_source;
};

bool read_binary_file(char const* filename, std::function<void*(std::size_t)> const& alloc);
std::string read_stream(std::FILE* fp);

// Writes 'contents' to 'path' atomically: the data goes to a temporary file
// which is renamed over 'path' once complete. "-" writes to standard output.
// Throws compiler_error_t (ERR_WRITE) on failure; no partial file remains.
void write_file_atomic(std::string const& path, std::string_view contents);

#endif
