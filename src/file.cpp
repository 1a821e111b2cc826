#include "file.hpp"

#include <cstdio>
#include <cstring>
#include <system_error>

#include <sys/stat.h>
#include <sys/types.h>
#include <fcntl.h>
#include <unistd.h>

#include "guard.hpp"
#include "format.hpp"
#include "compiler_error.hpp"

bool read_binary_file(char const* filename, std::function<void*(std::size_t)> const& alloc)
{
    int fd = open(filename, O_RDONLY);
    if(fd == -1)
        return false;
    auto scope_guard = make_scope_guard([&]{ close(fd); });

    struct stat sb;
    if(fstat(fd, &sb) == -1 || !S_ISREG(sb.st_mode))
        return false;

    void* data = alloc(std::size_t(sb.st_size));

    if(!data || read(fd, data, sb.st_size) != sb.st_size)
        return false;

    return true;
}

std::string read_stream(std::FILE* fp)
{
    std::string str;
    char buffer[4096];
    std::size_t n;
    while((n = std::fread(buffer, 1, sizeof(buffer), fp)) > 0)
        str.append(buffer, n);
    if(std::ferror(fp))
        compiler_error(ERR_READ, "Unable to read standard input.");
    return str;
}

void file_contents_t::reset(fs::path const& path)
{
    m_size = 0;
    m_source.reset();

    if(path.empty() || path == "-")
    {
        assign("<stdin>", read_stream(stdin));
        return;
    }

    m_name = path.string();

    if(!read_binary_file(m_name.c_str(), [this](std::size_t size)
    {
        m_size = size;
        m_source.reset(new char[size + 2]);
        return reinterpret_cast<void*>(m_source.get());
    }))
    {
        m_source.reset();
        m_size = 0;
        compiler_error(ERR_READ, fmt("Unable to open file: %", m_name));
    }

    m_source[m_size] = m_source[m_size+1] = '\0';
}

void file_contents_t::assign(std::string name, std::string_view contents)
{
    m_name = std::move(name);
    m_size = contents.size();
    m_source.reset(new char[m_size + 2]);
    std::memcpy(m_source.get(), contents.data(), m_size);
    m_source[m_size] = m_source[m_size+1] = '\0';
}

void write_file_atomic(std::string const& path, std::string_view contents)
{
    if(path == "-")
    {
        if(std::fwrite(contents.data(), 1, contents.size(), stdout) != contents.size() || std::fflush(stdout) != 0)
            compiler_error(ERR_WRITE, "Unable to write to standard output.");
        return;
    }

    std::string const temp = path + ".tmp";

    FILE* fp = std::fopen(temp.c_str(), "wb");
    if(!fp)
        compiler_error(ERR_WRITE, fmt("Unable to open file % for writing.", temp));

    {
        // Never leave a half-written file behind.
        auto guard = make_throw_guard([&]
        {
            std::error_code ec;
            fs::remove(temp, ec);
        });

        bool const written = std::fwrite(contents.data(), 1, contents.size(), fp) == contents.size();
        if(std::fclose(fp) != 0 || !written)
            compiler_error(ERR_WRITE, fmt("Unable to write to file %.", temp));

        std::error_code ec;
        fs::rename(temp, path, ec);
        if(ec)
            compiler_error(ERR_WRITE, fmt("Unable to rename % to %: %", temp, path, ec.message()));
    }
}
