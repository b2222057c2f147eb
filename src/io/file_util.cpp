#include "io/file_util.h"

#include <cstddef>
#include <exception>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace file_util
{
namespace
{
namespace fs = std::filesystem;

static bool WriteAtomic(const std::string& path, const char* data, size_t size, std::string& err)
{
    err.clear();
    try
    {
        fs::path p(path);
        if (p.has_parent_path())
            fs::create_directories(p.parent_path());

        const std::string tmp = path + ".tmp";
        {
            std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
            if (!out)
            {
                err = "Failed to open file for writing: " + tmp;
                return false;
            }
            if (size > 0)
                out.write(data, (std::streamsize)size);
            out.close();
            if (!out)
            {
                err = "Failed to write file contents.";
                return false;
            }
        }

        std::error_code ec;
        fs::rename(tmp, path, ec);
        if (ec)
        {
            err = std::string("Failed to replace file: ") + ec.message();
            std::error_code rm_ec;
            fs::remove(tmp, rm_ec);
            return false;
        }
        return true;
    }
    catch (const std::exception& e)
    {
        err = e.what();
        return false;
    }
}
} // namespace

std::vector<std::uint8_t> ReadAllBytes(const std::string& path, std::string& err)
{
    err.clear();
    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        err = "Failed to open file for reading: " + path;
        return {};
    }
    in.seekg(0, std::ios::end);
    const std::streamoff sz = in.tellg();
    if (sz < 0)
    {
        err = "Failed to read file size.";
        return {};
    }
    in.seekg(0, std::ios::beg);
    std::vector<std::uint8_t> bytes(static_cast<size_t>(sz));
    if (sz > 0)
        in.read(reinterpret_cast<char*>(bytes.data()), sz);
    if (!in && sz > 0)
    {
        err = "Failed to read file contents.";
        return {};
    }
    return bytes;
}

bool WriteAllBytesAtomic(const std::string& path, const std::vector<std::uint8_t>& bytes, std::string& err)
{
    return WriteAtomic(path, reinterpret_cast<const char*>(bytes.data()), bytes.size(), err);
}

bool WriteTextAtomic(const std::string& path, const std::string& text, std::string& err)
{
    return WriteAtomic(path, text.data(), text.size(), err);
}
} // namespace file_util
