#include "io/project_file.h"

#include "io/file_util.h"
#include "io/project_state_json.h"

#include <nlohmann/json.hpp>
#include <zstd.h>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <limits>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace project_file
{
namespace
{
namespace fs = std::filesystem;
using json = nlohmann::json;

static constexpr unsigned char kKakuZstdMagic[4] = {'K', 'A', 'K', 'U'};
static constexpr std::uint32_t kKakuZstdVersion = 1;
static constexpr size_t kHeaderSize = 4 + 4 + 8;

// Upper bound for the declared CBOR size; a 128x128 grid is a few MB at most.
static constexpr std::uint64_t kMaxCborSize = 256ull * 1024ull * 1024ull;

static void AppendU32LE(std::vector<std::uint8_t>& out, std::uint32_t v)
{
    out.push_back((std::uint8_t)((v >> 0) & 0xFF));
    out.push_back((std::uint8_t)((v >> 8) & 0xFF));
    out.push_back((std::uint8_t)((v >> 16) & 0xFF));
    out.push_back((std::uint8_t)((v >> 24) & 0xFF));
}

static void AppendU64LE(std::vector<std::uint8_t>& out, std::uint64_t v)
{
    for (int i = 0; i < 8; ++i)
        out.push_back((std::uint8_t)((v >> (8 * i)) & 0xFF));
}

static bool ReadU32LE(const std::vector<std::uint8_t>& in, size_t off, std::uint32_t& out)
{
    if (off + 4 > in.size())
        return false;
    out = (std::uint32_t)in[off + 0] | ((std::uint32_t)in[off + 1] << 8) |
          ((std::uint32_t)in[off + 2] << 16) | ((std::uint32_t)in[off + 3] << 24);
    return true;
}

static bool ReadU64LE(const std::vector<std::uint8_t>& in, size_t off, std::uint64_t& out)
{
    if (off + 8 > in.size())
        return false;
    out = 0;
    for (int i = 0; i < 8; ++i)
        out |= ((std::uint64_t)in[off + (size_t)i]) << (8 * i);
    return true;
}

static bool HasKakuZstdHeader(const std::vector<std::uint8_t>& bytes)
{
    return bytes.size() >= 4 && std::equal(std::begin(kKakuZstdMagic), std::end(kKakuZstdMagic), bytes.begin());
}

// Plain JSON project: first non-whitespace byte is '{'.
static bool LooksLikeJson(const std::vector<std::uint8_t>& bytes)
{
    for (std::uint8_t b : bytes)
    {
        if (b == ' ' || b == '\t' || b == '\r' || b == '\n')
            continue;
        return b == '{';
    }
    return false;
}

static bool ZstdCompress(const std::vector<std::uint8_t>& in, std::vector<std::uint8_t>& out, std::string& err)
{
    err.clear();
    out.clear();

    const size_t bound = ZSTD_compressBound(in.size());
    out.resize(bound);

    const int level = 3;
    const size_t n = ZSTD_compress(out.data(), out.size(), in.data(), in.size(), level);
    if (ZSTD_isError(n))
    {
        err = std::string("zstd compress failed: ") + ZSTD_getErrorName(n);
        out.clear();
        return false;
    }
    out.resize(n);
    return true;
}

static bool ZstdDecompressKnownSize(const std::uint8_t* in,
                                    size_t in_size,
                                    std::uint64_t uncompressed_size,
                                    std::vector<std::uint8_t>& out,
                                    std::string& err)
{
    err.clear();
    out.clear();

    if (uncompressed_size > kMaxCborSize ||
        uncompressed_size > (std::uint64_t)std::numeric_limits<size_t>::max())
    {
        err = "zstd decompress failed: declared size is too large.";
        return false;
    }
    out.resize((size_t)uncompressed_size);

    const size_t n = ZSTD_decompress(out.data(), out.size(), in, in_size);
    if (ZSTD_isError(n))
    {
        err = std::string("zstd decompress failed: ") + ZSTD_getErrorName(n);
        out.clear();
        return false;
    }
    if (n != out.size())
    {
        err = "zstd decompress failed: size mismatch.";
        out.clear();
        return false;
    }
    return true;
}

static bool EncodeProject(const kaku::ProjectState& st, std::vector<std::uint8_t>& out, std::string& err)
{
    std::vector<std::uint8_t> cbor;
    try
    {
        cbor = json::to_cbor(project_state_json::ToJson(st));
    }
    catch (const std::exception& e)
    {
        err = std::string("CBOR encode failed: ") + e.what();
        return false;
    }

    std::vector<std::uint8_t> compressed;
    if (!ZstdCompress(cbor, compressed, err))
        return false;

    // File format:
    //   4 bytes  magic: "KAKU"
    //   4 bytes  version (LE): 1
    //   8 bytes  uncompressed size (LE): CBOR byte length
    //   ...      zstd-compressed CBOR
    out.clear();
    out.reserve(kHeaderSize + compressed.size());
    out.insert(out.end(), std::begin(kKakuZstdMagic), std::end(kKakuZstdMagic));
    AppendU32LE(out, kKakuZstdVersion);
    AppendU64LE(out, (std::uint64_t)cbor.size());
    out.insert(out.end(), compressed.begin(), compressed.end());
    return true;
}

static bool DecodeDocument(const std::vector<std::uint8_t>& bytes, json& j, std::string& err)
{
    if (HasKakuZstdHeader(bytes))
    {
        std::uint32_t ver = 0;
        std::uint64_t ulen = 0;
        if (bytes.size() < kHeaderSize || !ReadU32LE(bytes, 4, ver) || !ReadU64LE(bytes, 8, ulen))
        {
            err = "Invalid project header (truncated).";
            return false;
        }
        if (ver != kKakuZstdVersion)
        {
            err = "Unsupported project container version " + std::to_string(ver) + ".";
            return false;
        }
        std::vector<std::uint8_t> cbor;
        if (!ZstdDecompressKnownSize(bytes.data() + kHeaderSize, bytes.size() - kHeaderSize, ulen, cbor, err))
            return false;
        try
        {
            j = json::from_cbor(cbor);
        }
        catch (const std::exception& e)
        {
            err = std::string("CBOR decode failed: ") + e.what();
            return false;
        }
        return true;
    }

    if (LooksLikeJson(bytes))
    {
        try
        {
            j = json::parse(bytes.begin(), bytes.end());
        }
        catch (const std::exception& e)
        {
            err = std::string("JSON parse failed: ") + e.what();
            return false;
        }
        return true;
    }

    err = "Not a kaku project file.";
    return false;
}
} // namespace

std::string NowIso8601Utc()
{
    using namespace std::chrono;
    const auto now = floor<seconds>(system_clock::now());
    const auto day = floor<days>(now);
    const year_month_day ymd{day};
    const hh_mm_ss<seconds> hms{now - day};

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:%02dZ",
                  (int)ymd.year(), (unsigned)ymd.month(), (unsigned)ymd.day(),
                  (int)hms.hours().count(), (int)hms.minutes().count(), (int)hms.seconds().count());
    return buf;
}

kaku::ProjectState NewProjectState(const std::string& name, kaku::Grid grid)
{
    kaku::ProjectState st;
    st.name = name;
    st.created_at = NowIso8601Utc();
    st.modified_at = st.created_at;
    st.grid = std::move(grid);
    return st;
}

bool SaveProjectToFile(const std::string& path, kaku::ProjectState& st, std::string& err)
{
    err.clear();
    st.modified_at = NowIso8601Utc();
    if (st.created_at.empty())
        st.created_at = st.modified_at;
    st.version = kaku::ProjectState::kCurrentVersion;

    std::vector<std::uint8_t> out;
    if (!EncodeProject(st, out, err))
        return false;
    if (!file_util::WriteAllBytesAtomic(path, out, err))
        return false;
    std::fprintf(stderr, "[project] saved %s (%dx%d)\n", path.c_str(), st.grid.Width(), st.grid.Height());
    return true;
}

bool LoadProjectFromFile(const std::string& path, kaku::ProjectState& out, std::string& err)
{
    err.clear();
    const auto bytes = file_util::ReadAllBytes(path, err);
    if (!err.empty())
        return false;

    json j;
    if (!DecodeDocument(bytes, j, err))
        return false;

    kaku::ProjectState st;
    if (!project_state_json::FromJson(j, st, err))
        return false;
    if (st.version < kaku::ProjectState::kCurrentVersion)
        std::fprintf(stderr, "[project] upgraded %s from v%d\n", path.c_str(), st.version);
    out = std::move(st);
    return true;
}

bool SaveAutosave(const std::string& path, const kaku::ProjectState& st, std::string& err)
{
    err.clear();
    const std::string autosave = AutosavePathFor(path);

    std::vector<std::uint8_t> out;
    if (!EncodeProject(st, out, err) || !file_util::WriteAllBytesAtomic(autosave, out, err))
    {
        std::fprintf(stderr, "[autosave] %s: %s\n", autosave.c_str(), err.c_str());
        return false;
    }
    return true;
}

std::string AutosavePathFor(const std::string& path)
{
    return path + kAutosaveSuffix;
}

bool DiscardAutosave(const std::string& path, std::string& err)
{
    err.clear();
    const std::string autosave = AutosavePathFor(path);
    std::error_code ec;
    fs::remove(autosave, ec);
    if (ec)
    {
        err = "Failed to remove " + autosave + ": " + ec.message();
        return false;
    }
    return true;
}

std::optional<std::string> FindAutosave(const std::string& dir)
{
    const std::string wanted = std::string(kProjectExtension) + kAutosaveSuffix;
    std::vector<std::string> found;

    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec))
    {
        const std::string name = it->path().filename().string();
        if (name.size() > wanted.size() && name.compare(name.size() - wanted.size(), wanted.size(), wanted) == 0)
            found.push_back(name);
    }
    if (found.empty())
        return std::nullopt;
    std::sort(found.begin(), found.end());
    return found.front();
}

std::vector<std::string> ListProjectFiles(const std::string& dir)
{
    std::vector<std::string> files;
    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec))
    {
        const fs::path& p = it->path();
        if (p.extension() == kProjectExtension)
            files.push_back(p.filename().string());
    }
    std::sort(files.begin(), files.end());
    return files;
}

bool AutosaveTimer::Due(double now_s, bool dirty)
{
    if (!Enabled())
        return false;
    if (!m_started || !dirty)
    {
        Restart(now_s);
        return false;
    }
    return (now_s - m_last_s) >= (double)m_interval_s;
}
} // namespace project_file
