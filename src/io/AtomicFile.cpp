#include "io/AtomicFile.h"

#include <cstdint>
#include <fstream>
#include <system_error>

namespace {

bool write_temp_and_flush(const std::filesystem::path& temp, std::string_view bytes, std::string* err)
{
    std::ofstream f(temp, std::ios::binary | std::ios::trunc);
    if (!f) {
        if (err) *err = "cannot open temp file " + temp.string();
        return false;
    }

    f.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    f.flush();
    if (!f) {
        if (err) *err = "write failed for " + temp.string();
        return false;
    }

    f.close();
    if (f.fail()) {
        if (err) *err = "close failed for " + temp.string();
        return false;
    }
    return true;
}

} // namespace

namespace minefield::io {

bool write_atomic(const fs::path& final_path,
                  std::string_view bytes,
                  std::string* err,
                  bool make_backup)
{
    std::error_code ec;
    if (final_path.has_parent_path()) {
        fs::create_directories(final_path.parent_path(), ec);
        if (ec) {
            if (err) *err = "create_directories failed for " + final_path.parent_path().string() + ": " + ec.message();
            return false;
        }
    }

    auto tmp = final_path;
    tmp += ".tmp";

    if (!write_temp_and_flush(tmp, bytes, err)) {
        fs::remove(tmp, ec);
        return false;
    }

    if (make_backup && fs::exists(final_path, ec)) {
        fs::copy_file(final_path, default_backup_path(final_path),
                      fs::copy_options::overwrite_existing, ec);
        // A missing backup is not worth failing the save for.
        ec.clear();
    }

    // rename() replaces the destination atomically on the same filesystem.
    fs::rename(tmp, final_path, ec);
    if (ec) {
        if (err) *err = "rename failed for " + final_path.string() + ": " + ec.message();
        std::error_code rec;
        fs::remove(tmp, rec);
        return false;
    }
    return true;
}

bool read_all(const fs::path& path, std::string& out, std::string* err, std::size_t max_bytes)
{
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        if (err) *err = "open failed for " + path.string();
        return false;
    }

    in.seekg(0, std::ios::end);
    const std::streamoff sz = in.tellg();
    if (sz < 0) {
        if (err) *err = "cannot determine size of " + path.string();
        return false;
    }
    if (static_cast<std::uint64_t>(sz) > max_bytes) {
        if (err) *err = path.string() + " exceeds " + std::to_string(max_bytes) + " bytes";
        return false;
    }
    in.seekg(0, std::ios::beg);

    std::string buf(static_cast<std::size_t>(sz), '\0');
    if (sz > 0)
        in.read(buf.data(), static_cast<std::streamsize>(sz));
    if (in.gcount() != static_cast<std::streamsize>(sz)) {
        if (err) *err = "short read from " + path.string();
        return false;
    }

    out.swap(buf);
    return true;
}

} // namespace minefield::io
