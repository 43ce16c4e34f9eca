// src/io/AtomicFile.h
//
// Atomic whole-file writes and bounded whole-file reads.
//
// write_atomic writes to a sibling "<final>.tmp", flushes and closes it, then
// renames it over the destination. A crash mid-write leaves either the old
// file or the new one, never a truncated mix. With make_backup the previous
// contents are kept as "<final>.bak".

#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

namespace minefield::io {

namespace fs = std::filesystem;

/// Atomically replace `final_path` with `bytes`, creating parent directories.
///
/// @param err          Optional: receives a human-readable error on failure.
/// @param make_backup  If true and the destination exists, copy it to "<final>.bak" first.
/// @return true on success.
[[nodiscard]] bool write_atomic(const fs::path& final_path,
                                std::string_view bytes,
                                std::string* err = nullptr,
                                bool make_backup = false);

/// Read the entire file at `path` into `out`.
///
/// Fails (without touching `out`) if the file cannot be opened, is larger than
/// `max_bytes`, or the read comes up short.
[[nodiscard]] bool read_all(const fs::path& path,
                            std::string& out,
                            std::string* err = nullptr,
                            std::size_t max_bytes = 64u * 1024u * 1024u);

/// "<final>.bak", as produced by write_atomic(..., make_backup = true).
[[nodiscard]] inline fs::path default_backup_path(const fs::path& final_path)
{
    fs::path p = final_path;
    p += ".bak";
    return p;
}

} // namespace minefield::io
