#pragma once
// ═══════════════════════════════════════════════════════════════════
//  formpp/temp_file.h — Spool files for uploads and their registry
// ═══════════════════════════════════════════════════════════════════
//
//  TempFileRegistry registry(std::filesystem::temp_directory_path(), "formpp-");
//  auto file = registry.create();     // registered before first write
//  file->write("chunk");
//  file->rewind();
//  auto data = file->readAll();
//  registry.cleanup();                // close + delete, idempotent
//
// ═══════════════════════════════════════════════════════════════════

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace formpp {

// The system temp directory ($TMPDIR or /tmp). Throws a Storage
// HttpError when it cannot be determined.
std::filesystem::path systemTempDirectory();

// ═══════════════════════════════════════════════════════════════════
//  class TempFile
//  A uniquely named read/write file. The destructor closes the stream
//  and deletes the file if it is still on disk.
// ═══════════════════════════════════════════════════════════════════
class TempFile {
public:
    // Creates <dir>/<prefix><32 random hex chars><suffix> exclusively.
    // Throws a Storage HttpError on failure.
    static std::shared_ptr<TempFile> create(const std::filesystem::path& dir,
                                            const std::string& prefix,
                                            const std::string& suffix = ".tmp");

    ~TempFile();

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    // ── Writing ──
    void write(std::string_view data);
    void flush();

    // ── Reading ──
    void rewind();
    std::size_t read(char* dst, std::size_t n);
    std::string readAll();   // from the current position to the end

    // Copies the current contents to `dest` (overwrites).
    void saveAs(const std::filesystem::path& dest);

    // ── Lifecycle ──
    bool isOpen() const { return stream_.is_open(); }
    void close();
    bool remove() noexcept;  // true if a file was deleted

    const std::filesystem::path& path() const { return path_; }
    std::uintmax_t size() const { return size_; }

private:
    explicit TempFile(std::filesystem::path path);

    std::filesystem::path path_;
    std::fstream stream_;
    std::uintmax_t size_ = 0;
};

// ═══════════════════════════════════════════════════════════════════
//  class TempFileRegistry
//  Owns every TempFile created during one parse. Callers may keep
//  shared handles, but cleanup() closes and deletes the backing files
//  regardless. An empty directory means the system temp directory,
//  looked up on the first create().
// ═══════════════════════════════════════════════════════════════════
class TempFileRegistry {
public:
    TempFileRegistry(std::filesystem::path dir, std::string prefix)
        : dir_(std::move(dir)), prefix_(std::move(prefix)) {}

    ~TempFileRegistry() { cleanup(); }

    TempFileRegistry(const TempFileRegistry&) = delete;
    TempFileRegistry& operator=(const TempFileRegistry&) = delete;

    std::shared_ptr<TempFile> create();

    // Closes all handles and deletes their files. Returns how many files
    // were deleted. Safe to call any number of times.
    std::size_t cleanup() noexcept;

    std::size_t size() const { return files_.size(); }
    bool empty() const { return files_.empty(); }
    std::vector<std::filesystem::path> paths() const;

private:
    std::filesystem::path dir_;
    std::string prefix_;
    std::vector<std::shared_ptr<TempFile>> files_;
};

} // namespace formpp
