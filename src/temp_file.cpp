// ═══════════════════════════════════════════════════════════════════
//  src/temp_file.cpp — Temp file creation, I/O and cleanup
// ═══════════════════════════════════════════════════════════════════

#include "formpp/temp_file.h"
#include "formpp/console.h"
#include "formpp/error.h"

#include <openssl/rand.h>

#include <cerrno>
#include <cstring>
#include <iomanip>
#include <sstream>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

namespace formpp {

namespace fs = std::filesystem;

namespace {

constexpr int kMaxCreateAttempts = 8;

std::string randomHex(std::size_t length) {
    std::string buf(length, '\0');
    if (RAND_bytes(reinterpret_cast<unsigned char*>(buf.data()),
                   static_cast<int>(length)) != 1) {
        throw HttpError::storage("Failed to generate a temporary file name");
    }
    std::ostringstream oss;
    for (unsigned char c : buf) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c);
    }
    return oss.str();
}

} // namespace

fs::path systemTempDirectory() {
    std::error_code ec;
    auto dir = fs::temp_directory_path(ec);
    if (ec) {
        throw HttpError::storage("Unable to determine the temporary directory: " + ec.message());
    }
    return dir;
}

// ═══════════════════════════════════════════
//  TempFile
// ═══════════════════════════════════════════

std::shared_ptr<TempFile> TempFile::create(const fs::path& dir,
                                           const std::string& prefix,
                                           const std::string& suffix) {
    for (int attempt = 0; attempt < kMaxCreateAttempts; ++attempt) {
        auto candidate = dir / (prefix + randomHex(16) + suffix);

        int fd = ::open(candidate.c_str(), O_CREAT | O_EXCL | O_RDWR | O_CLOEXEC, 0600);
        if (fd < 0) {
            if (errno == EEXIST) continue;
            throw HttpError::storage(
                "Failed to create temporary file in '" + dir.string() + "': " +
                    std::strerror(errno),
                {{"directory", dir.string()}});
        }
        ::close(fd);

        std::shared_ptr<TempFile> file(new TempFile(candidate));
        if (!file->isOpen()) {
            throw HttpError::storage("Failed to open temporary file '" + candidate.string() + "'");
        }
        return file;
    }
    throw HttpError::storage("Failed to find a free temporary file name in '" +
                             dir.string() + "'");
}

TempFile::TempFile(fs::path path)
    : path_(std::move(path)),
      stream_(path_, std::ios::in | std::ios::out | std::ios::binary) {}

TempFile::~TempFile() {
    close();
    remove();
}

void TempFile::write(std::string_view data) {
    if (data.empty()) return;
    if (!stream_.is_open()) {
        throw HttpError::storage("Temporary file '" + path_.string() + "' is closed");
    }
    stream_.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!stream_) {
        throw HttpError::storage("Failed to write upload to '" + path_.string() + "'",
                                 {{"path", path_.string()}});
    }
    size_ += data.size();
}

void TempFile::flush() {
    if (stream_.is_open()) stream_.flush();
}

void TempFile::rewind() {
    if (!stream_.is_open()) return;
    stream_.flush();
    stream_.clear();
    stream_.seekg(0);
    stream_.seekp(0);
}

std::size_t TempFile::read(char* dst, std::size_t n) {
    if (!stream_.is_open() || n == 0) return 0;
    stream_.read(dst, static_cast<std::streamsize>(n));
    auto count = static_cast<std::size_t>(stream_.gcount());
    if (stream_.eof()) stream_.clear();
    return count;
}

std::string TempFile::readAll() {
    std::string out;
    char buf[8192];
    while (auto n = read(buf, sizeof(buf))) {
        out.append(buf, n);
    }
    return out;
}

void TempFile::saveAs(const fs::path& dest) {
    flush();
    std::error_code ec;
    fs::copy_file(path_, dest, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        throw HttpError::storage("Failed to save upload to '" + dest.string() + "': " +
                                     ec.message(),
                                 {{"path", dest.string()}});
    }
}

void TempFile::close() {
    if (stream_.is_open()) stream_.close();
}

bool TempFile::remove() noexcept {
    std::error_code ec;
    bool removed = fs::remove(path_, ec);
    if (ec) {
        try {
            console::warn("formpp: could not remove temporary file", path_.string(),
                          "(" + ec.message() + ")");
        } catch (const std::exception&) {
        }
        return false;
    }
    return removed;
}

// ═══════════════════════════════════════════
//  TempFileRegistry
// ═══════════════════════════════════════════

std::shared_ptr<TempFile> TempFileRegistry::create() {
    if (dir_.empty()) dir_ = systemTempDirectory();
    auto file = TempFile::create(dir_, prefix_);
    files_.push_back(file);
    console::debug("formpp: spooling upload to", file->path().string());
    return file;
}

std::size_t TempFileRegistry::cleanup() noexcept {
    std::size_t removed = 0;
    for (auto& file : files_) {
        file->close();
        if (file->remove()) ++removed;
    }
    if (!files_.empty()) {
        try {
            console::debug("formpp: removed", removed, "of", files_.size(), "temporary files");
        } catch (const std::exception&) {
        }
    }
    files_.clear();
    return removed;
}

std::vector<fs::path> TempFileRegistry::paths() const {
    std::vector<fs::path> out;
    out.reserve(files_.size());
    for (const auto& file : files_) out.push_back(file->path());
    return out;
}

} // namespace formpp
