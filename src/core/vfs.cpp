#include "kestrel/core/vfs.hpp"
#include "kestrel/core/logging.hpp"

#include <fstream>
#include <iterator>
#include <stdexcept>

namespace kestrel {

// ============================================================================
// LocalVfs
// ============================================================================

LocalVfs::LocalVfs(std::string root)
    : root_(std::move(root)) {
    while (root_.size() > 1 && root_.back() == '/') {
        root_.pop_back();
    }
}

std::string LocalVfs::nativePath(const std::string& path) const {
    return root_ + path;
}

std::vector<uint8_t> LocalVfs::readAll(const std::string& path) {
    std::ifstream file(nativePath(path), std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + describe(path));
    }

    std::vector<uint8_t> data((std::istreambuf_iterator<char>(file)),
                              std::istreambuf_iterator<char>());

    KESTREL_TRACE(LogCategory::Core, "Read " + std::to_string(data.size()) +
        " bytes from " + describe(path));
    return data;
}

void LocalVfs::writeAll(const std::string& path, const std::vector<uint8_t>& data) {
    std::ofstream file(nativePath(path), std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + describe(path));
    }
    file.write(reinterpret_cast<const char*>(data.data()),
               static_cast<std::streamsize>(data.size()));
    if (!file) {
        throw std::runtime_error("Failed to write file: " + describe(path));
    }
}

bool LocalVfs::exists(const std::string& path) {
    std::ifstream file(nativePath(path), std::ios::binary);
    return file.is_open();
}

std::string LocalVfs::describe(const std::string& path) const {
    return nativePath(path);
}

// ============================================================================
// MemoryVfs
// ============================================================================

std::vector<uint8_t> MemoryVfs::readAll(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = files_.find(path);
    if (it == files_.end()) {
        throw std::runtime_error("File not found: " + describe(path));
    }
    return it->second;
}

void MemoryVfs::writeAll(const std::string& path, const std::vector<uint8_t>& data) {
    std::lock_guard<std::mutex> lock(mutex_);
    files_[path] = data;
}

bool MemoryVfs::exists(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    return files_.count(path) != 0;
}

std::string MemoryVfs::describe(const std::string& path) const {
    return "memory:" + path;
}

size_t MemoryVfs::fileCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return files_.size();
}

// ============================================================================
// VfsFile
// ============================================================================

VfsFile::VfsFile(std::shared_ptr<Vfs> vfs, std::string_view path)
    : vfs_(std::move(vfs))
    , path_(normalize(path)) {
    if (!vfs_) {
        throw std::invalid_argument("VfsFile: vfs cannot be null");
    }
}

VfsFile VfsFile::local(const std::string& directory) {
    return VfsFile(std::make_shared<LocalVfs>(directory), "/");
}

VfsFile VfsFile::memory() {
    return VfsFile(std::make_shared<MemoryVfs>(), "/");
}

VfsFile VfsFile::operator[](std::string_view relative) const {
    if (!relative.empty() && relative.front() == '/') {
        return VfsFile(vfs_, relative);
    }
    return VfsFile(vfs_, path_ + "/" + std::string(relative));
}

VfsFile VfsFile::parent() const {
    return VfsFile(vfs_, path_ + "/..");
}

std::string VfsFile::baseName() const {
    auto pos = path_.find_last_of('/');
    return (pos == std::string::npos) ? path_ : path_.substr(pos + 1);
}

std::vector<uint8_t> VfsFile::readBytes() const {
    return vfs_->readAll(path_);
}

std::string VfsFile::readString() const {
    auto bytes = readBytes();
    return std::string(bytes.begin(), bytes.end());
}

void VfsFile::writeBytes(const std::vector<uint8_t>& data) const {
    vfs_->writeAll(path_, data);
}

void VfsFile::writeString(std::string_view text) const {
    writeBytes(std::vector<uint8_t>(text.begin(), text.end()));
}

bool VfsFile::exists() const {
    return vfs_->exists(path_);
}

std::string VfsFile::normalize(std::string_view path) {
    std::vector<std::string_view> parts;

    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find_first_of("/\\", start);
        if (end == std::string_view::npos) {
            end = path.size();
        }
        auto part = path.substr(start, end - start);
        if (part.empty() || part == ".") {
            // skip
        } else if (part == "..") {
            if (!parts.empty()) {
                parts.pop_back();
            }
        } else {
            parts.push_back(part);
        }
        start = end + 1;
    }

    if (parts.empty()) {
        return "/";
    }

    std::string result;
    for (auto part : parts) {
        result += '/';
        result += part;
    }
    return result;
}

} // namespace kestrel
