#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace kestrel {

/**
 * @brief Storage backend addressed by normalized absolute paths ("/a/b.png")
 */
class Vfs {
public:
    virtual ~Vfs() = default;

    /// Read the whole file; throws std::runtime_error if missing
    virtual std::vector<uint8_t> readAll(const std::string& path) = 0;

    /// Replace the file contents, creating it if needed
    virtual void writeAll(const std::string& path, const std::vector<uint8_t>& data) = 0;

    virtual bool exists(const std::string& path) = 0;

    /// Human readable description used in error messages
    virtual std::string describe(const std::string& path) const = 0;
};

/**
 * @brief Files below a directory on the local disk
 */
class LocalVfs : public Vfs {
public:
    explicit LocalVfs(std::string root);

    std::vector<uint8_t> readAll(const std::string& path) override;
    void writeAll(const std::string& path, const std::vector<uint8_t>& data) override;
    bool exists(const std::string& path) override;
    std::string describe(const std::string& path) const override;

    const std::string& root() const { return root_; }

private:
    std::string nativePath(const std::string& path) const;

    std::string root_;
};

/**
 * @brief In-memory file tree
 */
class MemoryVfs : public Vfs {
public:
    std::vector<uint8_t> readAll(const std::string& path) override;
    void writeAll(const std::string& path, const std::vector<uint8_t>& data) override;
    bool exists(const std::string& path) override;
    std::string describe(const std::string& path) const override;

    size_t fileCount() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::vector<uint8_t>> files_;
};

/**
 * @brief A path bound to a Vfs backend
 *
 * Cheap to copy. Paths are always kept normalized and rooted, so
 * `file["../x"]` can never climb above "/".
 *
 * Usage:
 * @code
 * auto root = VfsFile::local("assets");
 * auto scene = root["scenes/main.ktree"];
 * auto text = scene.readString();
 * auto dir = scene.parent();   // "/scenes"
 * @endcode
 */
class VfsFile {
public:
    VfsFile(std::shared_ptr<Vfs> vfs, std::string_view path);

    /// Root of a LocalVfs at @p directory
    static VfsFile local(const std::string& directory);

    /// Root of a fresh MemoryVfs
    static VfsFile memory();

    /// Resolve @p relative against this path (absolute paths restart at root)
    VfsFile operator[](std::string_view relative) const;

    VfsFile parent() const;

    const std::string& path() const { return path_; }
    std::string baseName() const;

    Vfs& vfs() const { return *vfs_; }
    const std::shared_ptr<Vfs>& vfsRef() const { return vfs_; }

    std::vector<uint8_t> readBytes() const;
    std::string readString() const;
    void writeBytes(const std::vector<uint8_t>& data) const;
    void writeString(std::string_view text) const;
    bool exists() const;

    /// Normalize a path: resolve "." and "..", collapse separators, root it
    static std::string normalize(std::string_view path);

private:
    std::shared_ptr<Vfs> vfs_;
    std::string path_;
};

} // namespace kestrel
