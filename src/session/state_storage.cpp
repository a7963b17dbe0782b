#include <spdlog/spdlog.h>
#include <squirrel/session/state_storage.h>

#include <algorithm>
#include <fstream>
#include <sstream>

namespace squirrel::session {

namespace {

constexpr std::string_view kExtension = ".json";

Error ioError(std::string_view op, const std::filesystem::path& path, const std::error_code& ec) {
    return Error{ErrorCode::IoError, fmt::format("Failed to {} '{}': {}", op, path.string(),
                                                 ec ? ec.message() : std::string("stream error"))};
}

} // namespace

Result<void> validateStateName(std::string_view name) {
    if (name.empty()) {
        return Error{ErrorCode::InvalidArgument, "State name must not be empty"};
    }
    if (name.find('/') != std::string_view::npos || name.find('\\') != std::string_view::npos ||
        name.find("..") != std::string_view::npos) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("Invalid state name '{}': path separators and '..' are not allowed",
                                 name)};
    }
    return {};
}

// FileStateStorage

FileStateStorage::FileStateStorage(std::filesystem::path root) : root_(std::move(root)) {}

std::filesystem::path FileStateStorage::pathFor(std::string_view key) const {
    return root_ / (std::string(key) + std::string(kExtension));
}

Result<void> FileStateStorage::ensureRoot() const {
    std::error_code ec;
    std::filesystem::create_directories(root_, ec);
    if (ec) {
        return ioError("create directory", root_, ec);
    }
    return {};
}

Result<void> FileStateStorage::write(std::string_view key, std::string_view contents) {
    if (auto valid = validateStateName(key); !valid) {
        return valid;
    }
    if (auto dir = ensureRoot(); !dir) {
        return dir;
    }

    const auto path = pathFor(key);
    auto tempPath = path;
    tempPath += ".tmp";

    {
        std::ofstream ofs(tempPath, std::ios::binary | std::ios::trunc);
        if (!ofs) {
            return ioError("open", tempPath, {});
        }
        ofs.write(contents.data(), static_cast<std::streamsize>(contents.size()));
        ofs.close();
        if (!ofs) {
            return ioError("write", tempPath, {});
        }
    }

    std::error_code ec;
    std::filesystem::rename(tempPath, path, ec);
    if (ec) {
        std::error_code cleanup;
        std::filesystem::remove(tempPath, cleanup);
        return ioError("rename into", path, ec);
    }
    spdlog::debug("Wrote state document '{}' ({} bytes)", path.string(), contents.size());
    return {};
}

Result<std::string> FileStateStorage::read(std::string_view key) const {
    if (auto valid = validateStateName(key); !valid) {
        return valid.error();
    }
    const auto path = pathFor(key);

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        if (ec) {
            return ioError("stat", path, ec);
        }
        return Error{ErrorCode::NotFound, fmt::format("State '{}' not found", key)};
    }

    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) {
        return ioError("open", path, {});
    }
    std::ostringstream buffer;
    buffer << ifs.rdbuf();
    if (ifs.bad()) {
        return ioError("read", path, {});
    }
    return buffer.str();
}

Result<bool> FileStateStorage::exists(std::string_view key) const {
    if (auto valid = validateStateName(key); !valid) {
        return valid.error();
    }
    std::error_code ec;
    const bool present = std::filesystem::exists(pathFor(key), ec);
    if (ec) {
        return ioError("stat", pathFor(key), ec);
    }
    return present;
}

Result<void> FileStateStorage::remove(std::string_view key) {
    if (auto valid = validateStateName(key); !valid) {
        return valid;
    }
    const auto path = pathFor(key);
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        return ioError("remove", path, ec);
    }
    return {};
}

Result<std::vector<std::string>> FileStateStorage::list() const {
    std::vector<std::string> keys;
    std::error_code ec;
    if (!std::filesystem::exists(root_, ec)) {
        if (ec) {
            return ioError("stat", root_, ec);
        }
        return keys;
    }

    for (std::filesystem::directory_iterator it(root_, ec), end; !ec && it != end;
         it.increment(ec)) {
        const auto& entry = *it;
        std::error_code typeEc;
        if (!entry.is_regular_file(typeEc) || entry.path().extension().string() != kExtension) {
            continue;
        }
        keys.push_back(entry.path().stem().string());
    }
    if (ec) {
        return ioError("list", root_, ec);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

// MemoryStateStorage

Result<void> MemoryStateStorage::write(std::string_view key, std::string_view contents) {
    if (auto valid = validateStateName(key); !valid) {
        return valid;
    }
    std::lock_guard lock(mutex_);
    documents_.insert_or_assign(std::string(key), std::string(contents));
    return {};
}

Result<std::string> MemoryStateStorage::read(std::string_view key) const {
    if (auto valid = validateStateName(key); !valid) {
        return valid.error();
    }
    std::lock_guard lock(mutex_);
    auto it = documents_.find(key);
    if (it == documents_.end()) {
        return Error{ErrorCode::NotFound, fmt::format("State '{}' not found", key)};
    }
    return it->second;
}

Result<bool> MemoryStateStorage::exists(std::string_view key) const {
    if (auto valid = validateStateName(key); !valid) {
        return valid.error();
    }
    std::lock_guard lock(mutex_);
    return documents_.find(key) != documents_.end();
}

Result<void> MemoryStateStorage::remove(std::string_view key) {
    if (auto valid = validateStateName(key); !valid) {
        return valid;
    }
    std::lock_guard lock(mutex_);
    auto it = documents_.find(key);
    if (it != documents_.end()) {
        documents_.erase(it);
    }
    return {};
}

Result<std::vector<std::string>> MemoryStateStorage::list() const {
    std::lock_guard lock(mutex_);
    std::vector<std::string> keys;
    keys.reserve(documents_.size());
    for (const auto& [key, _] : documents_) {
        keys.push_back(key);
    }
    return keys;
}

std::unique_ptr<IStateStorage> createFileStateStorage(std::filesystem::path root) {
    return std::make_unique<FileStateStorage>(std::move(root));
}

std::unique_ptr<IStateStorage> createMemoryStateStorage() {
    return std::make_unique<MemoryStateStorage>();
}

} // namespace squirrel::session
