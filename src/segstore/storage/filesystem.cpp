#include "segstore/storage/filesystem.h"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

namespace segstore {
namespace storage {

namespace fs = std::filesystem;

core::Result<void> LocalFileSystem::mkdir_if_not_exist(const std::string& path) {
    if (path.empty()) {
        return core::Result<void>::error("Empty path provided", core::Error::Code::INVALID_ARGUMENT);
    }

    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        return core::Result<void>::error("Failed to create directory " + path + ": " + ec.message(),
                                         core::Error::Code::IO_ERROR);
    }
    return core::Result<void>();
}

core::Result<size_t> LocalFileSystem::write(const std::string& path, const std::string& data) {
    std::string tmp_path = path + ".tmp";
    {
        std::ofstream file(tmp_path, std::ios::binary | std::ios::trunc);
        if (!file) {
            return core::Result<size_t>::error("Failed to open file for writing: " + tmp_path,
                                               core::Error::Code::IO_ERROR);
        }
        file.write(data.data(), static_cast<std::streamsize>(data.size()));
        file.flush();
        if (!file) {
            return core::Result<size_t>::error("Failed to write file: " + tmp_path,
                                               core::Error::Code::IO_ERROR);
        }
    }

    std::error_code ec;
    fs::rename(tmp_path, path, ec);
    if (ec) {
        fs::remove(tmp_path, ec);
        return core::Result<size_t>::error("Failed to rename " + tmp_path + " to " + path,
                                           core::Error::Code::IO_ERROR);
    }
    return core::Result<size_t>(data.size());
}

core::Result<std::string> LocalFileSystem::read(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return core::Result<std::string>::error("Failed to open file: " + path,
                                                core::Error::Code::NOT_FOUND);
    }
    std::string data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        return core::Result<std::string>::error("Failed to read file: " + path,
                                                core::Error::Code::IO_ERROR);
    }
    return core::Result<std::string>(std::move(data));
}

core::Result<void> LocalFileSystem::remove_all(const std::string& path) {
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) {
        return core::Result<void>::error("Failed to remove " + path + ": " + ec.message(),
                                         core::Error::Code::IO_ERROR);
    }
    return core::Result<void>();
}

core::Result<std::vector<std::string>> LocalFileSystem::list_dirs(const std::string& path) {
    std::vector<std::string> names;
    std::error_code ec;
    fs::directory_iterator it(path, ec);
    if (ec) {
        return core::Result<std::vector<std::string>>::error(
            "Failed to list " + path + ": " + ec.message(), core::Error::Code::IO_ERROR);
    }
    for (const auto& entry : it) {
        std::error_code type_ec;
        if (entry.is_directory(type_ec)) {
            names.push_back(entry.path().filename().string());
        }
    }
    std::sort(names.begin(), names.end());
    return core::Result<std::vector<std::string>>(std::move(names));
}

bool LocalFileSystem::exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

core::Result<int> LocalFileSystem::disk_usage_percent(const std::string& path) {
    std::error_code ec;
    auto info = fs::space(path, ec);
    if (ec) {
        return core::Result<int>::error("Failed to stat volume of " + path + ": " + ec.message(),
                                        core::Error::Code::IO_ERROR);
    }
    if (info.capacity == 0) {
        return core::Result<int>(0);
    }
    auto used = info.capacity - info.free;
    return core::Result<int>(static_cast<int>(used * 100 / info.capacity));
}

} // namespace storage
} // namespace segstore
