#include "segstore/storage/part_metadata.h"
#include "segstore/common/logger.h"
#include "segstore/core/error.h"

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <filesystem>

namespace segstore {
namespace storage {

namespace {

[[noreturn]] void corrupted(const std::string& message) {
    SEGSTORE_CRITICAL("{}", message);
    throw core::CorruptionError(message);
}

uint64_t read_uint64(const rapidjson::Document& doc, const char* key, const std::string& path) {
    if (!doc.HasMember(key) || !doc[key].IsUint64()) {
        corrupted("cannot parse \"" + path + "\": " + key + " is missing or not an unsigned integer");
    }
    return doc[key].GetUint64();
}

int64_t read_int64(const rapidjson::Document& doc, const char* key, const std::string& path) {
    if (!doc.HasMember(key) || !doc[key].IsInt64()) {
        corrupted("cannot parse \"" + path + "\": " + key + " is missing or not an integer");
    }
    return doc[key].GetInt64();
}

} // namespace

void PartMetadata::reset() {
    compressed_size_bytes = 0;
    uncompressed_size_bytes = 0;
    total_count = 0;
    blocks_count = 0;
    min_timestamp = 0;
    max_timestamp = 0;
    id = 0;
}

std::string PartMetadata::to_json() const {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);

    writer.StartObject();
    writer.Key("compressedSizeBytes");
    writer.Uint64(compressed_size_bytes);
    writer.Key("uncompressedSizeBytes");
    writer.Uint64(uncompressed_size_bytes);
    writer.Key("totalCount");
    writer.Uint64(total_count);
    writer.Key("blocksCount");
    writer.Uint64(blocks_count);
    writer.Key("minTimestamp");
    writer.Int64(min_timestamp);
    writer.Key("maxTimestamp");
    writer.Int64(max_timestamp);
    writer.Key("id");
    writer.Uint64(id);
    writer.EndObject();
    return buffer.GetString();
}

void PartMetadata::must_read(FileSystem& fs, const std::string& part_path) {
    reset();

    std::string path = (std::filesystem::path(part_path) / kFilename).string();
    auto data = fs.read(path);
    if (!data.ok()) {
        corrupted("cannot read " + path + ": " + data.error());
    }

    rapidjson::Document doc;
    doc.Parse(data.value().c_str());
    if (doc.HasParseError() || !doc.IsObject()) {
        corrupted("cannot parse \"" + path + "\": invalid JSON");
    }

    compressed_size_bytes = read_uint64(doc, "compressedSizeBytes", path);
    uncompressed_size_bytes = read_uint64(doc, "uncompressedSizeBytes", path);
    total_count = read_uint64(doc, "totalCount", path);
    blocks_count = read_uint64(doc, "blocksCount", path);
    min_timestamp = read_int64(doc, "minTimestamp", path);
    max_timestamp = read_int64(doc, "maxTimestamp", path);
    id = read_uint64(doc, "id", path);

    if (min_timestamp > max_timestamp) {
        corrupted("minTimestamp cannot exceed maxTimestamp; got " + std::to_string(min_timestamp) +
                  " vs " + std::to_string(max_timestamp));
    }
}

void PartMetadata::must_write(FileSystem& fs, const std::string& part_path) const {
    std::string metadata = to_json();
    std::string path = (std::filesystem::path(part_path) / kFilename).string();

    auto written = fs.write(path, metadata);
    if (!written.ok()) {
        corrupted("cannot write metadata " + path + ": " + written.error());
    }
    if (written.value() != metadata.size()) {
        corrupted("unexpected number of bytes written to " + path + "; got " +
                  std::to_string(written.value()) + "; want " + std::to_string(metadata.size()));
    }
}

} // namespace storage
} // namespace segstore
