/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Lectern project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */


#include "recovery_manifest.h"
#include "atomic_writer.h"
#include "platform_fs.h"
#include "../util/log.h"
#include "rapidjson/document.h"
#include "rapidjson/writer.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/prettywriter.h"
#include "rapidjson/error/en.h"
#include <cerrno>
#include <cstdio>
#include <cstdlib>

namespace lectern {
namespace recovery {

namespace {

using Writer = rapidjson::PrettyWriter<rapidjson::StringBuffer>;

void write_string(Writer& writer, const std::string& s) {
    writer.String(s.c_str(), static_cast<rapidjson::SizeType>(s.size()));
}

void write_optional_string(Writer& writer, const std::optional<std::string>& s) {
    if (s) {
        write_string(writer, *s);
    } else {
        writer.Null();
    }
}

template <typename T>
void write_optional_uint(Writer& writer, const std::optional<T>& v) {
    if (v) {
        writer.Uint64(static_cast<uint64_t>(*v));
    } else {
        writer.Null();
    }
}

// Required unsigned field; false if absent or not an unsigned integer
bool read_uint(const rapidjson::Value& obj, const char* key, uint64_t* out) {
    if (!obj.HasMember(key) || !obj[key].IsUint64()) {
        return false;
    }
    *out = obj[key].GetUint64();
    return true;
}

// Optional field: absent or null leaves *out empty, any other non-uint fails
bool read_optional_uint(const rapidjson::Value& obj, const char* key, std::optional<uint64_t>* out) {
    out->reset();
    if (!obj.HasMember(key) || obj[key].IsNull()) {
        return true;
    }
    if (!obj[key].IsUint64()) {
        return false;
    }
    *out = obj[key].GetUint64();
    return true;
}

bool read_optional_string(const rapidjson::Value& obj, const char* key, std::optional<std::string>* out) {
    out->reset();
    if (!obj.HasMember(key) || obj[key].IsNull()) {
        return true;
    }
    if (!obj[key].IsString()) {
        return false;
    }
    *out = std::string(obj[key].GetString(), obj[key].GetStringLength());
    return true;
}

RecoveryStatus parse_index(const rapidjson::Value& idx, ChunkedRecoveryIndex* out) {
    if (!idx.IsObject()) {
        return RecoveryStatus::integrity("chunked_index is not an object");
    }

    uint64_t original_size = 0;
    uint64_t final_size = 0;
    if (!read_uint(idx, "original_size", &original_size) ||
        !read_uint(idx, "final_size", &final_size)) {
        return RecoveryStatus::integrity("chunked_index is missing original_size/final_size");
    }
    if (!idx.HasMember("chunks") || !idx["chunks"].IsArray()) {
        return RecoveryStatus::integrity("chunked_index is missing chunks");
    }

    ChunkedRecoveryIndex index;
    index.original_size = original_size;
    index.final_size = final_size;

    const auto& chunks = idx["chunks"];
    index.chunks.reserve(chunks.Size());
    for (rapidjson::SizeType i = 0; i < chunks.Size(); i++) {
        const auto& c = chunks[i];
        if (!c.IsObject()) {
            return RecoveryStatus::integrity("chunk " + std::to_string(i) + " is not an object");
        }

        uint64_t offset = 0, original_len = 0, size = 0;
        if (!read_uint(c, "offset", &offset) ||
            !read_uint(c, "original_len", &original_len) ||
            !read_uint(c, "size", &size) ||
            !c.HasMember("crc32c") || !c["crc32c"].IsString()) {
            return RecoveryStatus::integrity("chunk " + std::to_string(i) + " has missing fields");
        }

        // Stored as a "0x%08x" hex string
        const char* hex_str = c["crc32c"].GetString();
        char* end = nullptr;
        errno = 0;
        unsigned long crc = std::strtoul(hex_str, &end, 16);
        if (errno != 0 || end == hex_str || *end != '\0' || crc > 0xFFFFFFFFul) {
            return RecoveryStatus::integrity("chunk " + std::to_string(i) + " has a malformed crc32c");
        }

        ChunkMeta meta;
        meta.offset = offset;
        meta.original_len = original_len;
        meta.size = size;
        meta.crc32c = static_cast<uint32_t>(crc);
        index.chunks.push_back(meta);
    }

    *out = std::move(index);
    return RecoveryStatus::OK();
}

} // namespace

RecoveryStatus RecoveryManifest::load(const std::string& path) {
    std::string json_str;
    FSResult res = PlatformFS::read_file(path, &json_str);
    if (!res.ok) {
        if (res.err == ENOENT) {
            return RecoveryStatus::not_found(path);
        }
        return RecoveryStatus::io(res.err, "read " + path);
    }

    RecoveryStatus st = from_json(json_str);
    if (!st.ok()) {
        st.message = path + ": " + st.message;
    }
    return st;
}

RecoveryStatus RecoveryManifest::store(const std::string& path, const AtomicFileWriter& writer) const {
    return writer.write(path, to_json());
}

std::string RecoveryManifest::to_json() const {
    rapidjson::StringBuffer buffer;
    Writer writer(buffer);
    writer.SetIndent(' ', 2);

    writer.StartObject();

    writer.Key("original_path");
    write_optional_string(writer, metadata_.original_path);

    writer.Key("buffer_name");
    write_optional_string(writer, metadata_.buffer_name);

    writer.Key("created_at");
    writer.Uint64(metadata_.created_at);

    writer.Key("updated_at");
    writer.Uint64(metadata_.updated_at);

    writer.Key("content_size");
    writer.Uint64(metadata_.content_size);

    writer.Key("line_count");
    write_optional_uint(writer, metadata_.line_count);

    writer.Key("original_mtime");
    write_optional_uint(writer, metadata_.original_mtime);

    writer.Key("format_version");
    writer.Uint(metadata_.format_version);

    writer.Key("chunk_count");
    writer.Uint64(metadata_.chunk_count);

    writer.Key("original_file_size");
    writer.Uint64(metadata_.original_file_size);

    if (index_) {
        writer.Key("chunked_index");
        writer.StartObject();
        writer.Key("original_size");
        writer.Uint64(index_->original_size);
        writer.Key("final_size");
        writer.Uint64(index_->final_size);
        writer.Key("chunks");
        writer.StartArray();
        for (const auto& chunk : index_->chunks) {
            writer.StartObject();
            writer.Key("offset");
            writer.Uint64(chunk.offset);
            writer.Key("original_len");
            writer.Uint64(chunk.original_len);
            writer.Key("size");
            writer.Uint64(chunk.size);
            writer.Key("crc32c");
            char hex_buf[16];
            snprintf(hex_buf, sizeof(hex_buf), "0x%08x", chunk.crc32c);
            writer.String(hex_buf);
            writer.EndObject();
        }
        writer.EndArray();
        writer.EndObject();
    }

    writer.EndObject();

    return buffer.GetString();
}

RecoveryStatus RecoveryManifest::from_json(const std::string& json_str) {
    rapidjson::Document doc;
    doc.Parse(json_str.c_str(), json_str.size());

    if (doc.HasParseError()) {
        std::string msg = "JSON parse error at offset " + std::to_string(doc.GetErrorOffset()) +
                          ": " + rapidjson::GetParseError_En(doc.GetParseError());
        error() << msg;
        return RecoveryStatus::integrity(msg);
    }

    if (!doc.IsObject()) {
        return RecoveryStatus::integrity("metadata is not a JSON object");
    }

    RecoveryMetadata meta;
    if (!read_uint(doc, "created_at", &meta.created_at) ||
        !read_uint(doc, "updated_at", &meta.updated_at) ||
        !read_uint(doc, "content_size", &meta.content_size)) {
        return RecoveryStatus::integrity("metadata is missing created_at/updated_at/content_size");
    }

    if (!read_optional_string(doc, "original_path", &meta.original_path) ||
        !read_optional_string(doc, "buffer_name", &meta.buffer_name)) {
        return RecoveryStatus::integrity("metadata has a non-string original_path/buffer_name");
    }

    std::optional<uint64_t> line_count;
    if (!read_optional_uint(doc, "line_count", &line_count) ||
        !read_optional_uint(doc, "original_mtime", &meta.original_mtime)) {
        return RecoveryStatus::integrity("metadata has a malformed line_count/original_mtime");
    }
    if (line_count) {
        meta.line_count = static_cast<size_t>(*line_count);
    }

    if (doc.HasMember("format_version") && doc["format_version"].IsUint()) {
        meta.format_version = doc["format_version"].GetUint();
    }

    // Older files may lack these; they default to zero
    uint64_t v = 0;
    if (read_uint(doc, "chunk_count", &v)) {
        meta.chunk_count = v;
    }
    if (read_uint(doc, "original_file_size", &v)) {
        meta.original_file_size = v;
    }

    std::optional<ChunkedRecoveryIndex> index;
    if (doc.HasMember("chunked_index") && !doc["chunked_index"].IsNull()) {
        ChunkedRecoveryIndex parsed;
        RecoveryStatus st = parse_index(doc["chunked_index"], &parsed);
        if (!st.ok()) {
            return st;
        }
        index = std::move(parsed);
    }

    metadata_ = std::move(meta);
    index_ = std::move(index);
    return RecoveryStatus::OK();
}

} // namespace recovery
} // namespace lectern
