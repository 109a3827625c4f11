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


#include "session_lock.h"
#include "platform_fs.h"
#include "../util/log.h"
#include "rapidjson/document.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/prettywriter.h"
#include "rapidjson/error/en.h"
#include <cerrno>
#include <filesystem>

namespace lectern {
namespace recovery {

SessionLock::SessionLock(std::string recovery_dir, bool sync_writes)
    : dir_(std::move(recovery_dir)), writer_(sync_writes) {}

std::string SessionLock::path() const {
    return (std::filesystem::path(dir_) / kFileName).string();
}

RecoveryStatus SessionLock::create(SessionInfo* out) {
    FSResult dr = PlatformFS::ensure_directory(dir_);
    if (!dr.ok) {
        return RecoveryStatus::io(dr.err, "create directory " + dir_);
    }

    SessionInfo info = SessionInfo::current();
    RecoveryStatus st = writer_.write(path(), to_json(info));
    if (!st.ok()) {
        return st;
    }

    debug() << "session lock created for pid " << info.pid;
    if (out) {
        *out = info;
    }
    return RecoveryStatus::OK();
}

RecoveryStatus SessionLock::update() {
    std::string p = path();
    if (!PlatformFS::exists(p)) {
        return RecoveryStatus::OK();
    }
    return writer_.write(p, to_json(SessionInfo::current()));
}

RecoveryStatus SessionLock::remove() {
    std::string p = path();
    FSResult res = PlatformFS::remove_file(p);
    if (!res.ok) {
        return RecoveryStatus::io(res.err, "remove " + p);
    }
    return RecoveryStatus::OK();
}

RecoveryStatus SessionLock::read(std::optional<SessionInfo>* out) const {
    out->reset();

    std::string p = path();
    std::string json_str;
    FSResult res = PlatformFS::read_file(p, &json_str);
    if (!res.ok) {
        if (res.err == ENOENT) {
            return RecoveryStatus::OK();
        }
        return RecoveryStatus::io(res.err, "read " + p);
    }

    SessionInfo info;
    RecoveryStatus st = from_json(json_str, &info);
    if (!st.ok()) {
        st.message = p + ": " + st.message;
        return st;
    }
    *out = info;
    return RecoveryStatus::OK();
}

RecoveryStatus SessionLock::detect_crash(bool* crashed) const {
    *crashed = false;

    std::optional<SessionInfo> session;
    RecoveryStatus st = read(&session);
    if (!st.ok()) {
        return st;
    }
    if (session && !session->is_running()) {
        info() << "previous session (pid " << session->pid << ") did not shut down cleanly";
        *crashed = true;
    }
    return RecoveryStatus::OK();
}

std::string SessionLock::to_json(const SessionInfo& info) {
    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.SetIndent(' ', 2);

    writer.StartObject();
    writer.Key("pid");
    writer.Uint(info.pid);
    writer.Key("started_at");
    writer.Uint64(info.started_at);
    writer.Key("working_dir");
    if (info.working_dir) {
        writer.String(info.working_dir->c_str(),
                      static_cast<rapidjson::SizeType>(info.working_dir->size()));
    } else {
        writer.Null();
    }
    writer.EndObject();

    return buffer.GetString();
}

RecoveryStatus SessionLock::from_json(const std::string& json_str, SessionInfo* out) {
    rapidjson::Document doc;
    doc.Parse(json_str.c_str(), json_str.size());

    if (doc.HasParseError()) {
        return RecoveryStatus::integrity("JSON parse error at offset " +
                                         std::to_string(doc.GetErrorOffset()) + ": " +
                                         rapidjson::GetParseError_En(doc.GetParseError()));
    }
    if (!doc.IsObject()) {
        return RecoveryStatus::integrity("session lock is not a JSON object");
    }
    if (!doc.HasMember("pid") || !doc["pid"].IsUint() ||
        !doc.HasMember("started_at") || !doc["started_at"].IsUint64()) {
        return RecoveryStatus::integrity("session lock is missing pid/started_at");
    }

    SessionInfo info;
    info.pid = doc["pid"].GetUint();
    info.started_at = doc["started_at"].GetUint64();
    if (doc.HasMember("working_dir") && doc["working_dir"].IsString()) {
        info.working_dir = std::string(doc["working_dir"].GetString(),
                                       doc["working_dir"].GetStringLength());
    }

    *out = info;
    return RecoveryStatus::OK();
}

} // namespace recovery
} // namespace lectern
