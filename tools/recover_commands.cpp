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


#include "recover_commands.h"
#include <cstdio>
#include <optional>
#include "../src/recovery/atomic_writer.h"

using namespace lectern::recovery;
using namespace std;

namespace lectern {
namespace tools {

namespace {

int fail(ostream& err, const RecoveryStatus& st) {
    err << "error: " << st.to_string() << "\n";
    return kExitFailure;
}

} // namespace

void print_usage(ostream& err, const string& argv0) {
    err << "usage: " << argv0 << " <recovery-dir> <command> [args]\n"
        << "\n"
        << "commands:\n"
        << "  list                                 recoverable buffers, newest first\n"
        << "  crash                                whether the last session crashed\n"
        << "  show <id>                            metadata and chunk index of one entry\n"
        << "  reconstruct <id> <original> <output> rebuild the buffer text into <output>\n"
        << "  cleanup                              remove orphaned recovery files\n"
        << "  discard-all                          remove everything except the session lock\n";
}

int cmd_list(const RecoveryStorage& storage, ostream& out, ostream& err) {
    vector<RecoveryEntry> entries;
    RecoveryStatus st = storage.list_entries(&entries);
    if (!st.ok()) {
        return fail(err, st);
    }

    if (entries.empty()) {
        out << "no recoverable buffers in " << storage.base_dir() << "\n";
        return kExitOk;
    }

    for (const auto& entry : entries) {
        out << entry.id << "  " << entry.metadata.display_name()
            << "  (" << entry.metadata.format_description() << ", " << entry.age_display() << ")";
        if (entry.original_file_modified()) {
            out << "  [original modified]";
        }
        out << "\n";
    }
    return kExitOk;
}

int cmd_crash(const RecoveryStorage& storage, ostream& out, ostream& err) {
    optional<SessionInfo> session;
    RecoveryStatus st = storage.session_lock().read(&session);
    if (!st.ok()) {
        return fail(err, st);
    }
    if (!session) {
        out << "no session lock: last session ended cleanly\n";
        return kExitOk;
    }

    out << "session pid " << session->pid << ", heartbeat " << session->started_at;
    if (session->working_dir) {
        out << ", cwd " << *session->working_dir;
    }
    out << "\n" << (session->is_running() ? "session is running\n" : "session crashed\n");
    return kExitOk;
}

int cmd_show(const RecoveryStorage& storage, const string& id, ostream& out, ostream& err) {
    optional<RecoveryEntry> entry;
    RecoveryStatus st = storage.load_entry(id, &entry);
    if (!st.ok()) {
        return fail(err, st);
    }
    if (!entry) {
        err << "error: no recovery entry " << id << "\n";
        return kExitFailure;
    }

    const RecoveryMetadata& m = entry->metadata;
    out << "id:                 " << entry->id << "\n"
        << "buffer:             " << m.display_name() << "\n"
        << "format version:     " << m.format_version << "\n"
        << "created at:         " << m.created_at << "\n"
        << "updated at:         " << m.updated_at << " (" << entry->age_display() << ")\n"
        << "content size:       " << m.content_size << "\n"
        << "original file size: " << m.original_file_size << "\n";
    if (m.line_count) {
        out << "lines:              " << *m.line_count << "\n";
    }
    if (m.original_mtime) {
        out << "original mtime:     " << *m.original_mtime
            << (entry->original_file_modified() ? " (modified since save)" : "") << "\n";
    }

    optional<ChunkedRecoveryIndex> index;
    st = storage.read_chunked_index(id, &index);
    if (!st.ok()) {
        return fail(err, st);
    }
    if (!index) {
        out << "no chunk index\n";
        return kExitOk;
    }

    out << "final size:         " << index->final_size << "\n"
        << "chunks:             " << index->chunks.size() << "\n";
    for (size_t i = 0; i < index->chunks.size(); i++) {
        const ChunkMeta& c = index->chunks[i];
        char crc[16];
        snprintf(crc, sizeof(crc), "0x%08x", c.crc32c);
        out << "  [" << i << "] offset=" << c.offset << " original_len=" << c.original_len
            << " size=" << c.size << " crc32c=" << crc << "\n";
    }
    return kExitOk;
}

int cmd_reconstruct(const RecoveryStorage& storage, const string& id,
                    const string& original, const string& output,
                    ostream& out, ostream& err) {
    string content;
    RecoveryStatus st = storage.reconstruct_from_chunks(id, original, &content);
    if (!st.ok()) {
        return fail(err, st);
    }

    AtomicFileWriter writer(true);
    st = writer.write(output, content);
    if (!st.ok()) {
        return fail(err, st);
    }
    out << "wrote " << content.size() << " bytes to " << output << "\n";
    return kExitOk;
}

int cmd_cleanup(const RecoveryStorage& storage, ostream& out, ostream& err) {
    size_t removed = 0;
    RecoveryStatus st = storage.cleanup_orphans(&removed);
    if (!st.ok()) {
        return fail(err, st);
    }
    out << "removed " << removed << " orphaned entries\n";
    return kExitOk;
}

int cmd_discard_all(const RecoveryStorage& storage, ostream& out, ostream& err) {
    size_t removed = 0;
    RecoveryStatus st = storage.cleanup_all(&removed);
    if (!st.ok()) {
        return fail(err, st);
    }
    out << "removed " << removed << " files\n";
    return kExitOk;
}

int run_recover(const string& argv0, const vector<string>& argv, ostream& out, ostream& err) {
    if (argv.size() < 2) {
        print_usage(err, argv0);
        return kExitUsage;
    }

    RecoveryStorage storage(argv[0]);
    const string& cmd = argv[1];
    vector<string> args(argv.begin() + 2, argv.end());

    if (cmd == "list" && args.empty()) {
        return cmd_list(storage, out, err);
    }
    if (cmd == "crash" && args.empty()) {
        return cmd_crash(storage, out, err);
    }
    if (cmd == "show" && args.size() == 1) {
        return cmd_show(storage, args[0], out, err);
    }
    if (cmd == "reconstruct" && args.size() == 3) {
        return cmd_reconstruct(storage, args[0], args[1], args[2], out, err);
    }
    if (cmd == "cleanup" && args.empty()) {
        return cmd_cleanup(storage, out, err);
    }
    if (cmd == "discard-all" && args.empty()) {
        return cmd_discard_all(storage, out, err);
    }

    print_usage(err, argv0);
    return kExitUsage;
}

} // namespace tools
} // namespace lectern
