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


#pragma once
#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include "../util/log.h"

namespace lectern {
namespace recovery {

/**
 * Recovery settings.
 *
 * defaults() starts from the built-in values below and applies any
 * LECTERN_* environment overrides. A value that does not parse is ignored
 * with a warning.
 */
struct RecoveryConfig {
    bool enabled                     = true;
    uint32_t auto_save_interval_secs = 2;
    uint64_t max_recovery_age_secs   = 7 * 24 * 60 * 60;   // 7 days
    bool sync_writes                 = false;              // fsync chunk and metadata writes
    std::string recovery_dir;                              // empty: caller supplies one

    static RecoveryConfig defaults() {
        RecoveryConfig cfg;

        if (const char* env = std::getenv("LECTERN_RECOVERY_ENABLED")) {
            parse_flag("LECTERN_RECOVERY_ENABLED", env, &cfg.enabled);
        }

        if (const char* env = std::getenv("LECTERN_RECOVERY_DIR")) {
            cfg.recovery_dir = env;
        }

        if (const char* env = std::getenv("LECTERN_AUTOSAVE_INTERVAL_SECS")) {
            uint64_t v;
            if (parse_uint("LECTERN_AUTOSAVE_INTERVAL_SECS", env, &v)) {
                cfg.auto_save_interval_secs = static_cast<uint32_t>(v);
            }
        }

        if (const char* env = std::getenv("LECTERN_RECOVERY_MAX_AGE_SECS")) {
            parse_uint("LECTERN_RECOVERY_MAX_AGE_SECS", env, &cfg.max_recovery_age_secs);
        }

        if (const char* env = std::getenv("LECTERN_RECOVERY_SYNC")) {
            parse_flag("LECTERN_RECOVERY_SYNC", env, &cfg.sync_writes);
        }

        return cfg;
    }

    /**
     * Settings for tests: a fixed directory, no environment lookups
     */
    static RecoveryConfig for_dir(std::string dir) {
        RecoveryConfig cfg;
        cfg.recovery_dir = std::move(dir);
        return cfg;
    }

private:
    static bool parse_uint(const char* name, const std::string& value, uint64_t* out) {
        if (value.empty() || value[0] == '-') {
            warning() << "ignoring " << name << "=" << value << ": not a non-negative integer";
            return false;
        }
        try {
            size_t used = 0;
            uint64_t v = std::stoull(value, &used);
            if (used != value.size()) {
                warning() << "ignoring " << name << "=" << value << ": trailing characters";
                return false;
            }
            *out = v;
            return true;
        } catch (const std::exception&) {
            warning() << "ignoring " << name << "=" << value << ": not a non-negative integer";
            return false;
        }
    }

    static void parse_flag(const char* name, const std::string& value, bool* out) {
        if (value == "1" || value == "true" || value == "yes" || value == "on") {
            *out = true;
        } else if (value == "0" || value == "false" || value == "no" || value == "off") {
            *out = false;
        } else {
            warning() << "ignoring " << name << "=" << value << ": expected 1/0, true/false, yes/no or on/off";
        }
    }
};

} // namespace recovery
} // namespace lectern
