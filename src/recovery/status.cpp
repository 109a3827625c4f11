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


#include "status.h"
#include <cstring>
#include <sstream>

namespace lectern {
namespace recovery {

    const char* errc_name(RecoveryErrc code) {
        switch (code) {
        case RecoveryErrc::Ok:        return "Ok";
        case RecoveryErrc::Io:        return "Io";
        case RecoveryErrc::NotFound:  return "NotFound";
        case RecoveryErrc::Integrity: return "Integrity";
        }
        return "Unknown";
    }

    std::string RecoveryStatus::to_string() const {
        std::ostringstream oss;
        oss << errc_name(code);
        if (err != 0) {
            oss << "(errno:" << err << ' ' << std::strerror(err) << ')';
        }
        if (!message.empty()) {
            oss << ": " << message;
        }
        return oss.str();
    }

} // namespace recovery
} // namespace lectern
