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
#include <ostream>
#include <string>
#include <vector>
#include "../src/recovery/recovery_storage.h"

namespace lectern {
namespace tools {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

void print_usage(std::ostream& err, const std::string& argv0);

// argv holds <recovery-dir> <command> [args], without the program name
int run_recover(const std::string& argv0, const std::vector<std::string>& argv,
                std::ostream& out, std::ostream& err);

int cmd_list(const recovery::RecoveryStorage& storage, std::ostream& out, std::ostream& err);
int cmd_crash(const recovery::RecoveryStorage& storage, std::ostream& out, std::ostream& err);
int cmd_show(const recovery::RecoveryStorage& storage, const std::string& id,
             std::ostream& out, std::ostream& err);
int cmd_reconstruct(const recovery::RecoveryStorage& storage, const std::string& id,
                    const std::string& original, const std::string& output,
                    std::ostream& out, std::ostream& err);
int cmd_cleanup(const recovery::RecoveryStorage& storage, std::ostream& out, std::ostream& err);
int cmd_discard_all(const recovery::RecoveryStorage& storage, std::ostream& out, std::ostream& err);

} // namespace tools
} // namespace lectern
