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


// lectern-recover: inspect and maintain a crash-recovery directory offline.

#include <iostream>
#include <string>
#include <vector>
#include "recover_commands.h"
#include "../src/util/log.h"

int main(int argc, char** argv) {
    lectern::initLoggingFromEnv();

    std::vector<std::string> args(argv + 1, argv + argc);
    return lectern::tools::run_recover(argv[0], args, std::cout, std::cerr);
}
