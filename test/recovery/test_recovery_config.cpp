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


#include <gtest/gtest.h>
#include <cstdlib>
#include "../../src/recovery/recovery_config.h"

using namespace lectern::recovery;

class RecoveryConfigTest : public ::testing::Test {
protected:
    void TearDown() override {
        unsetenv("LECTERN_RECOVERY_ENABLED");
        unsetenv("LECTERN_RECOVERY_DIR");
        unsetenv("LECTERN_AUTOSAVE_INTERVAL_SECS");
        unsetenv("LECTERN_RECOVERY_MAX_AGE_SECS");
        unsetenv("LECTERN_RECOVERY_SYNC");
    }
};

TEST_F(RecoveryConfigTest, BuiltInDefaults) {
    RecoveryConfig cfg;
    EXPECT_TRUE(cfg.enabled);
    EXPECT_EQ(cfg.auto_save_interval_secs, 2u);
    EXPECT_EQ(cfg.max_recovery_age_secs, 7u * 24 * 60 * 60);
    EXPECT_FALSE(cfg.sync_writes);
    EXPECT_TRUE(cfg.recovery_dir.empty());
}

TEST_F(RecoveryConfigTest, EnvironmentOverrides) {
    setenv("LECTERN_RECOVERY_ENABLED", "false", 1);
    setenv("LECTERN_RECOVERY_DIR", "/var/tmp/lectern-recovery", 1);
    setenv("LECTERN_AUTOSAVE_INTERVAL_SECS", "15", 1);
    setenv("LECTERN_RECOVERY_MAX_AGE_SECS", "3600", 1);
    setenv("LECTERN_RECOVERY_SYNC", "1", 1);

    RecoveryConfig cfg = RecoveryConfig::defaults();
    EXPECT_FALSE(cfg.enabled);
    EXPECT_EQ(cfg.recovery_dir, "/var/tmp/lectern-recovery");
    EXPECT_EQ(cfg.auto_save_interval_secs, 15u);
    EXPECT_EQ(cfg.max_recovery_age_secs, 3600u);
    EXPECT_TRUE(cfg.sync_writes);
}

TEST_F(RecoveryConfigTest, UnparseableValuesAreIgnored) {
    setenv("LECTERN_RECOVERY_ENABLED", "maybe", 1);
    setenv("LECTERN_AUTOSAVE_INTERVAL_SECS", "soon", 1);
    setenv("LECTERN_RECOVERY_MAX_AGE_SECS", "-5", 1);
    setenv("LECTERN_RECOVERY_SYNC", "", 1);

    RecoveryConfig cfg = RecoveryConfig::defaults();
    EXPECT_TRUE(cfg.enabled);
    EXPECT_EQ(cfg.auto_save_interval_secs, 2u);
    EXPECT_EQ(cfg.max_recovery_age_secs, 7u * 24 * 60 * 60);
    EXPECT_FALSE(cfg.sync_writes);
}

TEST_F(RecoveryConfigTest, TrailingGarbageIsIgnored) {
    setenv("LECTERN_AUTOSAVE_INTERVAL_SECS", "10s", 1);
    EXPECT_EQ(RecoveryConfig::defaults().auto_save_interval_secs, 2u);
}

TEST_F(RecoveryConfigTest, ForDirSkipsEnvironment) {
    setenv("LECTERN_RECOVERY_ENABLED", "0", 1);
    RecoveryConfig cfg = RecoveryConfig::for_dir("/tmp/x");
    EXPECT_TRUE(cfg.enabled);
    EXPECT_EQ(cfg.recovery_dir, "/tmp/x");
}
