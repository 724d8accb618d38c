/*
 * Part of the Zikzi project.
 *
 * SPDX-FileCopyrightText: 2025 Zikzi contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Zikzi. See LICENSE for details.
 */

#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <thread>
#include "zikzi/server.hpp"
#include "test_support.hpp"

using namespace std::chrono_literals;
using namespace zikzi;

namespace {

ServerConfig local_config(const std::string& dir) {
    ServerConfig cfg;
    cfg.printer.host = "127.0.0.1";
    cfg.printer.port = 0;
    cfg.ipp.host = "127.0.0.1";
    cfg.ipp.port = 0;
    cfg.storage.path = dir;
    cfg.storage.ghostscript_bin = test::write_fake_gs(dir, {});
    cfg.shutdown_grace_sec = 1;
    return cfg;
}

} // namespace

TEST(Server, BadSeedFileFailsStartup) {
    test::TempDir dir;
    ServerConfig cfg = local_config(dir.path());
    cfg.store_file = dir.path() + "/seed.txt";
    test::write_file(cfg.store_file, "user u1 alice - - yes\n");
    EXPECT_THROW({ Server srv(cfg, test::quiet_logger()); }, std::runtime_error);
}

TEST(Server, CreatesStorageAndStopsCleanly) {
    test::TempDir dir;
    ServerConfig cfg = local_config(dir.path());
    cfg.store_file = dir.path() + "/seed.txt";
    test::write_file(cfg.store_file, "user u1 alice - - 1\nip 127.0.0.1 u1 1\n");

    Server srv(cfg, test::quiet_logger());
    EXPECT_TRUE(std::filesystem::is_directory(dir.path() + "/jobs"));

    std::thread t([&srv]{ srv.run(); });
    std::this_thread::sleep_for(100ms);
    srv.stop();
    t.join();
}

TEST(Server, StopBeforeRunReturnsImmediately) {
    test::TempDir dir;
    ServerConfig cfg = local_config(dir.path());
    cfg.ipp.enabled = false;
    Server srv(cfg, test::quiet_logger());
    srv.stop();
    srv.run();
}
