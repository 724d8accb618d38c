/*
 * Part of the Zikzi project.
 *
 * SPDX-FileCopyrightText: 2025 Zikzi contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Zikzi. See LICENSE for details.
 */

#pragma once
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include "zikzi/log.hpp"

namespace zikzi::test {

inline std::shared_ptr<Logger> quiet_logger() {
    auto log = std::make_shared<Logger>(LogLevel::Error);
    log->set_console(false);
    return log;
}

// mkdtemp directory, removed recursively on destruction.
class TempDir {
public:
    TempDir() {
        std::string tmpl = (std::filesystem::temp_directory_path() / "zikzi-test-XXXXXX").string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        if (!::mkdtemp(buf.data())) throw std::runtime_error("mkdtemp failed");
        _path = buf.data();
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(_path, ec);
    }
    const std::string& path() const { return _path; }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

private:
    std::string _path;
};

// Behaviour of the stand-in ghostscript for each step.
struct FakeGs {
    bool pdf_ok   = true;
    bool thumb_ok = true;
    int  pages    = 3;     // <= 0 makes the page count query fail
};

// Shell script accepting the ghostscript command lines used by the pipeline.
inline std::string write_fake_gs(const std::string& dir, const FakeGs& f) {
    const std::string path = dir + "/fake-gs.sh";
    {
        std::ofstream s(path, std::ios::trunc);
        s << "#!/bin/sh\n"
             "out=''\n"
             "dev=''\n"
             "for a in \"$@\"; do\n"
             "  case \"$a\" in\n"
             "    -sOutputFile=*) out=\"${a#-sOutputFile=}\" ;;\n"
             "    -sDEVICE=*) dev=\"${a#-sDEVICE=}\" ;;\n"
             "    -dNODISPLAY) dev=count ;;\n"
             "  esac\n"
             "done\n"
             "case \"$dev\" in\n";
        if (f.pdf_ok) s << "  pdfwrite) printf '%%PDF-1.4 fake\\n' > \"$out\" ;;\n";
        else          s << "  pdfwrite) echo 'Unrecoverable error in input'; exit 1 ;;\n";
        if (f.thumb_ok) s << "  png16m) printf 'PNG' > \"$out\" ;;\n";
        else            s << "  png16m) echo 'png device failed'; exit 1 ;;\n";
        if (f.pages > 0) s << "  count) echo " << f.pages << " ;;\n";
        else             s << "  count) exit 1 ;;\n";
        s << "esac\n"
             "exit 0\n";
    }
    std::filesystem::permissions(path,
        std::filesystem::perms::owner_all | std::filesystem::perms::group_read |
        std::filesystem::perms::group_exec);
    return path;
}

inline std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

inline void write_file(const std::string& path, const std::string& data) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << data;
}

// Blocking TCP connection to 127.0.0.1:port; -1 on failure.
inline int connect_loopback(std::uint16_t port) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) return -1;
    sockaddr_in a{};
    a.sin_family = AF_INET;
    a.sin_port = htons(port);
    a.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    if (::connect(fd, reinterpret_cast<sockaddr*>(&a), sizeof(a)) != 0) {
        ::close(fd);
        return -1;
    }
    return fd;
}

inline bool send_string(int fd, const std::string& s) {
    std::size_t off = 0;
    while (off < s.size()) {
        ssize_t n = ::send(fd, s.data() + off, s.size() - off, MSG_NOSIGNAL);
        if (n <= 0) return false;
        off += static_cast<std::size_t>(n);
    }
    return true;
}

// Reads until the peer closes.
inline std::string recv_all(int fd) {
    std::string out;
    char buf[4096];
    for (;;) {
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n <= 0) break;
        out.append(buf, static_cast<std::size_t>(n));
    }
    return out;
}

} // namespace zikzi::test
