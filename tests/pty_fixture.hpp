#pragma once

#include <gtest/gtest.h>

#include <cstdlib>
#include <fcntl.h>
#include <string>
#include <termios.h>
#include <unistd.h>

namespace termsession::test_support {

// Pseudo-terminal pair for tests that need a real terminal device.
// The library never allocates one itself; tests use the slave side as the
// console and drive it from the master side.
class PseudoTerminalTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        master_fd_ = posix_openpt(O_RDWR | O_NOCTTY);
        if (master_fd_ < 0) {
            GTEST_SKIP() << "no pseudo-terminal available";
        }
        if (grantpt(master_fd_) != 0 || unlockpt(master_fd_) != 0) {
            GTEST_SKIP() << "cannot unlock pseudo-terminal";
        }
        const char* name = ptsname(master_fd_);
        if (!name) {
            GTEST_SKIP() << "cannot name pseudo-terminal slave";
        }
        slave_path_ = name;
    }

    void TearDown() override
    {
        if (master_fd_ >= 0) {
            ::close(master_fd_);
        }
    }

    auto slave_attributes(int fd) -> struct termios
    {
        struct termios attributes{};
        EXPECT_EQ(tcgetattr(fd, &attributes), 0);
        return attributes;
    }

    auto write_master(const std::string& text) -> void
    {
        ASSERT_EQ(::write(master_fd_, text.data(), text.size()),
                  static_cast<ssize_t>(text.size()));
    }

    auto read_master(size_t max = 256) -> std::string
    {
        std::string buffer(max, '\0');
        ssize_t n = ::read(master_fd_, buffer.data(), buffer.size());
        buffer.resize(n > 0 ? static_cast<size_t>(n) : 0);
        return buffer;
    }

    int master_fd_ = -1;
    std::string slave_path_;
};

} // namespace termsession::test_support
