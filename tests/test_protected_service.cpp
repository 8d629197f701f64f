/**
 * @file test_protected_service.cpp
 * @brief ProtectedService: greeting payload and bind failures
 */

#include <gtest/gtest.h>
#include "kg_logger.hpp"
#include "kg_protected_service.hpp"

#include <string>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

using namespace kg;

namespace {

std::string read_greeting(uint16_t port) {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) return "";
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    if (connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
        close(fd);
        return "";
    }
    timeval tv{};
    tv.tv_sec = 2;
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    std::string out;
    char buf[128];
    ssize_t n;
    while ((n = recv(fd, buf, sizeof(buf), 0)) > 0) {
        out.append(buf, static_cast<size_t>(n));
    }
    close(fd);
    return out;
}

} // namespace

TEST(ProtectedServiceTest, SendsConfirmationPayload) {
    Logger::instance().setLevel(LogLevel::NONE);
    ProtectedService service(0, "127.0.0.1");
    ASSERT_TRUE(service.start());

    EXPECT_EQ(read_greeting(service.port()),
              "Protected service reached. Port knocking worked.\n");
    EXPECT_EQ(read_greeting(service.port()), ProtectedService::kGreeting);

    service.stop();
    EXPECT_EQ(service.connections_served(), 2u);
}

TEST(ProtectedServiceTest, BindConflictFailsStart) {
    Logger::instance().setLevel(LogLevel::NONE);
    ProtectedService first(0, "127.0.0.1");
    ASSERT_TRUE(first.start());
    ProtectedService second(first.port(), "127.0.0.1");
    EXPECT_FALSE(second.start());
}
