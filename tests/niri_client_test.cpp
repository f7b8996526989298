#include <atomic>
#include <cstring>
#include <filesystem>
#include <string>
#include <thread>

#include <gtest/gtest.h>

#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include "fake_niri_transport.hpp"
#include "niritaskbar/file_descriptor.hpp"
#include "niritaskbar/niri_socket.hpp"

using niritaskbar::testing::FakeNiriScript;
using niritaskbar::testing::fake_connector;

namespace {

    std::filesystem::path temp_socket_path() {
        static std::atomic<int> counter{0};
        const auto              suffix = std::to_string(::getpid()) + "-" + std::to_string(counter.fetch_add(1));
        return std::filesystem::temp_directory_path() / ("niri-taskbar-niri-" + suffix + ".sock");
    }

    niritaskbar::FileDescriptor listen_on(const std::filesystem::path& path) {
        niritaskbar::FileDescriptor fd(::socket(AF_UNIX, SOCK_STREAM, 0));
        sockaddr_un                 addr{};
        addr.sun_family = AF_UNIX;
        std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
        if (::bind(fd.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0 || ::listen(fd.get(), 1) < 0) {
            fd.reset();
        }
        return fd;
    }

    std::string read_request_line(int fd) {
        std::string line;
        char        ch = 0;
        while (::recv(fd, &ch, 1, 0) == 1 && ch != '\n') {
            line.push_back(ch);
        }
        return line;
    }

} // namespace

TEST(NiriClient, ActivateWindowSendsFocusAction) {
    auto script = std::make_shared<FakeNiriScript>();
    script->replies.push_back(R"({"Ok":"Handled"})");
    niritaskbar::NiriClient client(fake_connector(script));

    const auto result = client.activate_window(42);

    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(script->sent.size(), 1u);
    EXPECT_EQ(script->sent.front(), R"({"Action":{"FocusWindow":{"id":42}}})");
}

TEST(NiriClient, ActivateWindowReportsCompositorError) {
    auto script = std::make_shared<FakeNiriScript>();
    script->replies.push_back(R"({"Err":"no window with id 42"})");
    niritaskbar::NiriClient client(fake_connector(script));

    const auto result = client.activate_window(42);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().message, "no window with id 42");
}

TEST(NiriClient, ActivateWindowReportsClosedConnection) {
    auto                    script = std::make_shared<FakeNiriScript>();
    niritaskbar::NiriClient client(fake_connector(script));

    const auto result = client.activate_window(1);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().message, "connection closed");
}

TEST(NiriClient, EachRequestOpensFreshConnection) {
    auto script = std::make_shared<FakeNiriScript>();
    script->replies.push_back(R"({"Ok":"Handled"})");
    script->replies.push_back(R"({"Ok":"Handled"})");
    niritaskbar::NiriClient client(fake_connector(script));

    ASSERT_TRUE(client.activate_window(1).has_value());
    ASSERT_TRUE(client.open_event_stream().has_value());

    EXPECT_EQ(script->connects, 2);
    EXPECT_EQ(script->sent.back(), "\"EventStream\"");
}

TEST(NiriClient, EventStreamKeepsConnectionForEvents) {
    auto script = std::make_shared<FakeNiriScript>();
    script->replies.push_back(R"({"Ok":"Handled"})");
    script->replies.push_back(R"({"WindowClosed":{"id":3}})");
    niritaskbar::NiriClient client(fake_connector(script));

    auto stream = client.open_event_stream();

    ASSERT_TRUE(stream.has_value());
    const auto line = (*stream)->read_line();
    ASSERT_TRUE(line.has_value());
    EXPECT_EQ(*line, R"({"WindowClosed":{"id":3}})");
}

TEST(NiriSocket, ReportsMissingSocket) {
    const auto socket = niritaskbar::NiriSocket::connect(temp_socket_path());

    ASSERT_FALSE(socket.has_value());
    EXPECT_NE(socket.error().message.find("unable to connect"), std::string::npos);
}

TEST(NiriSocket, ExchangesLinesWithServer) {
    const auto path   = temp_socket_path();
    auto       server = listen_on(path);
    ASSERT_TRUE(static_cast<bool>(server));

    std::string received;
    std::thread peer([&] {
        niritaskbar::FileDescriptor conn(::accept(server.get(), nullptr, nullptr));
        received                = read_request_line(conn.get());
        const std::string reply = "{\"Ok\":\"Handled\"}\n{\"WindowClosed\":{\"id\":9}}\n";
        ::send(conn.get(), reply.data(), reply.size(), MSG_NOSIGNAL);
    });

    niritaskbar::NiriClient                client(niritaskbar::socket_connector(path));
    auto                                   stream = client.open_event_stream();
    niritaskbar::NiriResult<std::string> event  = std::unexpected(niritaskbar::NiriErrorInfo{"test", "no stream"});
    if (stream) {
        event = (*stream)->read_line();
    }
    peer.join();

    ASSERT_TRUE(stream.has_value()) << niritaskbar::format_niri_error(stream.error());
    EXPECT_EQ(received, "\"EventStream\"");
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(*event, R"({"WindowClosed":{"id":9}})");

    const auto closed = (*stream)->read_line();
    ASSERT_FALSE(closed.has_value());
    EXPECT_EQ(closed.error().message, "connection closed");
    std::filesystem::remove(path);
}
