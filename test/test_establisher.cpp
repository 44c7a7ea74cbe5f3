// test/test_establisher.cpp
// Unit tests for the single-assignment socket slot and the accept/dial race

#include "peerlink/error.hpp"
#include "peerlink/establisher.hpp"
#include "peerlink/socket.hpp"
#include "test_common.hpp"

#include <sys/socket.h>
#include <poll.h>
#include <unistd.h>

#include <atomic>
#include <condition_variable>
#include <mutex>

using namespace peerlink;

// ============================================================================
// SocketSlot
// ============================================================================

TEST(slot_single_winner_under_race) {
    const int kThreads = 8;
    std::vector<Socket> mine(kThreads);
    std::vector<Socket> peers(kThreads);
    for (int i = 0; i < kThreads; ++i) {
        int sv[2];
        ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM, 0, sv), 0);
        mine[i] = Socket(sv[0]);
        peers[i] = Socket(sv[1]);
    }

    SocketSlot slot;
    std::atomic<bool> go{false};
    std::atomic<int> winners{0};
    std::vector<int> fds(kThreads);
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        fds[i] = mine[i].get();
        threads.emplace_back([&, i] {
            while (!go) std::this_thread::yield();
            if (slot.try_install(mine[i])) ++winners;
        });
    }
    go = true;
    for (auto& t : threads) t.join();

    ASSERT_EQ(winners.load(), 1);
    ASSERT_TRUE(slot.installed());
    int released = 0;
    for (int i = 0; i < kThreads; ++i) {
        if (!mine[i].valid()) {
            ++released;
            ASSERT_EQ(slot.fd(), fds[i]);
        }
    }
    ASSERT_EQ(released, 1);
}

TEST(slot_rejects_empty_socket) {
    SocketSlot slot;
    Socket empty;
    ASSERT_FALSE(slot.try_install(empty));
    ASSERT_FALSE(slot.installed());
}

TEST(slot_reset_retires) {
    int sv[2];
    ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM, 0, sv), 0);
    Socket a(sv[0]);
    Socket b(sv[1]);

    SocketSlot slot;
    ASSERT_TRUE(slot.try_install(a));
    slot.reset();
    ASSERT_FALSE(slot.installed());
    ASSERT_TRUE(slot.retired());

    // the peer end sees EOF once the slot closed its socket
    char c;
    ASSERT_EQ(::recv(b.get(), &c, 1, 0), 0);

    int sv2[2];
    ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM, 0, sv2), 0);
    Socket late(sv2[0]);
    Socket late_peer(sv2[1]);
    ASSERT_FALSE(slot.try_install(late));
    ASSERT_TRUE(late.valid());
    slot.reset();
}

// ============================================================================
// Establisher
// ============================================================================

struct WinRecord {
    std::mutex mu;
    std::condition_variable cv;
    int fd{-1};
    int count{0};
    Establisher::Origin origin{Establisher::Origin::Inbound};

    Establisher::WonHandler handler() {
        return [this](int f, Establisher::Origin o) {
            std::lock_guard<std::mutex> lk(mu);
            fd = f;
            origin = o;
            ++count;
            cv.notify_all();
        };
    }
    bool wait(int ms) {
        std::unique_lock<std::mutex> lk(mu);
        return cv.wait_for(lk, std::chrono::milliseconds(ms), [this] { return count > 0; });
    }
};

static Endpoint endpoint(int listen, int peer) {
    Endpoint ep;
    ep.listen_port = (std::uint16_t)listen;
    ep.peer_host = "127.0.0.1";
    ep.peer_port = (std::uint16_t)peer;
    return ep;
}

TEST(bind_conflict_throws_synchronously) {
    const int base = pick_port_pair();
    Socket holder = listen_tcp("", (std::uint16_t)base);

    ConnectorOptions opts;
    RecordingObserver obs;
    SocketSlot slot;
    Establisher est(opts, obs, slot);
    ASSERT_THROWS(est.start(endpoint(base, base + 1), nullptr), TransportError);
}

TEST(stop_is_prompt_without_peer) {
    const int base = pick_port_pair();
    ConnectorOptions opts;
    RecordingObserver obs;
    SocketSlot slot;
    Establisher est(opts, obs, slot);
    est.start(endpoint(base, base + 1), nullptr);
    sleep_ms(300);

    auto t0 = std::chrono::steady_clock::now();
    est.stop();
    auto took = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0);
    ASSERT_LT(took.count(), 1500);
    ASSERT_FALSE(slot.installed());
}

TEST(inbound_wins_and_listener_closes) {
    const int base = pick_port_pair();
    ConnectorOptions opts;
    RecordingObserver obs;
    SocketSlot slot;
    WinRecord won;
    Establisher est(opts, obs, slot);
    // nothing listens on base + 1, so only the inbound side can win
    est.start(endpoint(base, base + 1), won.handler());

    std::string why;
    Socket client = try_dial_tcp("127.0.0.1", (std::uint16_t)base, std::chrono::milliseconds(500), why);
    ASSERT_TRUE(client.valid());
    ASSERT_TRUE(won.wait(2000));
    ASSERT_TRUE(won.origin == Establisher::Origin::Inbound);
    ASSERT_EQ(slot.fd(), won.fd);

    // accept loop exits after one peer; give it a poll interval to close the listener
    sleep_ms(400);
    Socket second = try_dial_tcp("127.0.0.1", (std::uint16_t)base, std::chrono::milliseconds(300), why);
    ASSERT_FALSE(second.valid());

    est.stop();
    slot.reset();
}

TEST(symmetric_pair_shares_one_connection) {
    const int base = pick_port_pair();
    ConnectorOptions opts;
    RecordingObserver obs_a, obs_b;
    SocketSlot slot_a, slot_b;
    WinRecord won_a, won_b;
    Establisher a(opts, obs_a, slot_a);
    Establisher b(opts, obs_b, slot_b);

    a.start(endpoint(base, base + 1), won_a.handler());
    sleep_ms(200);
    b.start(endpoint(base + 1, base), won_b.handler());

    ASSERT_TRUE(won_a.wait(3000));
    ASSERT_TRUE(won_b.wait(3000));
    ASSERT_EQ(won_a.count, 1);
    ASSERT_EQ(won_b.count, 1);

    const char ping[] = "ping";
    send_all(slot_a.fd(), (const std::uint8_t*)ping, 4);
    pollfd pfd{};
    pfd.fd = slot_b.fd();
    pfd.events = POLLIN;
    ASSERT_EQ(::poll(&pfd, 1, 2000), 1);
    char buf[8] = {0};
    ASSERT_EQ(::recv(slot_b.fd(), buf, sizeof(buf), 0), 4);
    ASSERT_EQ(std::string(buf, 4), std::string("ping"));

    a.stop();
    b.stop();
    slot_a.reset();
    slot_b.reset();
}

int main() {
    return run_all_tests("Establisher");
}
