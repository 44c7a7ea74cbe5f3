// test/test_zmq_connector.cpp
// End-to-end tests of the connector over the ZeroMQ pair binding

#include "connector_cases.hpp"

#include <zmq.hpp>

TEST(hello_ack_scenario) { case_hello_ack(TransportKind::ZmqPair); }
TEST(echo_one_mib_a_first) { case_echo_large_payload(TransportKind::ZmqPair, false); }
TEST(echo_one_mib_b_first) { case_echo_large_payload(TransportKind::ZmqPair, true); }
TEST(fifo_thousand_messages) { case_fifo_thousand(TransportKind::ZmqPair); }
TEST(concurrent_senders_do_not_interleave) { case_concurrent_senders(TransportKind::ZmqPair); }
TEST(receive_released_by_close) { case_receive_released_by_close(TransportKind::ZmqPair); }
TEST(send_without_peer_not_connected) { case_send_without_peer(TransportKind::ZmqPair); }
TEST(lifecycle_errors) { case_lifecycle_errors(TransportKind::ZmqPair); }
TEST(listen_port_in_use) { case_listen_port_in_use(TransportKind::ZmqPair); }

TEST(connected_once_bound) {
    const int base = pick_port_pair();
    Connector c(TransportKind::ZmqPair, fast_close_options(), std::make_shared<RecordingObserver>());
    c.connect(base, base + 1);
    ASSERT_TRUE(c.state() == ConnectionState::Connected);
    ASSERT_TRUE(c.is_connected());
    c.close();
    ASSERT_FALSE(c.is_connected());
}

TEST(wrong_part_count_is_fatal) {
    const int base = pick_port_pair();
    auto obs = std::make_shared<RecordingObserver>();
    Connector c(TransportKind::ZmqPair, fast_close_options(), obs);
    c.connect(base, base + 1);

    zmq::context_t ctx;
    zmq::socket_t rogue(ctx, zmq::socket_type::pair);
    rogue.set(zmq::sockopt::linger, 0);
    rogue.connect("tcp://127.0.0.1:" + std::to_string(base));
    std::string a = "tag", b = "payload", extra = "extra";
    (void)rogue.send(zmq::buffer(a), zmq::send_flags::sndmore);
    (void)rogue.send(zmq::buffer(b), zmq::send_flags::sndmore);
    (void)rogue.send(zmq::buffer(extra), zmq::send_flags::none);

    ASSERT_THROWS(c.receive(), ConnectionLostError);
    ASSERT_TRUE(c.connection_lost());
    ASSERT_EQ(obs->lost_count(), (std::size_t)1);
    rogue.close();
}

TEST(close_races_connect) { case_close_races_connect(TransportKind::ZmqPair); }

TEST(send_to_departed_peer_is_a_transport_error) {
    const int base = pick_port_pair();
    ConnectorOptions opts = fast_close_options();
    opts.connect_wait = std::chrono::milliseconds(300);
    Pair p(TransportKind::ZmqPair, opts);
    p.connect(base, base + 1);
    p.a.send("hello");
    ASSERT_EQ(p.b.receive().tag, std::string("hello"));

    p.b.close();
    sleep_ms(300);
    // a was talking to b, so a stalled send is not "never connected"
    ASSERT_THROWS(p.a.send("anyone?"), TransportError);
}

int main() {
    return run_all_tests("ZMQ connector");
}
