// test/test_options.cpp
// Unit tests for connector options, transport names and the timing collector

#include "peerlink/connector.hpp"
#include "peerlink/options.hpp"
#include "test_common.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/sinks/ostream_sink.h>

#include <sstream>

using namespace peerlink;

TEST(defaults_match_link_timing) {
    ConnectorOptions o;
    ASSERT_EQ(o.dial_timeout.count(), 500);
    ASSERT_EQ(o.retry_backoff.count(), 200);
    ASSERT_EQ(o.poll_interval.count(), 200);
    ASSERT_EQ(o.connect_wait.count(), 2000);
    ASSERT_EQ(o.close_drain.count(), 250);
    ASSERT_EQ(o.max_frame_size, (std::size_t)kMaxFrameSize);
    o.validate();
}

TEST(parse_known_keys) {
    ConnectorOptions o;
    ASSERT_TRUE(parse_option(o, "dial-timeout-ms", "750"));
    ASSERT_TRUE(parse_option(o, "retry-backoff-ms", "100"));
    ASSERT_TRUE(parse_option(o, "poll-interval-ms", "50"));
    ASSERT_TRUE(parse_option(o, "connect-wait-ms", "5000"));
    ASSERT_TRUE(parse_option(o, "close-drain-ms", "0"));
    ASSERT_TRUE(parse_option(o, "max-frame-size", "1048576"));
    ASSERT_TRUE(parse_option(o, "bind-host", "127.0.0.1"));
    ASSERT_EQ(o.dial_timeout.count(), 750);
    ASSERT_EQ(o.retry_backoff.count(), 100);
    ASSERT_EQ(o.poll_interval.count(), 50);
    ASSERT_EQ(o.connect_wait.count(), 5000);
    ASSERT_EQ(o.close_drain.count(), 0);
    ASSERT_EQ(o.max_frame_size, (std::size_t)1048576);
    ASSERT_EQ(o.bind_host, std::string("127.0.0.1"));
    o.validate();
}

TEST(parse_rejects_garbage) {
    ConnectorOptions o;
    ASSERT_FALSE(parse_option(o, "no-such-key", "1"));
    ASSERT_THROWS(parse_option(o, "dial-timeout-ms", "fast"), std::invalid_argument);
    ASSERT_THROWS(parse_option(o, "dial-timeout-ms", "12ms"), std::invalid_argument);
    ASSERT_THROWS(parse_option(o, "max-frame-size", "-1"), std::invalid_argument);
}

TEST(validate_rejects_bad_values) {
    ConnectorOptions o;
    o.dial_timeout = std::chrono::milliseconds(0);
    ASSERT_THROWS(o.validate(), std::invalid_argument);

    ConnectorOptions big;
    big.max_frame_size = (std::size_t)kMaxFrameSize + 1;
    ASSERT_THROWS(big.validate(), std::invalid_argument);

    ConnectorOptions bad;
    bad.connect_wait = std::chrono::milliseconds(-5);
    ASSERT_THROWS((void)Connector(TransportKind::Tcp, bad), std::invalid_argument);
}

TEST(transport_names) {
    ASSERT_TRUE(parse_transport_kind("tcp") == TransportKind::Tcp);
    ASSERT_TRUE(parse_transport_kind("zmq") == TransportKind::ZmqPair);
    ASSERT_THROWS(parse_transport_kind("udp"), std::invalid_argument);
    ASSERT_EQ(std::string(to_string(TransportKind::ZmqPair)), std::string("zmq"));
    ASSERT_EQ(std::string(to_string(ConnectionState::Establishing)), std::string("establishing"));
}

TEST(log_observer_forwards_and_collects) {
    std::ostringstream out;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
    auto logger = std::make_shared<spdlog::logger>("test", sink);
    logger->set_level(spdlog::level::debug);
    LogObserver obs(logger);

    obs.log(spdlog::level::info, "link up");
    obs.connection_lost("peer closed the connection");
    obs.timing("send", 1.5);
    {
        ScopedTiming t(obs, "scoped");
    }
    int id = obs.start_timer("manual");
    ASSERT_LT(-1.0, obs.stop_timer(id));
    ASSERT_EQ(obs.stop_timer(id), -1.0);

    const std::string text = out.str();
    ASSERT_TRUE(text.find("link up") != std::string::npos);
    ASSERT_TRUE(text.find("peer closed the connection") != std::string::npos);

    std::vector<Measurement> r = obs.report();
    ASSERT_EQ(r.size(), (std::size_t)3);
    ASSERT_EQ(r[0].name, std::string("send"));
    ASSERT_EQ(r[1].name, std::string("scoped"));
    ASSERT_EQ(r[2].name, std::string("manual"));
    ASSERT_TRUE(obs.report().empty());
}

TEST(log_observer_flushes_stale_timers) {
    auto logger = std::make_shared<spdlog::logger>("stale");
    LogObserver obs(logger);
    obs.set_stale_timeout(std::chrono::milliseconds(20));
    obs.start_timer("dangling");
    int second = obs.start_timer("second");
    ASSERT_TRUE(obs.report().empty());
    sleep_ms(60);
    std::vector<Measurement> r = obs.report();
    ASSERT_EQ(r.size(), (std::size_t)2);
    ASSERT_EQ(obs.stop_timer(second), -1.0);
}

TEST(report_json_lists_measurements) {
    auto logger = std::make_shared<spdlog::logger>("json");
    LogObserver obs(logger);
    obs.timing("establish", 12.5);
    obs.timing("send", 0.25);

    nlohmann::json doc = nlohmann::json::parse(obs.report_json());
    ASSERT_TRUE(doc["Measurements"].is_array());
    ASSERT_EQ(doc["Measurements"].size(), (std::size_t)2);
    ASSERT_EQ(doc["Measurements"][0]["Name"].get<std::string>(), std::string("establish"));
    ASSERT_EQ(doc["Measurements"][0]["Time"].get<double>(), 12.5);
    ASSERT_EQ(doc["Measurements"][1]["Name"].get<std::string>(), std::string("send"));

    // drained by the first call
    nlohmann::json again = nlohmann::json::parse(obs.report_json(2));
    ASSERT_TRUE(again["Measurements"].empty());
}

TEST(recent_log_keeps_what_passed_the_level) {
    std::ostringstream out;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
    auto logger = std::make_shared<spdlog::logger>("history", sink);
    logger->set_level(spdlog::level::info);
    LogObserver obs(logger, 3);

    obs.log(spdlog::level::debug, "dialing");
    obs.log(spdlog::level::info, "listening on port 20000");
    obs.log(spdlog::level::warn, "discarding outbound connection");
    obs.connection_lost("peer closed the connection");

    std::vector<LogEntry> log = obs.recent_log();
    ASSERT_EQ(log.size(), (std::size_t)3);
    ASSERT_EQ(log[0].message, std::string("listening on port 20000"));
    ASSERT_TRUE(log[1].level == spdlog::level::warn);
    ASSERT_EQ(log[2].message, std::string("connection lost: peer closed the connection"));
    ASSERT_TRUE(out.str().find("dialing") == std::string::npos);

    obs.log(spdlog::level::err, "read failed");
    log = obs.recent_log(1);
    ASSERT_EQ(log.size(), (std::size_t)1);
    ASSERT_EQ(log[0].message, std::string("read failed"));
    // the ring holds the newest entries only
    ASSERT_EQ(obs.recent_log().front().message, std::string("discarding outbound connection"));
}

int main() {
    return run_all_tests("options");
}
