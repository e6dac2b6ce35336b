// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <livecap/capture/playlist_poller.hpp>
#include <support/fake_http_client.hpp>
#include <chrono>
#include <limits>
#include <string>
#include <thread>
#include <vector>

using namespace livecap::capture;
using namespace livecap::media;
using livecap::core::HttpErrc;
using livecap::core::Stopper;
using livecap::core::Url;
using livecap::testing::FakeHttpClient;
using namespace std::chrono_literals;

namespace {

const std::string PLAYLIST_URL = "https://cdn.example.com/live/index.m3u8";

// Live window of `count` segments starting at `first`
std::string live_window(std::uint64_t first, std::uint64_t count, bool end_list = false) {
    std::string text = "#EXTM3U\n#EXT-X-TARGETDURATION:2\n#EXT-X-MEDIA-SEQUENCE:" + std::to_string(first) + "\n";
    for (std::uint64_t s = first; s < first + count; ++s) {
        text += "#EXTINF:2.0,\ns" + std::to_string(s) + ".ts\n";
    }
    if (end_list) {
        text += "#EXT-X-ENDLIST\n";
    }
    return text;
}

HLSMediaPlaylist parse(const std::string& text) {
    auto playlist = HLSParser::parse_media(text);
    REQUIRE(playlist.has_value());
    return *playlist;
}

std::vector<SegmentRequest> drain(Receiver<SegmentRequest>& rx) {
    std::vector<SegmentRequest> out;
    while (auto r = rx.try_receive()) {
        out.push_back(std::move(*r));
    }
    return out;
}

struct Fixture {
    std::shared_ptr<FakeHttpClient> client = std::make_shared<FakeHttpClient>();
    Stopper stopper;
    std::pair<Sender<SegmentRequest>, Receiver<SegmentRequest>> channel = make_channel<SegmentRequest>();

    PlaylistPoller poller(Stream stream = Stream::main()) {
        return PlaylistPoller(client, stopper, channel.first, std::move(stream), *Url::parse(PLAYLIST_URL));
    }
};

} // namespace

TEST_CASE("PlaylistPoller::process - new segments only", "[poller]") {
    Fixture f;
    auto poller = f.poller();
    auto& rx = f.channel.second;

    auto first = poller.process(parse(live_window(100, 3)));
    REQUIRE(first.has_value());
    CHECK(first->emitted == 3);
    CHECK_FALSE(first->end_list);
    CHECK(first->next_poll == 2000ms);

    auto requests = drain(rx);
    REQUIRE(requests.size() == 3);
    CHECK(requests[0].segment.url().full() == "https://cdn.example.com/live/s100.ts");
    CHECK(requests[0].segment.key() == SegmentKey{0, 100});
    CHECK(requests[2].segment.key() == SegmentKey{0, 102});
    CHECK(requests[0].encryption.is_none());
    CHECK(requests[0].stream == Stream::main());
    CHECK_FALSE(requests[0].needs_initialization);

    SECTION("Unchanged playlist emits nothing and polls sooner") {
        auto again = poller.process(parse(live_window(100, 3)));
        REQUIRE(again.has_value());
        CHECK(again->emitted == 0);
        CHECK(again->next_poll == 1000ms);
        CHECK(drain(rx).empty());
    }

    SECTION("Sliding window emits only the tail") {
        auto next = poller.process(parse(live_window(101, 4)));
        REQUIRE(next.has_value());
        CHECK(next->emitted == 2);
        auto more = drain(rx);
        REQUIRE(more.size() == 2);
        CHECK(more[0].segment.sequence() == 103);
        CHECK(more[1].segment.sequence() == 104);
        CHECK(poller.last_emitted() == SegmentKey{0, 104});
    }

    SECTION("Stale playlist from a lagging edge is ignored") {
        auto stale = poller.process(parse(live_window(98, 3)));
        REQUIRE(stale.has_value());
        CHECK(stale->emitted == 0);
    }
}

TEST_CASE("PlaylistPoller::process - poll interval bounds", "[poller]") {
    Fixture f;
    auto poller = f.poller();

    SECTION("Huge target duration is capped") {
        auto step = poller.process(parse(
            "#EXTM3U\n#EXT-X-TARGETDURATION:1e300\n#EXT-X-MEDIA-SEQUENCE:0\n#EXTINF:2,\ns0.ts\n"));
        REQUIRE(step.has_value());
        CHECK(step->next_poll == MAX_POLL_INTERVAL);

        auto again = poller.process(parse(
            "#EXTM3U\n#EXT-X-TARGETDURATION:1e300\n#EXT-X-MEDIA-SEQUENCE:0\n#EXTINF:2,\ns0.ts\n"));
        REQUIRE(again.has_value());
        CHECK(again->next_poll == MAX_POLL_INTERVAL);
    }

    SECTION("Tiny or unusable target duration polls at the floor") {
        HLSMediaPlaylist playlist;
        playlist.target_duration = 0.1;
        auto step = poller.process(playlist);
        REQUIRE(step.has_value());
        CHECK(step->next_poll == MIN_POLL_INTERVAL);

        playlist.target_duration = std::numeric_limits<double>::quiet_NaN();
        step = poller.process(playlist);
        REQUIRE(step.has_value());
        CHECK(step->next_poll == MIN_POLL_INTERVAL);
    }
}

TEST_CASE("PlaylistPoller::process - discontinuities", "[poller]") {
    Fixture f;
    auto poller = f.poller();

    auto step = poller.process(parse(
        "#EXTM3U\n"
        "#EXT-X-TARGETDURATION:2\n"
        "#EXT-X-MEDIA-SEQUENCE:10\n"
        "#EXT-X-DISCONTINUITY-SEQUENCE:3\n"
        "#EXTINF:2,\na.ts\n"
        "#EXT-X-DISCONTINUITY\n"
        "#EXTINF:2,\nb.ts\n"
        "#EXTINF:2,\nc.ts\n"));
    REQUIRE(step.has_value());

    auto requests = drain(f.channel.second);
    REQUIRE(requests.size() == 3);
    CHECK(requests[0].segment.key() == SegmentKey{3, 10});
    CHECK(requests[1].segment.key() == SegmentKey{4, 11});
    CHECK(requests[2].segment.key() == SegmentKey{4, 12});

    SECTION("Encoder restart resets the sequence within a new generation") {
        auto restarted = poller.process(parse(
            "#EXTM3U\n"
            "#EXT-X-TARGETDURATION:2\n"
            "#EXT-X-MEDIA-SEQUENCE:0\n"
            "#EXT-X-DISCONTINUITY-SEQUENCE:5\n"
            "#EXTINF:2,\nr0.ts\n"));
        REQUIRE(restarted.has_value());
        CHECK(restarted->emitted == 1);
        auto more = drain(f.channel.second);
        REQUIRE(more.size() == 1);
        CHECK(more[0].segment.key() == SegmentKey{5, 0});
    }
}

TEST_CASE("PlaylistPoller::process - initialization segment", "[poller]") {
    Fixture f;
    auto poller = f.poller(Stream::video("cam"));

    const std::string fmp4 =
        "#EXTM3U\n"
        "#EXT-X-TARGETDURATION:2\n"
        "#EXT-X-MEDIA-SEQUENCE:1\n"
        "#EXT-X-MAP:URI=\"init.mp4\",BYTERANGE=\"600@0\"\n"
        "#EXTINF:2,\ns1.m4s\n"
        "#EXTINF:2,\ns2.m4s\n";

    auto step = poller.process(parse(fmp4));
    REQUIRE(step.has_value());
    CHECK(step->emitted == 3);
    CHECK(poller.initialization_sent());

    auto requests = drain(f.channel.second);
    REQUIRE(requests.size() == 3);
    CHECK(requests[0].segment.is_initialization());
    CHECK(requests[0].segment.url().full() == "https://cdn.example.com/live/init.mp4");
    CHECK(requests[0].segment.range_header() == "bytes=0-599");
    CHECK_FALSE(requests[1].segment.is_initialization());
    CHECK_FALSE(requests[0].needs_initialization);
    CHECK(requests[1].needs_initialization);
    CHECK(requests[2].needs_initialization);

    SECTION("Sent once per stream") {
        auto next = poller.process(parse(
            "#EXTM3U\n"
            "#EXT-X-TARGETDURATION:2\n"
            "#EXT-X-MEDIA-SEQUENCE:2\n"
            "#EXT-X-MAP:URI=\"init.mp4\",BYTERANGE=\"600@0\"\n"
            "#EXTINF:2,\ns2.m4s\n"
            "#EXTINF:2,\ns3.m4s\n"));
        REQUIRE(next.has_value());
        CHECK(next->emitted == 1);
        auto more = drain(f.channel.second);
        REQUIRE(more.size() == 1);
        CHECK(more[0].segment.sequence() == 3);
    }
}

TEST_CASE("PlaylistPoller::process - encryption", "[poller]") {
    Fixture f;
    livecap::core::Bytes key(16, 0x42);
    f.client->add_bytes("https://cdn.example.com/keys/k1", key);
    auto poller = f.poller();

    auto step = poller.process(parse(
        "#EXTM3U\n"
        "#EXT-X-TARGETDURATION:2\n"
        "#EXT-X-MEDIA-SEQUENCE:7\n"
        "#EXT-X-KEY:METHOD=AES-128,URI=\"../keys/k1\"\n"
        "#EXTINF:2,\ns7.ts\n"
        "#EXTINF:2,\ns8.ts\n"));
    REQUIRE(step.has_value());

    auto requests = drain(f.channel.second);
    REQUIRE(requests.size() == 2);
    CHECK(requests[0].encryption.method() == EncryptionMethod::aes_128);
    CHECK(requests[0].encryption.iv() == iv_from_sequence(7));
    CHECK(requests[1].encryption.iv() == iv_from_sequence(8));

    SECTION("Unchanged key is not fetched again") {
        auto next = poller.process(parse(
            "#EXTM3U\n"
            "#EXT-X-TARGETDURATION:2\n"
            "#EXT-X-MEDIA-SEQUENCE:8\n"
            "#EXT-X-KEY:METHOD=AES-128,URI=\"../keys/k1\"\n"
            "#EXTINF:2,\ns8.ts\n"
            "#EXTINF:2,\ns9.ts\n"));
        REQUIRE(next.has_value());
        CHECK(f.client->count("https://cdn.example.com/keys/k1") == 1);
        auto more = drain(f.channel.second);
        REQUIRE(more.size() == 1);
        CHECK(more[0].encryption.iv() == iv_from_sequence(9));
    }

    SECTION("Key fetch failure is an error") {
        auto bad = poller.process(parse(
            "#EXTM3U\n"
            "#EXT-X-TARGETDURATION:2\n"
            "#EXT-X-MEDIA-SEQUENCE:9\n"
            "#EXT-X-KEY:METHOD=AES-128,URI=\"../keys/missing\"\n"
            "#EXTINF:2,\ns9.ts\n"));
        REQUIRE_FALSE(bad.has_value());
        CHECK(bad.error() == HttpErrc::not_found);
    }
}

TEST_CASE("PlaylistPoller::process - closed receiver", "[poller]") {
    Fixture f;
    auto poller = f.poller();
    f.channel.second.close();

    auto step = poller.process(parse(live_window(1, 3)));
    REQUIRE(step.has_value());
    CHECK(step->receiver_closed);
    CHECK(step->emitted == 0);
}

TEST_CASE("PlaylistPoller::run", "[poller]") {
    Fixture f;

    SECTION("Stops at the end of the playlist") {
        f.client->add(PLAYLIST_URL, live_window(0, 2));
        f.client->add(PLAYLIST_URL, live_window(1, 3, true));
        auto poller = f.poller();
        f.channel.first.close();

        CHECK_FALSE(poller.run());

        std::vector<std::uint64_t> sequences;
        while (auto r = f.channel.second.receive()) {
            sequences.push_back(r->segment.sequence());
        }
        CHECK(sequences == std::vector<std::uint64_t>{0, 1, 2, 3});
        CHECK(f.client->count(PLAYLIST_URL) == 2);
    }

    SECTION("Fetch failure is a poll error") {
        f.client->fail(PLAYLIST_URL, make_error_code(HttpErrc::not_found));
        auto poller = f.poller();
        CHECK(poller.run() == CaptureErrc::poll_error);
    }

    SECTION("Stopper ends a live playlist") {
        f.client->add(PLAYLIST_URL, live_window(0, 1));
        auto poller = f.poller();
        f.channel.first.close();

        std::jthread stopping([stopper = f.stopper]() mutable {
            std::this_thread::sleep_for(50ms);
            stopper.stop();
        });

        auto start = Stopper::Clock::now();
        CHECK_FALSE(poller.run());
        CHECK(Stopper::Clock::now() - start < 5s);
        CHECK(f.channel.second.receive().has_value());
        CHECK_FALSE(f.channel.second.receive().has_value());
    }

    SECTION("Already stopped returns cleanly") {
        f.client->fail(PLAYLIST_URL, make_error_code(HttpErrc::cancelled));
        f.stopper.stop();
        auto poller = f.poller();
        CHECK_FALSE(poller.run());
    }
}
