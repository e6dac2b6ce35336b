// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <livecap/mux/remuxer.hpp>
#include <livecap/disk/segment_writer.hpp>
#include <support/fake_http_client.hpp>
#include <support/temp_dir.hpp>
#include <algorithm>
#include <string>
#include <string_view>

using namespace livecap::mux;
using namespace livecap::media;
using livecap::core::Bytes;
using livecap::core::Url;
using livecap::disk::SegmentWriter;
using livecap::testing::TempDir;
using livecap::testing::read_file;
using livecap::testing::ts_payload;

namespace {

Bytes bytes(std::string_view text) {
    return Bytes(text.begin(), text.end());
}

Bytes box(std::string_view type, std::initializer_list<std::uint8_t> payload) {
    Bytes b{0, 0, 0, static_cast<std::uint8_t>(8 + payload.size())};
    b.insert(b.end(), type.begin(), type.end());
    b.insert(b.end(), payload.begin(), payload.end());
    return b;
}

Bytes concat(std::initializer_list<Bytes> parts) {
    Bytes out;
    for (const auto& p : parts) {
        out.insert(out.end(), p.begin(), p.end());
    }
    return out;
}

// Every segment the write produced reached the disk
bool saved(const std::vector<livecap::disk::WriteResult>& results) {
    return std::all_of(results.begin(), results.end(), [](const auto& r) { return r.path.has_value(); });
}

Segment sequence(std::uint64_t s) {
    return Segment::sequence(*Url::parse("https://cdn.example.com/s" + std::to_string(s)), std::nullopt, 0, s);
}

} // namespace

TEST_CASE("skip_mp4_header", "[remux]") {
    auto ftyp = box("ftyp", {'i', 's', 'o', 'm'});
    auto moov = box("moov", {1, 2, 3});
    auto moof = box("moof", {4, 5});

    CHECK(skip_mp4_header(concat({ftyp, moov, moof})) == ftyp.size() + moov.size());
    CHECK(skip_mp4_header(moof) == 0);

    SECTION("Truncated box swallows the rest") {
        auto data = concat({ftyp, moov});
        data.resize(data.size() - 2);
        CHECK(skip_mp4_header(data) == data.size());
    }
}

TEST_CASE("skip_webvtt_header", "[remux]") {
    CHECK(skip_webvtt_header(bytes("WEBVTT\n\n00:00.000 --> 00:01.000\nA\n")) == 8);
    CHECK(skip_webvtt_header(bytes("WEBVTT\r\nX-TIMESTAMP-MAP=MPEGTS:0\r\n\r\ncue")) == 36);
    CHECK(skip_webvtt_header(bytes("WEBVTT")) == 6);
}

TEST_CASE("ConcatRemuxer::remux", "[remux]") {
    TempDir tmp;
    SegmentWriter writer(tmp.path() / "segments");
    REQUIRE_FALSE(writer.prepare());
    ConcatRemuxer remuxer;

    SECTION("MPEG-TS segments concatenated in key order") {
        auto a = ts_payload(1, 0xA0);
        auto b = ts_payload(2, 0xB0);
        auto c = ts_payload(1, 0xC0);
        REQUIRE(saved(writer.write(Stream::main(), sequence(2), b)));
        REQUIRE(saved(writer.write(Stream::main(), sequence(3), c)));
        REQUIRE(saved(writer.write(Stream::main(), sequence(1), a)));

        auto outputs = remuxer.remux(writer.manifest(), tmp.path(), std::nullopt);
        REQUIRE(outputs.has_value());
        REQUIRE(outputs->size() == 1);
        CHECK((*outputs)[0] == tmp.path() / "main.ts");
        CHECK(read_file((*outputs)[0]) == concat({a, b, c}));
    }

    SECTION("Repeated MP4 headers dropped") {
        auto stream = Stream::video("cam");
        auto init = concat({box("ftyp", {'i', 's', 'o', 'm'}), box("moov", {9})});
        auto frag1 = box("moof", {1});
        auto frag2 = box("moof", {2});

        REQUIRE(saved(writer.write(stream, Segment::initialization(*Url::parse("https://cdn.example.com/init.mp4")),
                             init)));
        REQUIRE(saved(writer.write(stream, sequence(1), frag1)));
        REQUIRE(saved(writer.write(stream, sequence(2), frag2)));

        auto outputs = remuxer.remux(writer.manifest(), tmp.path(), std::nullopt);
        REQUIRE(outputs.has_value());
        REQUIRE(outputs->size() == 1);
        CHECK((*outputs)[0] == tmp.path() / "video_cam.mp4");
        CHECK(read_file((*outputs)[0]) == concat({init, frag1, frag2}));
    }

    SECTION("WebVTT headers merged") {
        auto stream = Stream::subtitle("English", "en");
        REQUIRE(saved(writer.write(stream, sequence(1), bytes("WEBVTT\n\n00:00.000 --> 00:01.000\nA\n"))));
        REQUIRE(saved(writer.write(stream, sequence(2), bytes("WEBVTT\n\n00:01.000 --> 00:02.000\nB\n"))));

        auto outputs = remuxer.remux(writer.manifest(), tmp.path(), std::nullopt);
        REQUIRE(outputs.has_value());
        REQUIRE(outputs->size() == 1);
        CHECK((*outputs)[0] == tmp.path() / "subtitle_English.vtt");
        CHECK(read_file((*outputs)[0])
              == bytes("WEBVTT\n\n00:00.000 --> 00:01.000\nA\n\n00:01.000 --> 00:02.000\nB\n"));
    }

    SECTION("Main target overrides the main stream path") {
        REQUIRE(saved(writer.write(Stream::main(), sequence(1), ts_payload(1))));
        REQUIRE(saved(writer.write(Stream::audio("en"), sequence(1), Bytes{0xFF, 0xF1, 0x50, 0x80})));

        auto outputs = remuxer.remux(writer.manifest(), tmp.path(), std::filesystem::path("show/full.ts"));
        REQUIRE(outputs.has_value());
        REQUIRE(outputs->size() == 2);
        CHECK((*outputs)[0] == tmp.path() / "show/full.ts");
        CHECK((*outputs)[1] == tmp.path() / "audio_en.aac");
        CHECK(std::filesystem::exists(tmp.path() / "show/full.ts"));
    }

    SECTION("Streams whose names clash get separate outputs") {
        auto a = ts_payload(1, 0xA0);
        auto b = ts_payload(1, 0xB0);
        REQUIRE(saved(writer.write(Stream::video("a b"), sequence(1), a)));
        REQUIRE(saved(writer.write(Stream::video("a_b"), sequence(1), b)));

        auto outputs = remuxer.remux(writer.manifest(), tmp.path(), std::nullopt);
        REQUIRE(outputs.has_value());
        REQUIRE(outputs->size() == 2);
        CHECK(read_file(tmp.path() / "video_a_b.ts") == b);
        CHECK(read_file(tmp.path() / "video_a_b_2.ts") == a);
    }

    SECTION("Empty manifest produces nothing") {
        auto outputs = remuxer.remux(writer.manifest(), tmp.path(), std::nullopt);
        REQUIRE(outputs.has_value());
        CHECK(outputs->empty());
    }

    SECTION("Missing segment file is an error") {
        REQUIRE(saved(writer.write(Stream::main(), sequence(1), ts_payload(1))));
        std::filesystem::remove(writer.manifest().entries(Stream::main())[0].path);

        auto outputs = remuxer.remux(writer.manifest(), tmp.path(), std::nullopt);
        REQUIRE_FALSE(outputs.has_value());
        CHECK(outputs.error() == livecap::disk::DiskErrc::open_failed);
    }
}
