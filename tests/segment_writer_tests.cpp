// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <livecap/disk/segment_writer.hpp>
#include <support/fake_http_client.hpp>
#include <support/temp_dir.hpp>
#include <algorithm>
#include <random>
#include <vector>

using namespace livecap::disk;
using namespace livecap::media;
using livecap::core::Bytes;
using livecap::core::Url;
using livecap::testing::TempDir;
using livecap::testing::read_file;
using livecap::testing::ts_payload;

namespace fs = std::filesystem;

namespace {

Url segment_url(std::uint64_t seq) {
    return *Url::parse("https://cdn.example.com/live/s" + std::to_string(seq) + ".ts");
}

Bytes mp4_init() {
    return Bytes{0x00, 0x00, 0x00, 0x10, 'f', 't', 'y', 'p', 'i', 's', 'o', 'm', 0, 0, 0, 1};
}

Bytes mp4_fragment() {
    return Bytes{0x00, 0x00, 0x00, 0x0C, 'm', 'o', 'o', 'f', 1, 2, 3, 4};
}

Bytes mp4_init_and_fragment() {
    Bytes expected = mp4_init();
    auto fragment = mp4_fragment();
    expected.insert(expected.end(), fragment.begin(), fragment.end());
    return expected;
}

Segment init_segment() {
    return Segment::initialization(*Url::parse("https://cdn.example.com/init.mp4"));
}

// The single segment a write produced
fs::path written_path(const std::vector<WriteResult>& results) {
    REQUIRE(results.size() == 1);
    REQUIRE(results[0].path.has_value());
    return *results[0].path;
}

} // namespace

TEST_CASE("sanitize_filename", "[writer]") {
    CHECK(sanitize_filename("audio_English") == "audio_English");
    CHECK(sanitize_filename("audio_Español (HD)") == "audio_Espa__ol__HD_");
    CHECK(sanitize_filename("subtitle_a/b\\c:d") == "subtitle_a_b_c_d");
    CHECK(sanitize_filename("v1.2-x") == "v1.2-x");
}

TEST_CASE("SegmentWriter::segment_filename", "[writer]") {
    auto seg = Segment::sequence(segment_url(7), std::nullopt, 1, 7);

    CHECK(SegmentWriter::segment_filename(Stream::main(), seg, MediaFormat::mpeg_ts)
          == "segment_main_d0000000001s0000000007.ts");
    CHECK(SegmentWriter::segment_filename(Stream::audio("en stereo"), seg, MediaFormat::aac)
          == "segment_audio_en_stereo_d0000000001s0000000007.aac");
}

TEST_CASE("SegmentWriter::write", "[writer]") {
    TempDir tmp;
    SegmentWriter writer(tmp.path() / "segments");
    REQUIRE_FALSE(writer.prepare());
    REQUIRE(fs::is_directory(tmp.path() / "segments"));

    SECTION("Sequence segment written verbatim") {
        auto data = ts_payload(2);
        auto path = written_path(
            writer.write(Stream::main(), Segment::sequence(segment_url(3), std::nullopt, 0, 3), data));
        CHECK(path.parent_path() == writer.directory());
        CHECK(path.extension() == ".ts");
        CHECK(read_file(path) == data);
        CHECK(writer.bytes_written() == data.size());

        const auto& entries = writer.manifest().entries(Stream::main());
        REQUIRE(entries.size() == 1);
        CHECK(entries[0].path == path);
        CHECK(entries[0].segment.format() == MediaFormat::mpeg_ts);
    }

    SECTION("Initialization bytes are prepended") {
        auto stream = Stream::video("cam");
        CHECK(writer.write(stream, init_segment(), mp4_init()).empty());
        CHECK(writer.manifest().empty());

        auto first = written_path(
            writer.write(stream, Segment::sequence(segment_url(1), std::nullopt, 0, 1), mp4_fragment(), true));
        auto second = written_path(
            writer.write(stream, Segment::sequence(segment_url(2), std::nullopt, 0, 2), mp4_fragment(), true));

        CHECK(read_file(first) == mp4_init_and_fragment());
        CHECK(read_file(second) == mp4_init_and_fragment());
        CHECK(first.extension() == ".mp4");
        CHECK(writer.manifest().entries(stream).size() == 2);
    }

    SECTION("Initialization cache is per stream") {
        CHECK(writer.write(Stream::video("a"), init_segment(), mp4_init()).empty());

        auto data = ts_payload(1);
        auto path = written_path(
            writer.write(Stream::main(), Segment::sequence(segment_url(1), std::nullopt, 0, 1), data));
        CHECK(read_file(path) == data);
    }

    SECTION("Unrecognized bytes are rejected") {
        Bytes html{'<', 'h', 't', 'm', 'l', '>'};
        auto results = writer.write(Stream::main(), Segment::sequence(segment_url(1), std::nullopt, 0, 1), html);
        REQUIRE(results.size() == 1);
        REQUIRE_FALSE(results[0].path.has_value());
        CHECK(results[0].path.error() == MediaErrc::unknown_format);
        CHECK(results[0].segment.sequence() == 1);
        CHECK(writer.manifest().empty());
        CHECK(writer.bytes_written() == 0);
    }

    SECTION("File names sort like ordering keys") {
        std::vector<std::pair<std::uint64_t, std::uint64_t>> keys;
        for (std::uint64_t d = 0; d < 3; ++d) {
            for (std::uint64_t s : {1ULL, 9ULL, 10ULL, 99ULL, 100ULL, 12345ULL}) {
                keys.emplace_back(d, s);
            }
        }
        std::mt19937 rng(1234);
        std::shuffle(keys.begin(), keys.end(), rng);

        for (auto [d, s] : keys) {
            (void)written_path(writer.write(Stream::main(), Segment::sequence(segment_url(s), std::nullopt, d, s),
                                            ts_payload(1)));
        }

        std::vector<std::string> names;
        for (const auto& entry : fs::directory_iterator(writer.directory())) {
            names.push_back(entry.path().filename().string());
        }
        std::sort(names.begin(), names.end());

        std::sort(keys.begin(), keys.end());
        REQUIRE(names.size() == keys.size());
        for (std::size_t i = 0; i < keys.size(); ++i) {
            auto seg = Segment::sequence(segment_url(keys[i].second), std::nullopt, keys[i].first, keys[i].second);
            CHECK(names[i] == SegmentWriter::segment_filename(Stream::main(), seg, MediaFormat::mpeg_ts));
        }

        SECTION("Manifest sort restores key order") {
            auto manifest = writer.take_manifest();
            manifest.sort();
            const auto& entries = manifest.entries(Stream::main());
            REQUIRE(entries.size() == keys.size());
            for (std::size_t i = 0; i < keys.size(); ++i) {
                CHECK(entries[i].segment.key() == keys[i]);
            }
        }
    }
}

TEST_CASE("SegmentWriter - initialization arriving late", "[writer]") {
    TempDir tmp;
    auto stream = Stream::video("cam");
    SegmentWriter writer(tmp.path() / "segments", {stream});
    REQUIRE_FALSE(writer.prepare());

    CHECK(writer.write(stream, Segment::sequence(segment_url(2), std::nullopt, 0, 2), mp4_fragment(), true).empty());
    CHECK(writer.write(stream, Segment::sequence(segment_url(1), std::nullopt, 0, 1), mp4_fragment(), true).empty());
    CHECK(writer.held() == 2);
    CHECK(writer.manifest().empty());

    SECTION("Held segments are written once it arrives") {
        auto released = writer.write(stream, init_segment(), mp4_init());
        REQUIRE(released.size() == 2);
        for (const auto& r : released) {
            REQUIRE(r.path.has_value());
            CHECK(read_file(*r.path) == mp4_init_and_fragment());
        }
        CHECK(writer.held() == 0);
        CHECK(writer.manifest().entries(stream).size() == 2);

        auto later = written_path(
            writer.write(stream, Segment::sequence(segment_url(3), std::nullopt, 0, 3), mp4_fragment(), true));
        CHECK(read_file(later) == mp4_init_and_fragment());
    }

    SECTION("Failed initialization releases them as they are") {
        auto released = writer.initialization_failed(stream);
        REQUIRE(released.size() == 2);
        REQUIRE(released[0].path.has_value());
        CHECK(read_file(*released[0].path) == mp4_fragment());
        CHECK(writer.held() == 0);

        // Nothing to wait for any more
        CHECK(writer.write(stream, Segment::sequence(segment_url(3), std::nullopt, 0, 3), mp4_fragment(), true)
                  .size() == 1);
    }

    SECTION("Flush writes whatever is still held") {
        auto flushed = writer.flush();
        CHECK(flushed.size() == 2);
        CHECK(writer.held() == 0);
        CHECK(writer.manifest().entries(stream).size() == 2);
    }

    SECTION("Other streams are not held") {
        auto data = ts_payload(1);
        auto path = written_path(
            writer.write(Stream::main(), Segment::sequence(segment_url(1), std::nullopt, 0, 1), data));
        CHECK(read_file(path) == data);
        CHECK(writer.held() == 2);
    }
}

TEST_CASE("FileStems", "[writer]") {
    SECTION("Distinct names are kept") {
        FileStems stems({Stream::main(), Stream::audio("English", "en")});
        CHECK(stems.stem(Stream::main()) == "main");
        CHECK(stems.stem(Stream::audio("English", "en")) == "audio_English");
    }

    SECTION("Sanitizing collisions get a suffix") {
        FileStems stems({Stream::audio("a b"), Stream::audio("a_b"), Stream::audio("a/b")});
        CHECK(stems.stem(Stream::audio("a_b")) == "audio_a_b");
        CHECK(stems.stem(Stream::audio("a b")) == "audio_a_b_2");
        CHECK(stems.stem(Stream::audio("a/b")) == "audio_a_b_3");
    }

    SECTION("Same names whatever the order given") {
        FileStems forward({Stream::audio("a b"), Stream::audio("a_b")});
        FileStems backward({Stream::audio("a_b"), Stream::audio("a b")});
        CHECK(forward.stem(Stream::audio("a b")) == backward.stem(Stream::audio("a b")));
        CHECK(forward.stem(Stream::audio("a_b")) == backward.stem(Stream::audio("a_b")));
    }

    SECTION("Unknown streams are assigned on first use") {
        FileStems stems;
        CHECK(stems.stem(Stream::subtitle("x y")) == "subtitle_x_y");
        CHECK(stems.stem(Stream::subtitle("x:y")) == "subtitle_x_y_2");
        CHECK(stems.stem(Stream::subtitle("x y")) == "subtitle_x_y");
    }
}

TEST_CASE("SegmentWriter - streams with clashing names", "[writer]") {
    TempDir tmp;
    auto spaced = Stream::audio("a b");
    auto underscored = Stream::audio("a_b");
    SegmentWriter writer(tmp.path() / "segments", {spaced, underscored});
    REQUIRE_FALSE(writer.prepare());

    auto seg = Segment::sequence(segment_url(1), std::nullopt, 0, 1);
    auto first = written_path(writer.write(spaced, seg, ts_payload(1, 0x01)));
    auto second = written_path(writer.write(underscored, seg, ts_payload(1, 0x02)));

    CHECK(first != second);
    CHECK(read_file(first) == ts_payload(1, 0x01));
    CHECK(read_file(second) == ts_payload(1, 0x02));
    CHECK(second.filename() == "segment_audio_a_b_d0000000000s0000000001.ts");
}

TEST_CASE("SegmentWriter::prepare failure", "[writer]") {
    TempDir tmp;
    auto blocker = tmp.path() / "file";
    livecap::testing::write_file(blocker, ts_payload(1));

    SegmentWriter writer(blocker / "segments");
    CHECK(writer.prepare() == DiskErrc::create_directory_failed);
}
