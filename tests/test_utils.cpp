#include "photo_finish/core/events.hpp"
#include "photo_finish/core/utils.hpp"
#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <sstream>

using namespace photo_finish;

TEST_CASE("glob_match_supports_alternatives") {
    REQUIRE(core::glob_match("*.png", "shoe.png"));
    REQUIRE(core::glob_match("*.png", "SHOE.PNG"));
    REQUIRE_FALSE(core::glob_match("*.png", "shoe.jpg"));
    REQUIRE(core::glob_match("*.png;*.jpg", "shoe.jpg"));
    REQUIRE(core::glob_match("img_??.tif", "img_01.tif"));
    REQUIRE_FALSE(core::glob_match("img_??.tif", "img_001.tif"));
}

TEST_CASE("glob_match_treats_regex_metacharacters_literally") {
    REQUIRE(core::glob_match("a+(1)*.png", "a+(1) front.png"));
    REQUIRE_FALSE(core::glob_match("a+(1)*.png", "aa1.png"));
    REQUIRE(core::glob_match("[x]{2}^$|\\.png", "[x]{2}^$|\\.png"));
    REQUIRE_FALSE(core::glob_match("shoe.png", "shoexpng"));

    auto dir = photo_finish::testing::make_temp_dir("discover_meta");
    core::write_text(dir / "a+(1).png", "");
    REQUIRE(core::discover_files(dir, "a+(1)*.png").size() == 1);
}

TEST_CASE("to_lower_keeps_non_ascii_bytes") {
    const std::string in = "IMG_\xC3\x89T\xE9.PNG";
    const std::string out = core::to_lower(in);
    REQUIRE(out.size() == in.size());
    REQUIRE(out.substr(0, 4) == "img_");
    REQUIRE(out.substr(out.size() - 4) == ".png");
    REQUIRE(out[4] == in[4]);
    REQUIRE(out[5] == in[5]);
}

TEST_CASE("sha256_of_known_input") {
    const std::string abc = "abc";
    std::vector<uint8_t> data(abc.begin(), abc.end());
    REQUIRE(core::sha256_bytes(data) ==
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("discover_files_is_sorted_and_filtered") {
    auto dir = photo_finish::testing::make_temp_dir("discover");
    core::write_text(dir / "b.png", "");
    core::write_text(dir / "a.png", "");
    core::write_text(dir / "c.txt", "");
    auto files = core::discover_files(dir, "*.png");
    REQUIRE(files.size() == 2);
    REQUIRE(files[0].filename() == "a.png");
    REQUIRE(files[1].filename() == "b.png");
    REQUIRE(core::discover_files(dir / "missing", "*.png").empty());
}

TEST_CASE("event_emitter_writes_one_json_object_per_line") {
    core::EventEmitter emitter;
    std::ostringstream out;
    emitter.run_start("run-1", {{"image_id", "sku"}}, out);
    emitter.phase_start("run-1", Phase::CENTER, out);
    emitter.warning("run-1", "tone_fallback", "timeout", out);

    std::istringstream in(out.str());
    std::string line;
    std::vector<nlohmann::json> events;
    while (std::getline(in, line)) {
        events.push_back(nlohmann::json::parse(line));
    }
    REQUIRE(events.size() == 3);
    REQUIRE(events[0]["type"] == "run_start");
    REQUIRE(events[0]["image_id"] == "sku");
    REQUIRE(events[1]["phase"] == 4);
    REQUIRE(events[1]["phase_name"] == "CENTER");
    REQUIRE(events[2]["code"] == "tone_fallback");
    REQUIRE(events[2].contains("ts"));
}
