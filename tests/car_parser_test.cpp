/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include <gtest/gtest.h>

#include "car/car_json.h"
#include "car_parser.h"
#include "test_fixtures.h"

#include <filesystem>
#include <fstream>

using namespace atp::car;
using namespace atp::car::testing;

namespace {
const Bytes kPost = cbor_map(
    {{"text", cbor_text("hi")}, {"$type", cbor_text("app.bsky.feed.post")}, {"langs", cbor_array({cbor_text("en")})}}
);
const Bytes kLike = cbor_map({{"$type", cbor_text("app.bsky.feed.like")}, {"n", head(1, 4)}});
const Bytes kProfile = cbor_map({{"$type", cbor_text("App.Bsky.Actor.Profile")}, {"avatar", cbor_bytes({0xFF, 0x00})}});

Bytes sample_repo() {
    const Bytes mst = cbor_map(
        {{"e",
          cbor_array(
              {mst_entry(0, "App.Bsky.Actor.Profile/self", block_cid(kProfile)),
               mst_entry(0, "app.bsky.actor.profile/self", block_cid(kProfile)),
               mst_entry(9, "feed.like/1", block_cid(kLike)),
               mst_entry(14, "post/1", block_cid(kPost))}
          )},
         {"l", cbor_null()}}
    );
    const Bytes commit = cbor_map(
        {{"did", cbor_text("did:plc:abc")},
         {"rev", cbor_text("3k2a")},
         {"data", cbor_link(block_cid(mst))},
         {"prev", cbor_null()},
         {"version", cbor_uint(3)}}
    );
    return make_car({commit, mst, kPost, kLike, kProfile});
}
}  // namespace

TEST(CarParserTest, DecodesRepositoryArchive) {
    ParserDecodeOptions opt{};
    opt.collect_blocks = true;
    const DecodeResult res = CarParser::DecodeCarBytes(sample_repo(), opt, "sample");

    ASSERT_TRUE(res.commit.has_value());
    EXPECT_EQ(res.commit->did, "did:plc:abc");
    ASSERT_EQ(res.records.size(), 4u);

    const auto& post = res.records_json.at("app.bsky.feed.post/1");
    EXPECT_EQ(post.at("cid").get<std::string>(), block_cid_text(kPost));
    EXPECT_EQ(post.at("value").at("text").get<std::string>(), "hi");
    EXPECT_EQ(post.at("value").at("langs").at(0).get<std::string>(), "en");
    EXPECT_EQ(res.records_json.at("app.bsky.feed.like/1").at("value").at("n").get<std::int64_t>(), -5);
    EXPECT_EQ(
        res.records_json.at("app.bsky.actor.profile/self").at("value").at("avatar").at("$bytes").get<std::string>(),
        "/wA"
    );

    EXPECT_EQ(res.metadata.at("root").get<std::string>(), res.car.root);
    EXPECT_EQ(res.metadata.at("blockCount").get<std::size_t>(), 5u);
    EXPECT_EQ(res.metadata.at("recordCount").get<std::size_t>(), 4u);
    EXPECT_EQ(res.metadata.at("commit").at("data").get<std::string>(), res.commit->data);
    EXPECT_TRUE(res.metadata.at("commit").at("prev").is_null());

    // "App.Bsky.Actor.Profile" and "app.bsky.actor.profile" collapse to the later spelling.
    const auto collections = res.metadata.at("collections").get<std::vector<std::string>>();
    ASSERT_EQ(collections.size(), 3u);
    EXPECT_EQ(collections[0], "app.bsky.actor.profile");
    EXPECT_EQ(collections[1], "app.bsky.feed.like");
    EXPECT_EQ(collections[2], "app.bsky.feed.post");

    EXPECT_EQ(
        res.blocks_json.at(res.commit->data).at("e").at(0).at("v").at("$link").get<std::string>(),
        block_cid_text(kProfile)
    );
}

TEST(CarParserTest, MinimalOutputMapsKeysToCids) {
    ParserDecodeOptions opt{};
    opt.with_values = false;
    const DecodeResult res = CarParser::DecodeCarBytes(sample_repo(), opt);
    EXPECT_EQ(res.records_json.at("app.bsky.feed.post/1").get<std::string>(), block_cid_text(kPost));
    EXPECT_TRUE(res.blocks_json.empty());
}

TEST(CarParserTest, BareMstRoot) {
    const Bytes mst = cbor_map({{"e", cbor_array({mst_entry(0, "bob", block_cid(kPost))})}, {"l", cbor_null()}});
    const DecodeResult res = CarParser::DecodeCarBytes(make_car({mst, kPost}));
    EXPECT_FALSE(res.commit.has_value());
    EXPECT_EQ(res.records_json.at("bob").at("cid").get<std::string>(), block_cid_text(kPost));
}

TEST(CarParserTest, MissingRootBlockFails) {
    const Bytes car = car_header(block_cid(kPost));
    EXPECT_THROW(CarParser::DecodeCarBytes(car), CarError);
}

TEST(CarParserTest, DecodesFromDisk) {
    const auto path = std::filesystem::temp_directory_path() / "car_parser_test_repo.car";
    {
        const Bytes bytes = sample_repo();
        std::ofstream f(path, std::ios::binary);
        ASSERT_TRUE(f.is_open());
        f.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    }
    const DecodeResult res = CarParser::DecodeCarFile(path);
    EXPECT_EQ(res.records.size(), 4u);
    std::filesystem::remove(path);
}

TEST(CarJsonTest, RecordKeysFallBackToHex) {
    EXPECT_EQ(record_key_to_string(to_bytes("app.bsky.feed.post/1")), "app.bsky.feed.post/1");
    EXPECT_EQ(record_key_to_string(Bytes{0x61, 0x00, 0xFF}), "0x6100ff");
}

TEST(CarJsonTest, IllFormedUtf8KeysFallBackToHex) {
    // UTF-16 surrogate and overlong encodings of U+0000.
    const Bytes surrogate = cat({to_bytes("a/"), Bytes{0xED, 0xA0, 0x80}});
    const Bytes overlong3 = cat({to_bytes("b/"), Bytes{0xE0, 0x80, 0x80}});
    const Bytes overlong4 = Bytes{0xF0, 0x80, 0x80, 0x80};
    EXPECT_EQ(record_key_to_string(surrogate), "0x612feda080");
    EXPECT_EQ(record_key_to_string(overlong3), "0x622fe08080");
    EXPECT_EQ(record_key_to_string(overlong4), "0xf0808080");
    EXPECT_EQ(record_key_to_string(to_bytes("app/\xC3\xA9")), "app/\xC3\xA9");

    RecordSet records;
    records[surrogate] = block_cid_text(kPost);
    records[overlong3] = block_cid_text(kLike);
    const auto j = records_to_json(records, {}, true);
    EXPECT_EQ(j.size(), 2u);
    EXPECT_NO_THROW(j.dump());
}

TEST(CarJsonTest, HexLookingTextKeysStayDistinct) {
    EXPECT_EQ(record_key_to_string(to_bytes("0xff")), "0x30786666");
    EXPECT_EQ(record_key_to_string(to_bytes("0x")), "0x3078");
    EXPECT_EQ(record_key_to_string(to_bytes("0xfeed/post")), "0xfeed/post");
    EXPECT_EQ(record_key_to_string(Bytes{0xFF}), "0xff");

    RecordSet records;
    records[Bytes{0xFF}] = block_cid_text(kPost);
    records[to_bytes("0xff")] = block_cid_text(kLike);
    const auto j = records_to_json(records, {}, false);
    ASSERT_EQ(j.size(), 2u);
    EXPECT_EQ(j.at("0xff"), block_cid_text(kPost));
    EXPECT_EQ(j.at("0x30786666"), block_cid_text(kLike));
}

TEST(CarJsonTest, Base64Unpadded) {
    EXPECT_EQ(base64_unpadded(Bytes{0x00, 0x01, 0x02, 0xFF}), "AAEC/w");
    EXPECT_EQ(base64_unpadded(to_bytes("foobar")), "Zm9vYmFy");
}
