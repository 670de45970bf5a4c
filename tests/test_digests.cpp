// cppcheck-suppress-file missingIncludeSystem
#include <gtest/gtest.h>
#include <xxhash.h>

#include <algorithm>
#include <string>

#include "rules_digest.hpp"
#include "sha256.hpp"
#include "test_support.hpp"

namespace binauthz {
namespace {

TEST(Sha256Test, KnownVectors)
{
    EXPECT_EQ(Sha256::hash_hex(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(Sha256::hash_hex("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(Sha256::hash_hex("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq"),
              "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

TEST(Sha256Test, StreamingMatchesOneShot)
{
    const std::string data(1000000, 'a');
    Sha256 hasher;
    for (size_t offset = 0; offset < data.size(); offset += 777) {
        hasher.update(data.data() + offset, std::min<size_t>(777, data.size() - offset));
    }
    const std::string streamed = hasher.finish_hex();
    EXPECT_EQ(streamed, "cdc76e5c9914fb9281a1c7e284d73e67f1809a48a497200e046d39ccc7112cd0");
    EXPECT_EQ(streamed, Sha256::hash_hex(data));
}

TEST(Sha256Test, HashesFiles)
{
    test::TempDir dir("binauthz_sha256");
    const std::string path = dir.write("payload", "abc");

    std::string hex;
    ASSERT_TRUE(sha256_file_hex(path, hex));
    EXPECT_EQ(hex, "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_FALSE(sha256_file_hex(dir.file("absent"), hex));
}

TEST(RulesDigestTest, EmptyInputMatchesXxh3)
{
    RulesDigestBuilder empty;
    auto hex = empty.hex();
    ASSERT_TRUE(hex) << hex.error().to_string();
    EXPECT_EQ(*hex, "2d06800538d394c2");
    EXPECT_EQ(empty.rules(), 0u);
}

TEST(RulesDigestTest, StreamingMatchesOneShot)
{
    const std::string data = std::string(test::kBinarySha256) + "euid == 0" + std::string(300, 'r');

    RulesDigestBuilder streamed;
    for (size_t offset = 0; offset < data.size(); offset += 17) {
        streamed.update(data.data() + offset, std::min<size_t>(17, data.size() - offset));
    }
    auto value = streamed.value();
    ASSERT_TRUE(value) << value.error().to_string();
    EXPECT_EQ(*value, static_cast<uint64_t>(XXH3_64bits(data.data(), data.size())));
}

TEST(RulesDigestTest, IntegersAreLittleEndian)
{
    RulesDigestBuilder via_int;
    via_int.update_i32(0x01020304);

    RulesDigestBuilder via_bytes;
    const unsigned char bytes[4] = {0x04, 0x03, 0x02, 0x01};
    via_bytes.update(bytes, sizeof(bytes));

    auto a = via_int.value();
    auto b = via_bytes.value();
    ASSERT_TRUE(a);
    ASSERT_TRUE(b);
    EXPECT_EQ(*a, *b);
}

TEST(RulesDigestTest, RuleFieldsAreFedInOrder)
{
    RulesDigestBuilder builder;
    builder.add_rule(test::kBinarySha256, "", RuleState::Block, RuleType::Binary);
    EXPECT_EQ(builder.rules(), 1u);

    RulesDigestBuilder manual;
    manual.update(std::string(test::kBinarySha256));
    manual.update_i32(2);
    manual.update_i32(1000);

    auto built = builder.hex();
    auto expected = manual.hex();
    ASSERT_TRUE(built);
    ASSERT_TRUE(expected);
    EXPECT_EQ(*built, *expected);

    RulesDigestBuilder other_state;
    other_state.add_rule(test::kBinarySha256, "", RuleState::Allow, RuleType::Binary);
    auto other = other_state.hex();
    ASSERT_TRUE(other);
    EXPECT_NE(*built, *other);
}

} // namespace
} // namespace binauthz
