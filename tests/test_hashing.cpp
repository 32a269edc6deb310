#include <string>
#include "gtest/gtest.h"
#include "hashing/hashing.hpp"

namespace
{
	const uint8_t *bytes(const std::string &s)
	{
		return reinterpret_cast<const uint8_t *>(s.data());
	}
}

TEST(Hashing, sha256_known_vectors)
{
	EXPECT_EQ(hashing::toHex(hashing::sha256(nullptr, 0)),
			  "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");

	std::string abc = "abc";
	EXPECT_EQ(hashing::toHex(hashing::sha256(bytes(abc), abc.size())),
			  "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(Hashing, incremental_matches_one_shot)
{
	std::string msg = "abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq";
	hashing::Sha256Context ctx;
	ctx.update(bytes(msg), 10);
	ctx.update(bytes(msg) + 10, msg.size() - 10);
	auto incremental = ctx.finish();

	EXPECT_EQ(incremental, hashing::sha256(bytes(msg), msg.size()));
	EXPECT_EQ(hashing::toHex(incremental),
			  "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");

	ctx.reset();
	ctx.update(bytes(msg), msg.size());
	EXPECT_EQ(ctx.finish(), incremental);
}

TEST(Hashing, sha256_hasher)
{
	hashing::Sha256Hasher hasher;
	std::string abc = "abc";
	EXPECT_EQ(hasher.hash(bytes(abc), abc.size()), hashing::sha256(bytes(abc), abc.size()));
}

TEST(Hashing, hex_round_trip_and_prefix)
{
	std::vector<uint8_t> expected = {0x00, 0x1f, 0xab, 0xff};
	EXPECT_EQ(hashing::toHex(expected.data(), expected.size()), "001fabff");
	EXPECT_EQ(hashing::fromHex("001fabff"), expected);
	EXPECT_EQ(hashing::fromHex("0x001FABFF"), expected);
	EXPECT_TRUE(hashing::fromHex("0x").empty());
}

TEST(Hashing, hex_rejects_malformed_input)
{
	EXPECT_THROW(hashing::fromHex("abc"), std::invalid_argument);
	EXPECT_THROW(hashing::fromHex("zz"), std::invalid_argument);
}
