#include <vector>
#include "gtest/gtest.h"
#include "merkle/merkle_accumulator.hpp"
#include "test_support.hpp"

using test_support::patternBytes;

namespace
{
	constexpr std::size_t CHUNK = constants::CHUNK_SIZE;

	hashing::H256 leaf(uint64_t index, const uint8_t *data, std::size_t size)
	{
		std::vector<uint8_t> buf;
		buf.push_back(0x00);
		for (int shift = 56; shift >= 0; shift -= 8)
			buf.push_back(static_cast<uint8_t>(index >> shift));
		buf.insert(buf.end(), data, data + size);
		return hashing::sha256(buf.data(), buf.size());
	}

	// Plain forwarding sink relying on the default batched implementation.
	class ForwardingSink : public merkle::ChunkSink
	{
	public:
		void pushChunk(const uint8_t *data, std::size_t size) override
		{
			sizes.push_back(size);
			inner.pushChunk(data, size);
		}
		hashing::H256 getRoot() const override { return inner.getRoot(); }

		std::vector<std::size_t> sizes;
		merkle::Sha256MerkleAccumulator inner;
	};
}

TEST(MerkleAccumulator, empty_root_is_hash_of_empty_string)
{
	merkle::Sha256MerkleAccumulator acc;
	EXPECT_EQ(acc.chunkCount(), 0u);
	EXPECT_EQ(hashing::toHex(acc.getRoot()),
			  "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
	EXPECT_EQ(acc.getRoot(), merkle::Sha256MerkleAccumulator().getRoot());
}

TEST(MerkleAccumulator, tree_shape_for_three_leaves)
{
	auto data = patternBytes(3 * CHUNK, 1);
	merkle::Sha256MerkleAccumulator acc;
	for (int i = 0; i < 3; i++)
		acc.pushChunk(data.data() + i * CHUNK, CHUNK);

	auto l0 = leaf(0, data.data(), CHUNK);
	auto l1 = leaf(1, data.data() + CHUNK, CHUNK);
	auto l2 = leaf(2, data.data() + 2 * CHUNK, CHUNK);
	EXPECT_EQ(acc.getRoot(), merkle::hashNode(merkle::hashNode(l0, l1), l2));
	EXPECT_EQ(acc.chunkCount(), 3u);
}

TEST(MerkleAccumulator, single_leaf_root_is_the_leaf)
{
	auto data = patternBytes(17, 2);
	merkle::Sha256MerkleAccumulator acc;
	acc.pushChunk(data.data(), data.size());
	EXPECT_EQ(acc.getRoot(), leaf(0, data.data(), data.size()));
}

TEST(MerkleAccumulator, batched_equals_single_pushes)
{
	for (std::size_t size : {CHUNK, 2 * CHUNK, 7 * CHUNK, 64 * CHUNK, 100 * CHUNK + 33})
	{
		auto data = patternBytes(size, 3);

		merkle::Sha256MerkleAccumulator single;
		for (std::size_t off = 0; off < size; off += CHUNK)
			single.pushChunk(data.data() + off, std::min(CHUNK, size - off));

		merkle::Sha256MerkleAccumulator batched;
		batched.pushChunksBatched(data.data(), size);

		EXPECT_EQ(single.getRoot(), batched.getRoot()) << "size=" << size;
		EXPECT_EQ(single.chunkCount(), batched.chunkCount());
	}
}

TEST(MerkleAccumulator, default_batched_call_splits_into_chunks)
{
	auto data = patternBytes(3 * CHUNK + 10, 4);
	ForwardingSink sink;
	sink.pushChunksBatched(data.data(), data.size());

	std::vector<std::size_t> expected = {CHUNK, CHUNK, CHUNK, 10};
	EXPECT_EQ(sink.sizes, expected);

	merkle::Sha256MerkleAccumulator direct;
	direct.pushChunksBatched(data.data(), data.size());
	EXPECT_EQ(sink.getRoot(), direct.getRoot());
}

TEST(MerkleAccumulator, root_depends_on_chunk_order)
{
	auto a = patternBytes(CHUNK, 5);
	auto b = patternBytes(CHUNK, 6);

	merkle::Sha256MerkleAccumulator ab;
	ab.pushChunk(a.data(), a.size());
	ab.pushChunk(b.data(), b.size());

	merkle::Sha256MerkleAccumulator ba;
	ba.pushChunk(b.data(), b.size());
	ba.pushChunk(a.data(), a.size());

	EXPECT_NE(ab.getRoot(), ba.getRoot());
}

TEST(MerkleAccumulator, root_depends_on_chunk_boundaries)
{
	auto data = patternBytes(2 * CHUNK, 8);

	merkle::Sha256MerkleAccumulator aligned;
	aligned.pushChunksBatched(data.data(), data.size());

	merkle::Sha256MerkleAccumulator shifted;
	shifted.pushChunk(data.data(), 1000);
	shifted.pushChunk(data.data() + 1000, data.size() - 1000);

	EXPECT_NE(aligned.getRoot(), shifted.getRoot());
}

TEST(MerkleAccumulator, get_root_does_not_disturb_accumulation)
{
	auto data = patternBytes(5 * CHUNK, 9);

	merkle::Sha256MerkleAccumulator observed;
	merkle::Sha256MerkleAccumulator plain;
	for (int i = 0; i < 5; i++)
	{
		observed.pushChunk(data.data() + i * CHUNK, CHUNK);
		(void)observed.getRoot();
		plain.pushChunk(data.data() + i * CHUNK, CHUNK);
	}
	EXPECT_EQ(observed.getRoot(), plain.getRoot());
}
