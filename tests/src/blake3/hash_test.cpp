#include <gtest/gtest.h>
#include <tessera/blake3/hash.hpp>

#include <string_view>

TEST(blake3, matches_reference_vectors) {
  EXPECT_EQ(tessera::schema::to_hex(tessera::blake3::hash(std::string_view{})),
            "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262");
  EXPECT_EQ(
      tessera::schema::to_hex(tessera::blake3::hash(std::string_view{"abc"})),
      "6437b3ac38465133ffb63b75273a8db548c558465d79db03fd359c6cd5bd9d85");
}

TEST(blake3, incremental_updates_match_one_shot) {
  auto whole = tessera::blake3::hash(std::string_view{"tessera.delegate.v1"});
  auto pieces = tessera::blake3::hasher{}
                    .update(std::string_view{"tessera."})
                    .update(std::string_view{"delegate.v1"})
                    .finalize();
  EXPECT_EQ(whole, pieces);

  auto bytes = tessera::schema::make_bytes(std::string_view{"abc"});
  EXPECT_EQ(tessera::blake3::hash(tessera::schema::make_bytes_view(bytes)),
            tessera::blake3::hash(std::string_view{"abc"}));
}

TEST(blake3, field_order_changes_the_digest) {
  auto a = tessera::schema::hash32_t{};
  a.fill(0x01);
  auto b = tessera::schema::hash32_t{};
  b.fill(0x02);
  EXPECT_NE(tessera::blake3::hasher{}.update(a).update(b).finalize(),
            tessera::blake3::hasher{}.update(b).update(a).finalize());
}
