#include "core/predicates.hpp"
#include "hash_sha256.h"
#include "fixtures.hpp"

#include <gtest/gtest.h>

using namespace arsk;
using namespace arsk::test;

namespace {

Verdict eval(const std::string& spec, const Bytes& data) {
  Predicate p;
  std::string err;
  EXPECT_TRUE(parsePredicateSpec(spec, p, err)) << err;
  EXPECT_EQ(p.key, spec);
  return p.fn ? p.fn(data) : Verdict{};
}

} // namespace

TEST(Predicates, Contains) {
  EXPECT_TRUE(eval("contains:needle", toBytes("hay needle hay")).hit);
  EXPECT_EQ(eval("contains:needle", toBytes("hay needle hay")).value, "offset=4");
  EXPECT_FALSE(eval("contains:Needle", toBytes("hay needle hay")).hit);
  EXPECT_TRUE(eval("icontains:Needle", toBytes("hay NEEDLE hay")).hit);
}

TEST(Predicates, Magic) {
  EXPECT_TRUE(eval("magic:4d5a", toBytes("MZ\x90")).hit);
  EXPECT_FALSE(eval("magic:4d5a", toBytes("ZM")).hit);
  EXPECT_FALSE(eval("magic:4d5a90", toBytes("MZ")).hit);
}

TEST(Predicates, Entropy) {
  Bytes uniform(256);
  for (size_t i = 0; i < uniform.size(); ++i) uniform[i] = static_cast<uint8_t>(i);
  Verdict v = eval("entropy>=7.5", uniform);
  EXPECT_TRUE(v.hit);
  EXPECT_EQ(v.value, "8.000");
  EXPECT_FALSE(eval("entropy>=1", Bytes(64, 'a')).hit);
}

TEST(Predicates, Sha256AndMinSize) {
  Bytes data = toBytes("abc");
  std::string digest = sha256_bytes(data);
  EXPECT_EQ(digest, "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  EXPECT_TRUE(eval("sha256:" + digest, data).hit);
  EXPECT_FALSE(eval("sha256:" + digest, toBytes("abd")).hit);

  EXPECT_TRUE(eval("minsize:3", data).hit);
  EXPECT_FALSE(eval("minsize:4", data).hit);
}

TEST(Predicates, RejectsMalformedSpecs) {
  Predicate p;
  std::string err;
  EXPECT_FALSE(parsePredicateSpec("contains:", p, err));
  EXPECT_FALSE(parsePredicateSpec("magic:abc", p, err));
  EXPECT_FALSE(parsePredicateSpec("magic:zz", p, err));
  EXPECT_FALSE(parsePredicateSpec("sha256:abcd", p, err));
  EXPECT_FALSE(parsePredicateSpec("entropy>=nine", p, err));
  EXPECT_FALSE(parsePredicateSpec("entropy>=9", p, err));
  EXPECT_FALSE(parsePredicateSpec("minsize:12kb", p, err));
  EXPECT_FALSE(parsePredicateSpec("regex:.*", p, err));
  EXPECT_NE(err.find("unknown"), std::string::npos);
}
