#include "finval/core/sha256.h"

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace finval::core;

TEST_CASE("sha256_hex: FIPS 180-4 reference vectors", "[sha256]") {
  CHECK(sha256_hex("") == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  CHECK(sha256_hex("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  CHECK(sha256_hex("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq") ==
        "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

TEST_CASE("Sha256: incremental updates match a single update", "[sha256]") {
  const std::string message(1000, 'a');

  Sha256 chunked;
  for (std::size_t offset = 0; offset < message.size(); offset += 37) {
    chunked.update(std::string_view(message).substr(offset, 37));
  }
  CHECK(to_hex(chunked.finish()) == sha256_hex(message));
}

TEST_CASE("Sha256: reset allows reuse", "[sha256]") {
  Sha256 hasher;
  hasher.update("first message");
  static_cast<void>(hasher.finish());

  hasher.reset();
  hasher.update("abc");
  CHECK(to_hex(hasher.finish()) ==
        "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("Sha256: message lengths around the block boundary", "[sha256]") {
  // 55 bytes fits the length in one block; 56 forces a second.
  CHECK(sha256_hex(std::string(55, 'a')).size() == 64);
  CHECK(sha256_hex(std::string(55, 'a')) != sha256_hex(std::string(56, 'a')));
  CHECK(sha256_hex(std::string(64, 'a')) ==
        "ffe054fe7ae0cb6dc65c3af9b61d5209f439851db43d0ba5997337df154668eb");
}

TEST_CASE("to_hex renders lower-case pairs", "[sha256]") {
  Sha256Digest digest{};
  digest[0] = 0xAB;
  digest[31] = 0x0F;
  const auto hex = to_hex(digest);
  REQUIRE(hex.size() == 64);
  CHECK(hex.substr(0, 2) == "ab");
  CHECK(hex.substr(62, 2) == "0f");
}
