#include <catch2/catch.hpp>
#include "crypto/keccak.hpp"
#include "encoding/abi.hpp"
#include "encoding/rlp.hpp"
#include "constants/ledger_abi.hpp"
#include "common/errors.hpp"
#include "utils/hex.hpp"
#include <stdexcept>

TEST_CASE("Keccak selectors and topics", "[encoding]") {
  REQUIRE(Crypto::Keccak256Raw("") == "0xc5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470");
  REQUIRE(Crypto::FunctionSelector("transfer(address,uint256)") == "0xa9059cbb");
  REQUIRE(Crypto::EventTopic("Transfer(address,address,uint256)") ==
          "0xddf252ad1be2c89b69c2b068fc378daa952ba7f163c4a11628f55a4df523b3ef");
}

TEST_CASE("ABI words", "[encoding]") {
  const std::string addr = "0x00000000000000000000000000000000000000Ab";
  auto word = Abi::EncodeAddress(addr);
  REQUIRE(word.size() == 64);
  REQUIRE(Abi::DecodeAddress(word) == "0x00000000000000000000000000000000000000ab");

  REQUIRE(Abi::EncodeUint(255) == std::string(62, '0') + "ff");
  REQUIRE(Abi::DecodeUint64(Abi::EncodeUint(123456789ULL)) == 123456789ULL);
  REQUIRE(Abi::DecodeUnits(Abi::EncodeUnits(1.5L)) == Approx(1.5));
  REQUIRE(Abi::DecodeUintDecimal("0x" + std::string(63, '0') + "a") == "10");
  REQUIRE_THROWS_AS(Abi::EncodeUnits(-1.0L), std::invalid_argument);

  auto call = Abi::BuildCall(Crypto::FunctionSelector(LedgerAbi::BORROWS), {word});
  REQUIRE(call.size() == 2 + 8 + 64);
  REQUIRE(Abi::WordCount("0x" + word + word) == 2);
  REQUIRE_THROWS_AS(Abi::Word("0x1234", 0), GatewayError);
}

TEST_CASE("RLP encoding", "[encoding]") {
  REQUIRE(BytesToHex0x(RLP::EncodeHex("0x646f67")) == "0x83646f67");
  REQUIRE(BytesToHex0x(RLP::EncodeUint(0)) == "0x80");
  REQUIRE(BytesToHex0x(RLP::EncodeUint(1024)) == "0x820400");
  REQUIRE(BytesToHex0x(RLP::EncodeList({})) == "0xc0");
}

TEST_CASE("Hex quantities", "[encoding]") {
  REQUIRE(ToHex0x(0) == "0x0");
  REQUIRE(ToHex0x(26) == "0x1a");
  REQUIRE(ParseHexU64("0x1a") == 26);
  REQUIRE(ParseHexU64("") == 0);
  REQUIRE_THROWS_AS(ParseHexU64("0xzz"), std::invalid_argument);
  REQUIRE_THROWS_AS(NormalizeAddress("0x1234"), std::invalid_argument);
}
