#include <boost/test/unit_test.hpp>
#include <stdexcept>
#include "crypto/keccak.hpp"
#include "wallet/nonce_tracker.hpp"
#include "wallet/request_authenticator.hpp"
#include "wallet/signer.hpp"
#include "test_fixtures.hpp"

namespace {
  const std::string kKeyOne = "0x0000000000000000000000000000000000000000000000000000000000000001";
  const std::string kKeyOneAddress = "0x7e5f4552091a69125d5dfcb7b8c2659029395bdf";
  const std::string kKeyTwo = "0x0000000000000000000000000000000000000000000000000000000000000002";
}

BOOST_AUTO_TEST_SUITE(wallet_tests)

BOOST_AUTO_TEST_CASE(keccak_of_empty_input)
{
  BOOST_CHECK_EQUAL(Crypto::Keccak256Raw(""), "0xc5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470");
}

BOOST_AUTO_TEST_CASE(address_from_private_key)
{
  Signer signer(kKeyOne);
  BOOST_CHECK_EQUAL(signer.GetAddress(), kKeyOneAddress);
  BOOST_CHECK_THROW(Signer("0x1234"), std::invalid_argument);
  BOOST_CHECK_THROW(Signer(""), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(signature_recovers_the_signer)
{
  Signer signer(kKeyOne);
  const std::string sig = signer.SignMessage("mint 1 WBTC");
  BOOST_CHECK_EQUAL(sig.size(), 2u + 130u);
  BOOST_CHECK_EQUAL(Signer::RecoverAddress("mint 1 WBTC", sig), kKeyOneAddress);
  BOOST_CHECK_NE(Signer::RecoverAddress("mint 2 WBTC", sig), kKeyOneAddress);
  BOOST_CHECK_THROW(Signer::RecoverAddress("mint 1 WBTC", "0xdead"), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(signed_requests_are_verified_against_caller)
{
  Signer alice(kKeyOne);
  Signer mallory(kKeyTwo);
  const nlohmann::json request = {{"op", "mint"}, {"caller", alice.GetAddress()}, {"amount", "1"}};

  const nlohmann::json signed_request = RequestAuth::Sign(request, alice);
  BOOST_CHECK(signed_request.contains("signature"));
  BOOST_CHECK_EQUAL(RequestAuth::CanonicalPayload(signed_request), RequestAuth::CanonicalPayload(request));
  BOOST_CHECK_NO_THROW(RequestAuth::Verify(signed_request, alice.GetAddress(), true));

  nlohmann::json tampered = signed_request;
  tampered["amount"] = "100";
  BITRES_CHECK_CODE(RequestAuth::Verify(tampered, alice.GetAddress(), true), ErrorCode::Unauthorized);

  const nlohmann::json forged = RequestAuth::Sign(request, mallory);
  BITRES_CHECK_CODE(RequestAuth::Verify(forged, alice.GetAddress(), false), ErrorCode::Unauthorized);

  nlohmann::json garbage = request;
  garbage["signature"] = "0x00";
  BITRES_CHECK_CODE(RequestAuth::Verify(garbage, alice.GetAddress(), false), ErrorCode::Unauthorized);

  BITRES_CHECK_CODE(RequestAuth::Verify(request, alice.GetAddress(), true), ErrorCode::Unauthorized);
  BOOST_CHECK_NO_THROW(RequestAuth::Verify(request, alice.GetAddress(), false));
}

BOOST_AUTO_TEST_CASE(nonces_advance_per_caller)
{
  NonceTracker nonces;
  BOOST_CHECK_EQUAL(nonces.Expected(kKeyOneAddress), 0u);
  nonces.Consume(kKeyOneAddress, 0);
  BITRES_CHECK_CODE(nonces.Consume(kKeyOneAddress, 0), ErrorCode::Unauthorized);
  BITRES_CHECK_CODE(nonces.Consume(kKeyOneAddress, 2), ErrorCode::Unauthorized);
  nonces.Consume(kKeyOneAddress, 1);
  BOOST_CHECK_EQUAL(nonces.Expected(kKeyOneAddress), 2u);
  // callers have independent sequences; addresses compare case-insensitively
  BOOST_CHECK_EQUAL(nonces.Expected(TestAccounts::kBob), 0u);
  BOOST_CHECK_EQUAL(nonces.Expected("0x7E5F4552091A69125D5DFCB7B8C2659029395BDF"), 2u);

  BOOST_CHECK_EQUAL(RequestAuth::Nonce({{"op", "mint"}, {"nonce", 7}}), 7u);
  BOOST_CHECK_EQUAL(RequestAuth::Nonce(nlohmann::json::parse(R"({"nonce":8})")), 8u);
  BITRES_CHECK_CODE(RequestAuth::Nonce({{"op", "mint"}}), ErrorCode::Unauthorized);
  BITRES_CHECK_CODE(RequestAuth::Nonce({{"nonce", -1}}), ErrorCode::Unauthorized);
  BITRES_CHECK_CODE(RequestAuth::Nonce({{"nonce", "1"}}), ErrorCode::Unauthorized);
}

BOOST_AUTO_TEST_SUITE_END()
