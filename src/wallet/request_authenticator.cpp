#include "wallet/request_authenticator.hpp"
#include "common/errors.hpp"
#include "wallet/signer.hpp"
#include <stdexcept>

namespace RequestAuth {
  std::string CanonicalPayload(const nlohmann::json& request) {
    nlohmann::json copy = request;
    if (copy.is_object()) copy.erase("signature");
    return copy.dump();
  }

  nlohmann::json Sign(const nlohmann::json& request, const Signer& signer) {
    nlohmann::json signed_request = request;
    signed_request["signature"] = signer.SignMessage(CanonicalPayload(request));
    return signed_request;
  }

  void Verify(const nlohmann::json& request, const Address& expected_caller, bool required) {
    auto it = request.find("signature");
    if (it == request.end()) {
      if (required) throw LedgerError(ErrorCode::Unauthorized, "request from " + expected_caller + " is not signed");
      return;
    }
    if (!it->is_string()) throw LedgerError(ErrorCode::Unauthorized, "signature must be a hex string");
    Address signer;
    try {
      signer = Signer::RecoverAddress(CanonicalPayload(request), it->get<std::string>());
    } catch (const std::exception& e) {
      throw LedgerError(ErrorCode::Unauthorized, std::string("bad request signature: ") + e.what());
    }
    if (signer != NormalizeAddress(expected_caller)) {
      throw LedgerError(ErrorCode::Unauthorized, "request for " + expected_caller + " was signed by " + signer);
    }
  }

  uint64_t Nonce(const nlohmann::json& request) {
    auto it = request.find("nonce");
    if (it != request.end()) {
      if (it->is_number_unsigned()) return it->get<uint64_t>();
      // built in code rather than parsed, small values are signed
      if (it->is_number_integer() && it->get<int64_t>() >= 0) return static_cast<uint64_t>(it->get<int64_t>());
    }
    throw LedgerError(ErrorCode::Unauthorized, "signed request needs an unsigned \"nonce\"");
  }
}
