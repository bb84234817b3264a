#include "VerifierAgent.h"
#include "Verifier.h"
#include "Puzzle.h"
#include "Protocol.h"

#include <stdexcept>
#include <cryptopp/sha.h>
#include <kernel/yosys.h>

USING_YOSYS_NAMESPACE;

static bool is_digest(const std::string& h) {
  return h.size()==CryptoPP::SHA256::DIGESTSIZE;
}

VerifierAgent::VerifierAgent() {
  state.set_security_param(DEFAULT_SECURITY_PARAM);
  state.set_confidence(0);
}

void VerifierAgent::set_security_param(int p) {
  if(p<=0) {
    throw std::runtime_error(stringf("Security parameter must be positive, got %d\n", p));
  }
  state.set_security_param(p);
}

bool VerifierAgent::read_commitment(const std::string& commitment, std::string& request) {

  if(state.has_request()) {
    throw std::runtime_error("Attempted to read commitment without completing existing round\n");
  }
  state.clear_commitment();

  sudokuZKP::Commitment* comm=state.mutable_commitment();
  if(!comm->ParseFromString(commitment)) {
    log_warning("Could not parse commitment packet\n");
    return false;
  }
  if(comm->grid_hashes_size()!=GRID_CELLS || !is_digest(comm->mapping_hash())) {
    log_warning("Commitment packet does not cover the grid and the mapping\n");
    return false;
  }
  for(const std::string& h:comm->grid_hashes()) {
    if(!is_digest(h)) {
      log_warning("Commitment packet holds a malformed cell hash\n");
      return false;
    }
  }

  *state.mutable_request()=catalogue.next_challenge(rng);
  if(!state.request().SerializeToString(&request)) {
    throw std::runtime_error("Could not serialize reveal request\n");
  }
  return true;
}

bool VerifierAgent::read_reveal(const std::string& reveal) {
  if(!state.has_request()) {
    throw std::runtime_error("Attempted to read reveal before issuing a request\n");
  }
  sudokuZKP::Request request=state.request();
  state.clear_request();

  sudokuZKP::Response rev;
  if(!rev.ParseFromString(reveal)) {
    log_warning("Could not parse reveal\n");
    return false;
  }

  if(!verify(request, rev, state.commitment())) {
    return false;
  }
  state.set_confidence(state.confidence()+1);
  return true;
}

bool VerifierAgent::proven() const {
  return state.confidence()>=state.security_param();
}
