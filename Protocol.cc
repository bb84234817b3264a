#include "Protocol.h"

#include <cmath>

#include "ProverAgent.h"
#include "VerifierAgent.h"

double soundness_bits(int rounds) {
  return rounds*std::log2(28.0/27.0);
}

bool run_protocol(ProverAgent& prover, VerifierAgent& verifier) {
  std::string commitment, request, reveal;

  for(int i=0; i<verifier.security_param(); i++) {
    prover.write_commitment_packet(commitment);

    if(!verifier.read_commitment(commitment, request)) {
      log("Round %d: commitment rejected\n", i);
      return false;
    }

    prover.write_reveal(reveal, request);

    if(!verifier.read_reveal(reveal)) {
      log("Round %d: reveal did not verify\n", i);
      return false;
    }
  }
  return verifier.proven();
}
