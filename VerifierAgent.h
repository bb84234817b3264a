#ifndef VERIFIER_AGENT_H
#define VERIFIER_AGENT_H
#include <cryptopp/osrng.h>

#include "messages.pb.h"

#include "ChallengeCatalogue.h"

class VerifierAgent {

 public:
  VerifierAgent();

  void set_security_param(int p);
  int security_param() const { return state.security_param(); }
  int confidence() const { return state.confidence(); }

  bool read_commitment(const std::string& commitment, std::string& request);
  bool read_reveal(const std::string& reveal);

  bool proven() const;
 private:
  ChallengeCatalogue catalogue;

  CryptoPP::AutoSeededRandomPool rng;

  sudokuZKP::VerifierState state;
};

#endif
