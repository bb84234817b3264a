#ifndef COMMITMENT_H
#define COMMITMENT_H

#include <cryptopp/cryptlib.h>
#include "messages.pb.h"

#define NONCE_SIZE 16

std::string Nonce_generate(CryptoPP::RandomNumberGenerator& rand);

std::string Cell_get_commitment(uint32_t value, const std::string& nonce);
std::string Mapping_get_commitment(const google::protobuf::RepeatedField<uint32_t>& mapping, const std::string& nonce);

/*
 * Commits to every cell of the permuted grid and to the mapping, each with a
 * fresh nonce. The nonces are written to `nonces` and must stay with the
 * prover until the matching cells are opened.
 */
sudokuZKP::Commitment commit(const sudokuZKP::Permutation& permutation, CryptoPP::RandomNumberGenerator& rand, sudokuZKP::CommitmentNonces* nonces);

/* True iff `values` holds each of 1..9 exactly once */
template<typename T>
bool has_numbers_1_to_9(const T& values) {
  if(values.size()!=9) {
    return false;
  }
  uint32_t validation=0;
  for(uint32_t v:values) {
    if(v<1 || v>9) {
      return false;
    }
    validation|=(1u<<v);
  }
  return validation==0x3fe;
}

#endif //COMMITMENT_H
