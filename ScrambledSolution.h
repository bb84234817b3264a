#ifndef SCRAMBLED_SOLUTION_H
#define SCRAMBLED_SOLUTION_H

#include <cryptopp/osrng.h>

#include "messages.pb.h"

#include "Mapping.h"
#include "Puzzle.h"

sudokuZKP::Permutation permute(const Grid& solution, CryptoPP::RandomNumberGenerator& rand);

sudokuZKP::Response reveal(const sudokuZKP::Permutation& permutation, const sudokuZKP::CommitmentNonces& nonces, const sudokuZKP::Request& request);

struct ScrambledSolution {
  CryptoPP::AutoSeededRandomPool rand;

  Grid solution;

  /* The round in progress, if any */
  sudokuZKP::ProverSecret secret;

  ScrambledSolution(const Grid& solution);

  sudokuZKP::Commitment create_proof_round();

  sudokuZKP::Response reveal_round(const sudokuZKP::Request& request);

  bool round_in_progress() const { return secret.has_permutation(); }
};

#endif //SCRAMBLED_SOLUTION_H
