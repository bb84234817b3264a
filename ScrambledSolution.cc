#include "ScrambledSolution.h"
#include "Commitment.h"

#include <stdexcept>
#include <kernel/yosys.h>

USING_YOSYS_NAMESPACE
using namespace CryptoPP;

sudokuZKP::Permutation permute(const Grid& solution, RandomNumberGenerator& rand) {
  sudokuZKP::Permutation result;

  Mapping mapping;
  mapping.shuffle(rand);
  mapping.serialize(result.mutable_mapping());

  for(uint32_t v:mapping.apply(solution)) {
    result.add_grid(v);
  }
  return result;
}

sudokuZKP::Response reveal(const sudokuZKP::Permutation& permutation, const sudokuZKP::CommitmentNonces& nonces, const sudokuZKP::Request& request) {
  sudokuZKP::Response result;

  switch(request.kind_case()) {
  case sudokuZKP::Request::kMapping: {
    sudokuZKP::MappingReveal* rev=result.mutable_mapping();
    *rev->mutable_mapping()=permutation.mapping();
    rev->set_nonce(nonces.mapping_nonce());
    return result;
  }
  case sudokuZKP::Request::kValues: {
    sudokuZKP::ValuesReveal* rev=result.mutable_values();
    for(uint32_t idx:request.values().indices()) {
      if(idx>=(unsigned)permutation.grid_size() || idx>=(unsigned)nonces.grid_nonces_size()) {
	throw std::out_of_range(stringf("Request names cell %u outside the grid\n", idx));
      }
      rev->add_values(permutation.grid(idx));
      rev->add_nonces(nonces.grid_nonces(idx));
    }
    return result;
  }
  case sudokuZKP::Request::KIND_NOT_SET:
    break;
  }
  throw std::runtime_error("Asked to reveal for an empty request\n");
}

ScrambledSolution::ScrambledSolution(const Grid& s): rand(), solution(s) {
  Grid_check(solution, false);
}

sudokuZKP::Commitment ScrambledSolution::create_proof_round() {
  secret.Clear();
  *secret.mutable_permutation()=permute(solution, rand);
  return commit(secret.permutation(), rand, secret.mutable_nonces());
}

sudokuZKP::Response ScrambledSolution::reveal_round(const sudokuZKP::Request& request) {
  if(!round_in_progress()) {
    throw std::runtime_error("Attempted to reveal without a committed round\n");
  }
  sudokuZKP::Response result=reveal(secret.permutation(), secret.nonces(), request);
  /*
   * Each round may be opened once. Answering a second request against the same
   * commitment would let a verifier combine openings.
   */
  secret.Clear();
  return result;
}
