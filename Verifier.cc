#include "Verifier.h"
#include "Commitment.h"
#include "Puzzle.h"

#include <stdexcept>
#include <kernel/yosys.h>

USING_YOSYS_NAMESPACE

static bool verify_mapping(const sudokuZKP::Response& response, const sudokuZKP::Commitment& commitment) {
  if(response.kind_case()!=sudokuZKP::Response::kMapping) {
    log_warning("Mapping was requested but the reveal opened grid cells\n");
    return false;
  }
  const sudokuZKP::MappingReveal& rev=response.mapping();

  if(Mapping_get_commitment(rev.mapping(), rev.nonce())!=commitment.mapping_hash()) {
    log_warning("Revealed mapping does not match its commitment\n");
    return false;
  }
  if(!has_numbers_1_to_9(rev.mapping())) {
    log_warning("Revealed mapping is not a permutation of 1..9\n");
    return false;
  }
  return true;
}

static bool verify_values(const sudokuZKP::IndexSequence& request, const sudokuZKP::Response& response, const sudokuZKP::Commitment& commitment) {
  for(uint32_t idx:request.indices()) {
    if(idx>=GRID_CELLS) {
      throw std::out_of_range(stringf("Request names cell %u outside the grid\n", idx));
    }
  }

  if(response.kind_case()!=sudokuZKP::Response::kValues) {
    log_warning("Grid cells were requested but the reveal opened something else\n");
    return false;
  }
  const sudokuZKP::ValuesReveal& rev=response.values();

  if(rev.values_size()!=request.indices_size() || rev.nonces_size()!=request.indices_size()) {
    log_warning("Reveal opened %d values and %d nonces for %d requested cells\n",
		rev.values_size(), rev.nonces_size(), request.indices_size());
    return false;
  }

  for(int i=0; i<request.indices_size(); i++) {
    int idx=request.indices(i);
    if(idx>=commitment.grid_hashes_size() ||
       Cell_get_commitment(rev.values(i), rev.nonces(i))!=commitment.grid_hashes(idx)) {
      log_warning("Revealed value for cell %d does not match its commitment\n", idx);
      return false;
    }
  }

  if(!has_numbers_1_to_9(rev.values())) {
    log_warning("Revealed cells break the rules of sudoku\n");
    return false;
  }
  return true;
}

bool verify(const sudokuZKP::Request& request, const sudokuZKP::Response& response, const sudokuZKP::Commitment& commitment) {
  switch(request.kind_case()) {
  case sudokuZKP::Request::kMapping:
    return verify_mapping(response, commitment);
  case sudokuZKP::Request::kValues:
    return verify_values(request.values(), response, commitment);
  case sudokuZKP::Request::KIND_NOT_SET:
    break;
  }
  throw std::runtime_error("Verifying against an empty request\n");
}
