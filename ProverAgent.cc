#include "ProverAgent.h"

#include <stdexcept>

#include "messages.pb.h"

ProverAgent::ProverAgent(const Grid& puzzle, const Grid& s) : solution(s), rounds(0) {
  Grid_check_agrees(puzzle, s);
}

void ProverAgent::write_commitment_packet(std::string& out) {
  sudokuZKP::Commitment result=solution.create_proof_round();
  rounds++;
  if(!result.SerializeToString(&out)) {
    throw std::runtime_error("Could not serialize commitment packet\n");
  }
}

void ProverAgent::write_reveal(std::string& out, const std::string& request) {
  sudokuZKP::Request req;
  if(!req.ParseFromString(request)) {
    throw std::runtime_error("Could not parse reveal request\n");
  }

  sudokuZKP::Response reveal=solution.reveal_round(req);
  if(!reveal.SerializeToString(&out)) {
    throw std::runtime_error("Could not serialize reveal\n");
  }
}
