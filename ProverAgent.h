#ifndef PROVER_AGENT_H
#define PROVER_AGENT_H

#include "messages.pb.h"

#include "ScrambledSolution.h"


class ProverAgent {

 public:
  ProverAgent(const Grid& puzzle, const Grid& solution);

  void write_commitment_packet(std::string& out);
  void write_reveal(std::string& out, const std::string& request);

  int rounds_committed() const { return rounds; }

 private:
  ScrambledSolution solution;
  int rounds;
};

#endif
