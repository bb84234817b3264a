#include "Protocol.h"

#include "ProverAgent.h"
#include "VerifierAgent.h"
#include "Puzzle.h"

USING_YOSYS_NAMESPACE

/*
 * A solution that agrees with every fixed cell of the puzzle but is not a
 * sudoku: cell (0,2) repeats the 7 already in its row, column and box.
 */
static Grid tampered_solution() {
  Grid g=sudoku_solution();
  g[2]=7;
  return g;
}

static void usage(const char* argv0) {
  printf("Usage:\n");
  printf("%s prove [rounds]\n",argv0);
  printf("%s cheat [rounds]\n",argv0);
}

int main(int argc, char** argv)
{
  string action=argc>1?argv[1]:"prove";
  if(argc > 3 || (action!="prove" && action!="cheat")) {
    usage(argv[0]);
    return 0;
  }

  Yosys::log_streams.push_back(&std::cout);
  Yosys::log_error_stderr = true;

  Yosys::yosys_setup();

  int security_param=DEFAULT_SECURITY_PARAM;
  if(argc==3) {
    security_param=atoi(argv[2]);
    if(security_param<=0) {
      log_error("Invalid number of rounds %s\n",argv[2]);
    }
  }

  Grid solution=action=="cheat"?tampered_solution():sudoku_solution();

  ProverAgent prover(sudoku_puzzle(), solution);
  VerifierAgent verifier;
  verifier.set_security_param(security_param);

  bool proven=run_protocol(prover, verifier);

  int status;
  if(proven) {
    log("SUCCESS: Proven over %d rounds with soundness error 2^-%.1f\n",verifier.confidence(),soundness_bits(verifier.confidence()));
    status=action=="prove"?0:1;
  } else {
    log("FAILURE: Proof rejected after %d accepted rounds\n",verifier.confidence());
    status=action=="prove"?1:0;
  }

  Yosys::yosys_shutdown();
  return status;
}
