#ifndef VERIFIER_H
#define VERIFIER_H

#include "messages.pb.h"

/*
 * Checks one opened response against the published commitment.
 *
 * A values request is accepted when every opened cell matches its hash and the
 * opened values are exactly 1..9. A mapping request is accepted when the mapping
 * matches its hash and is a bijection of 1..9. A response of the other kind is
 * always rejected.
 *
 * Throws std::out_of_range if the request itself names a cell outside the grid.
 */
bool verify(const sudokuZKP::Request& request, const sudokuZKP::Response& response, const sudokuZKP::Commitment& commitment);

#endif //VERIFIER_H
