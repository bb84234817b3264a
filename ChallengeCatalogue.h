#ifndef CHALLENGE_CATALOGUE_H
#define CHALLENGE_CATALOGUE_H

#include <vector>
#include <cryptopp/cryptlib.h>

#include "messages.pb.h"

/*
 * Every request a verifier may send: the 9 rows, 9 columns and 9 boxes of the
 * grid followed by the mapping. Depends on the grid geometry only.
 */
class ChallengeCatalogue {

 public:
  ChallengeCatalogue();

  size_t size() const { return requests.size(); }
  const sudokuZKP::Request& at(size_t i) const { return requests.at(i); }

  const sudokuZKP::Request& next_challenge(CryptoPP::RandomNumberGenerator& rand) const;

 private:
  std::vector<sudokuZKP::Request> requests;
};

#endif //CHALLENGE_CATALOGUE_H
