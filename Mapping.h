#ifndef MAPPING_H
#define MAPPING_H

#include <cryptopp/cryptlib.h>

#include "messages.pb.h"

#include "Puzzle.h"

/* Relabelling of the values 1..9 */
struct Mapping {
  std::vector<uint32_t> image;

  Mapping();

  void shuffle(CryptoPP::RandomNumberGenerator& rand);
  uint32_t apply(uint32_t value) const;
  Grid apply(const Grid& g) const;

  void serialize(google::protobuf::RepeatedField<uint32_t>* out) const;
};

#endif //MAPPING_H
