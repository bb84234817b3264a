#include "Mapping.h"

#include <stdexcept>

Mapping::Mapping() {
  for(uint32_t v=1; v<=GRID_SIDE; v++) {
    image.push_back(v);
  }
}

void Mapping::shuffle(CryptoPP::RandomNumberGenerator& rand) {
  rand.Shuffle(image.begin(), image.end());
}

uint32_t Mapping::apply(uint32_t value) const {
  if(value<1 || value>image.size()) {
    throw std::out_of_range("Mapping applied to value outside 1..9\n");
  }
  return image[value-1];
}

Grid Mapping::apply(const Grid& g) const {
  Grid result;
  result.reserve(g.size());
  for(uint32_t v:g) {
    result.push_back(apply(v));
  }
  return result;
}

void Mapping::serialize(google::protobuf::RepeatedField<uint32_t>* out) const {
  out->Clear();
  for(uint32_t v:image) {
    out->Add(v);
  }
}
