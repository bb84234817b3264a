#include "Commitment.h"
#include "Protocol.h"

#include <cryptopp/sha.h>

using namespace CryptoPP;

static std::string digest(CodedStringWriter& w) {
  const std::string& serialized=w.data();
  std::string buf(SHA256::DIGESTSIZE,0);
  SHA256().CalculateDigest((CryptoPP::byte*)buf.data(),(const CryptoPP::byte*)serialized.data(),serialized.length());
  return buf;
}

std::string Nonce_generate(RandomNumberGenerator& rand) {
  std::string nonce(NONCE_SIZE,0);
  rand.GenerateBlock((CryptoPP::byte*)nonce.data(),NONCE_SIZE);
  return nonce;
}

std::string Cell_get_commitment(uint32_t value, const std::string& nonce) {
  CodedStringWriter w(MAGIC_CELL);
  w.cos.WriteLittleEndian64(value);
  w.cos.WriteLittleEndian64(nonce.size());
  w.WriteBytes(nonce);
  return digest(w);
}

std::string Mapping_get_commitment(const google::protobuf::RepeatedField<uint32_t>& mapping, const std::string& nonce) {
  CodedStringWriter w(MAGIC_MAPPING);
  w.WriteSequence(mapping);
  w.cos.WriteLittleEndian64(nonce.size());
  w.WriteBytes(nonce);
  return digest(w);
}

sudokuZKP::Commitment commit(const sudokuZKP::Permutation& permutation, RandomNumberGenerator& rand, sudokuZKP::CommitmentNonces* nonces) {
  sudokuZKP::Commitment result;
  nonces->Clear();

  for(uint32_t value:permutation.grid()) {
    std::string nonce=Nonce_generate(rand);
    result.add_grid_hashes(Cell_get_commitment(value, nonce));
    nonces->add_grid_nonces(nonce);
  }

  std::string nonce=Nonce_generate(rand);
  result.set_mapping_hash(Mapping_get_commitment(permutation.mapping(), nonce));
  nonces->set_mapping_nonce(nonce);

  return result;
}
