#ifndef PROTOCOL_H
#define PROTOCOL_H
#include <kernel/yosys.h>
#include <string>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>
#include <google/protobuf/io/coded_stream.h>

#define MAGIC_CELL    0x5a4b5043454c4c53
#define MAGIC_MAPPING 0x5a4b504d41505047

#define DEFAULT_SECURITY_PARAM 5000

USING_YOSYS_NAMESPACE

class ProverAgent;
class VerifierAgent;

/*
 * Canonical byte encoding for commitment inputs. Every field is fixed width
 * or length prefixed, so two different inputs never produce the same bytes.
 */
class CodedStringWriter {
 private:
  std::string buf;
  google::protobuf::io::StringOutputStream sos;
 public:
  google::protobuf::io::CodedOutputStream cos;

 CodedStringWriter(uint64_t magic) : buf(), sos(&buf), cos(&sos) {
    cos.WriteLittleEndian64(magic);
  }

  template<typename T>
    void WriteSequence(const T& values) {
    cos.WriteLittleEndian64(values.size());
    for(uint64_t v:values) {
      cos.WriteLittleEndian64(v);
    }
  }

  void WriteBytes(const std::string& bytes) {
    cos.WriteRaw(bytes.data(), bytes.size());
  }

  const std::string& data() {
    cos.Trim();
    return buf;
  }
};

/* Soundness of R rounds expressed as a power of two: (27/28)^R = 2^-bits */
double soundness_bits(int rounds);

/*
 * Runs the verifier's security parameter worth of rounds between the two
 * agents and stops at the first round that does not verify.
 */
bool run_protocol(ProverAgent& prover, VerifierAgent& verifier);

#endif
