#include "ChallengeCatalogue.h"

#include "Puzzle.h"

ChallengeCatalogue::ChallengeCatalogue() {
  //Rows
  for(int y=0; y<GRID_SIDE; y++) {
    sudokuZKP::IndexSequence* seq=requests.emplace(requests.end())->mutable_values();
    for(int x=0; x<GRID_SIDE; x++) {
      seq->add_indices(y*GRID_SIDE+x);
    }
  }

  //Columns
  for(int x=0; x<GRID_SIDE; x++) {
    sudokuZKP::IndexSequence* seq=requests.emplace(requests.end())->mutable_values();
    for(int y=0; y<GRID_SIDE; y++) {
      seq->add_indices(y*GRID_SIDE+x);
    }
  }

  //Boxes
  for(int bx=0; bx<GRID_SIDE/BOX_SIDE; bx++) {
    for(int by=0; by<GRID_SIDE/BOX_SIDE; by++) {
      sudokuZKP::IndexSequence* seq=requests.emplace(requests.end())->mutable_values();
      for(int x=bx*BOX_SIDE; x<(bx+1)*BOX_SIDE; x++) {
	for(int y=by*BOX_SIDE; y<(by+1)*BOX_SIDE; y++) {
	  seq->add_indices(y*GRID_SIDE+x);
	}
      }
    }
  }

  requests.emplace(requests.end())->mutable_mapping();
}

const sudokuZKP::Request& ChallengeCatalogue::next_challenge(CryptoPP::RandomNumberGenerator& rand) const {
  CryptoPP::word32 i=rand.GenerateWord32(0, requests.size()-1);
  return requests[i];
}
