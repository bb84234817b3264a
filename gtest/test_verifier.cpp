#include <gtest/gtest.h>

#include <set>
#include <stdexcept>

#include "ChallengeCatalogue.h"
#include "Commitment.h"
#include "ScrambledSolution.h"
#include "Verifier.h"

class VerifierTest : public ::testing::Test {
protected:
    CryptoPP::AutoSeededRandomPool rng;
    ChallengeCatalogue catalogue;

    sudokuZKP::Permutation perm;
    sudokuZKP::CommitmentNonces nonces;
    sudokuZKP::Commitment comm;

    void NewRound(const Grid& solution) {
        perm = permute(solution, rng);
        comm = commit(perm, rng, &nonces);
    }

    void SetUp() {
        NewRound(sudoku_solution());
    }

    const sudokuZKP::Request& MappingRequest() {
        return catalogue.at(27);
    }
};

TEST_F(VerifierTest, HonestProverPassesEveryChallenge) {
    for (int round = 0; round < 100; round++) {
        NewRound(sudoku_solution());
        for (size_t i = 0; i < catalogue.size(); i++) {
            const sudokuZKP::Request& req = catalogue.at(i);
            sudokuZKP::Response rev = reveal(perm, nonces, req);
            ASSERT_TRUE(verify(req, rev, comm)) << "round " << round << " request " << i;
        }
    }
}

TEST_F(VerifierTest, RowZeroScenario) {
    const sudokuZKP::Request& req = catalogue.at(0);
    sudokuZKP::Response rev = reveal(perm, nonces, req);

    ASSERT_TRUE(rev.has_values());
    ASSERT_EQ(9, rev.values().values_size());
    ASSERT_EQ(9, rev.values().nonces_size());
    for (int i = 0; i < 9; i++) {
        EXPECT_EQ(perm.grid(i), rev.values().values(i));
        EXPECT_EQ(nonces.grid_nonces(i), rev.values().nonces(i));
    }
    EXPECT_TRUE(has_numbers_1_to_9(rev.values().values()));
    EXPECT_TRUE(verify(req, rev, comm));
}

TEST_F(VerifierTest, MappingReveal) {
    sudokuZKP::Response rev = reveal(perm, nonces, MappingRequest());

    ASSERT_TRUE(rev.has_mapping());
    EXPECT_EQ(nonces.mapping_nonce(), rev.mapping().nonce());
    ASSERT_EQ(9, rev.mapping().mapping_size());
    for (int i = 0; i < 9; i++) {
        EXPECT_EQ(perm.mapping(i), rev.mapping().mapping(i));
    }
    EXPECT_TRUE(verify(MappingRequest(), rev, comm));
}

TEST_F(VerifierTest, TagMismatchIsRejected) {
    const sudokuZKP::Request& row = catalogue.at(0);

    sudokuZKP::Response values = reveal(perm, nonces, row);
    sudokuZKP::Response mapping = reveal(perm, nonces, MappingRequest());

    EXPECT_FALSE(verify(MappingRequest(), values, comm));
    EXPECT_FALSE(verify(row, mapping, comm));

    sudokuZKP::Response empty;
    EXPECT_FALSE(verify(MappingRequest(), empty, comm));
    EXPECT_FALSE(verify(row, empty, comm));
}

TEST_F(VerifierTest, AlteredValueIsRejected) {
    for (size_t i = 0; i < 27; i++) {
        const sudokuZKP::Request& req = catalogue.at(i);
        sudokuZKP::Response rev = reveal(perm, nonces, req);
        // Swapping two values keeps 1..9 intact, only the hashes catch it
        uint32_t a = rev.values().values(0);
        rev.mutable_values()->set_values(0, rev.values().values(1));
        rev.mutable_values()->set_values(1, a);
        EXPECT_FALSE(verify(req, rev, comm)) << "request " << i;
    }
}

TEST_F(VerifierTest, AlteredNonceIsRejected) {
    const sudokuZKP::Request& req = catalogue.at(4);
    sudokuZKP::Response rev = reveal(perm, nonces, req);
    (*rev.mutable_values()->mutable_nonces(3))[0] ^= 0x80;
    EXPECT_FALSE(verify(req, rev, comm));

    sudokuZKP::Response mrev = reveal(perm, nonces, MappingRequest());
    (*mrev.mutable_mapping()->mutable_nonce())[5] ^= 0x01;
    EXPECT_FALSE(verify(MappingRequest(), mrev, comm));
}

TEST_F(VerifierTest, AlteredMappingIsRejected) {
    sudokuZKP::Response rev = reveal(perm, nonces, MappingRequest());
    uint32_t a = rev.mapping().mapping(0);
    rev.mutable_mapping()->set_mapping(0, rev.mapping().mapping(8));
    rev.mutable_mapping()->set_mapping(8, a);
    EXPECT_FALSE(verify(MappingRequest(), rev, comm));
}

TEST_F(VerifierTest, CommittedNonBijectionIsRejected) {
    perm.set_mapping(1, perm.mapping(0));
    comm = commit(perm, rng, &nonces);

    sudokuZKP::Response rev = reveal(perm, nonces, MappingRequest());
    EXPECT_FALSE(verify(MappingRequest(), rev, comm));
}

TEST_F(VerifierTest, CheatingProverIsCaught) {
    // Commit to 5 in cell 0, then open it as 6 with the original nonce
    perm.set_grid(0, 5);
    comm = commit(perm, rng, &nonces);
    perm.set_grid(0, 6);

    for (size_t i = 0; i < 27; i++) {
        const sudokuZKP::Request& req = catalogue.at(i);
        bool opens_cell0 = false;
        for (uint32_t idx : req.values().indices()) {
            opens_cell0 |= (idx == 0);
        }
        if (!opens_cell0) {
            continue;
        }
        sudokuZKP::Response rev = reveal(perm, nonces, req);
        EXPECT_FALSE(verify(req, rev, comm)) << "request " << i;
    }
}

TEST_F(VerifierTest, InvalidSolutionIsCaughtByItsRowColumnAndBox) {
    Grid tampered = sudoku_solution();
    tampered[2] = 7;
    NewRound(tampered);

    int rejected = 0;
    for (size_t i = 0; i < catalogue.size(); i++) {
        const sudokuZKP::Request& req = catalogue.at(i);
        if (!verify(req, reveal(perm, nonces, req), comm)) {
            rejected++;
        }
    }
    // Row 0, column 2 and box 0
    EXPECT_EQ(3, rejected);
}

TEST_F(VerifierTest, ShortRevealIsRejected) {
    const sudokuZKP::Request& req = catalogue.at(9);
    sudokuZKP::Response rev = reveal(perm, nonces, req);
    rev.mutable_values()->mutable_values()->RemoveLast();
    rev.mutable_values()->mutable_nonces()->RemoveLast();
    EXPECT_FALSE(verify(req, rev, comm));

    sudokuZKP::Response extra = reveal(perm, nonces, req);
    extra.mutable_values()->add_nonces(nonces.grid_nonces(80));
    EXPECT_FALSE(verify(req, extra, comm));
}

TEST_F(VerifierTest, UnopenedNoncesStayHidden) {
    for (size_t i = 0; i < catalogue.size(); i++) {
        const sudokuZKP::Request& req = catalogue.at(i);
        sudokuZKP::Response rev = reveal(perm, nonces, req);

        std::set<std::string> disclosed;
        if (rev.has_values()) {
            disclosed.insert(rev.values().nonces().begin(), rev.values().nonces().end());
        } else {
            disclosed.insert(rev.mapping().nonce());
        }

        std::set<uint32_t> opened;
        if (req.has_values()) {
            opened.insert(req.values().indices().begin(), req.values().indices().end());
        }
        for (int c = 0; c < GRID_CELLS; c++) {
            if (!opened.count(c)) {
                EXPECT_FALSE(disclosed.count(nonces.grid_nonces(c))) << "request " << i << " cell " << c;
            }
        }
        if (!req.has_mapping()) {
            EXPECT_FALSE(disclosed.count(nonces.mapping_nonce())) << "request " << i;
        }
    }
}

TEST_F(VerifierTest, OutOfRangeRequestIsContractViolation) {
    sudokuZKP::Request req;
    req.mutable_values()->add_indices(81);
    EXPECT_THROW(reveal(perm, nonces, req), std::out_of_range);

    sudokuZKP::Response rev;
    rev.mutable_values()->add_values(1);
    rev.mutable_values()->add_nonces(nonces.grid_nonces(0));
    EXPECT_THROW(verify(req, rev, comm), std::out_of_range);

    sudokuZKP::Request empty;
    EXPECT_THROW(verify(empty, rev, comm), std::runtime_error);
}
