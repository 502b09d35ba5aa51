#include <catch2/catch.hpp>
#include <algorithm>
#include <Eigen/Dense>
#include "Functions.h"
#include "MeanField.h"
#include "BondGraph.h"
#include "BEErrors.h"
#include "TestSystems.h"

TEST_CASE("Bath orbitals complete a closed embedding space", "[schmidt]")
{
    MeanField MF = HubbardChainMeanField(8, 2.0);
    REQUIRE(MF.Converged);
    Fragmenting Frag = HubbardChainFragments(8, PartitionStrategy::Chain, 1);

    for (int x = 0; x < Frag.Frags.size(); x++)
    {
        const Fragment &F = Frag.Frags[x];
        EmbeddingBasis Basis = SchmidtDecomposition(F, MF.DensityMatrix);
        int n = Basis.NumOrbitals();
        REQUIRE(Basis.NumFragmentOrbitals == 2);
        REQUIRE(Basis.NumBath == 2);
        REQUIRE(Basis.NumElectrons == 4);

        // Orthonormal columns, with unit vectors on the fragment sites first.
        REQUIRE((Basis.TA.transpose() * Basis.TA - Eigen::MatrixXd::Identity(n, n)).norm() < 1E-10);
        for (int j = 0; j < F.Sites.size(); j++) REQUIRE(Basis.TA(F.Sites[j], j) == 1.0);
        for (int k = 0; k < Basis.NumBath; k++)
        {
            for (int j = 0; j < F.Sites.size(); j++) REQUIRE(Basis.TA(F.Sites[j], Basis.NumFragmentOrbitals + k) == 0.0);
        }

        // The projected one particle density is still idempotent.
        Eigen::MatrixXd Gamma = 0.5 * Basis.TA.transpose() * MF.DensityMatrix * Basis.TA;
        REQUIRE((Gamma * Gamma - Gamma).norm() < 1E-8);
        REQUIRE(Basis.CoreDensity.trace() == Approx(8 - Basis.NumElectrons).margin(1E-8));

        // Near ties are ordered by site, so the values only decrease up to the tie window.
        for (int k = 1; k < Basis.NumBath; k++) REQUIRE(Basis.SingularValues[k - 1] >= Basis.SingularValues[k] - 1E-10 * std::max(1.0, Basis.SingularValues[0]));
    }
}

TEST_CASE("Dropping a coupled bath orbital leaves an open embedding space", "[schmidt]")
{
    MeanField MF = HubbardChainMeanField(6, 0.0);
    Fragmenting Frag = HubbardChainFragments(6, PartitionStrategy::Chain, 1);
    EmbeddingBasis All = SchmidtDecomposition(Frag.Frags[0], MF.DensityMatrix, 1E-8);
    REQUIRE(All.NumBath == 2);
    // Every singular value of gamma = D / 2 is at most 1/2.
    REQUIRE_THROWS_AS(SchmidtDecomposition(Frag.Frags[0], MF.DensityMatrix, 1.0), SubspaceError);
}

TEST_CASE("A nonorthogonal basis gives the same embedding as its Lowdin sites", "[schmidt]")
{
    MeanField MF = HubbardChainMeanField(6, 2.0);
    Fragmenting Frag = HubbardChainFragments(6, PartitionStrategy::Chain, 1);

    BondGraph Chain;
    Chain.InitChain(6);
    Eigen::MatrixXd S = Eigen::MatrixXd::Identity(6, 6) + 0.1 * Chain.AdjacencyMatrix.cast<double>();
    Eigen::MatrixXd SHalf, SMinusHalf;
    LowdinOrthogonalization(S, SHalf, SMinusHalf);
    REQUIRE((SHalf * SMinusHalf - Eigen::MatrixXd::Identity(6, 6)).norm() < 1E-10);
    Eigen::MatrixXd DensityAO = SMinusHalf * MF.DensityMatrix * SMinusHalf;

    for (int x = 0; x < Frag.Frags.size(); x++)
    {
        EmbeddingBasis FromLO = SchmidtDecomposition(Frag.Frags[x], MF.DensityMatrix);
        EmbeddingBasis FromAO = SchmidtDecomposition(Frag.Frags[x], DensityAO, S);
        REQUIRE(FromAO.NumBath == FromLO.NumBath);
        REQUIRE(FromAO.NumElectrons == FromLO.NumElectrons);
        Eigen::MatrixXd PLO = FromLO.TA * FromLO.TA.transpose();
        Eigen::MatrixXd PAO = FromAO.TA * FromAO.TA.transpose();
        REQUIRE((PLO - PAO).norm() < 1E-8);
    }
}

TEST_CASE("A fractional density cannot be embedded", "[schmidt]")
{
    Eigen::MatrixXd D = 0.5 * Eigen::MatrixXd::Identity(4, 4);
    Fragment Frag = WholeSystemFragment(1);
    Frag.Id = 3;
    bool Thrown = false;
    try
    {
        SchmidtDecomposition(Frag, D);
    }
    catch (const SubspaceError &Error)
    {
        Thrown = true;
        REQUIRE(Error.FragmentId == 3);
    }
    REQUIRE(Thrown);
}

TEST_CASE("A singular overlap is rejected", "[schmidt]")
{
    Eigen::MatrixXd S = Eigen::MatrixXd::Ones(2, 2);
    Eigen::MatrixXd SHalf, SMinusHalf;
    REQUIRE_THROWS_AS(LowdinOrthogonalization(S, SHalf, SMinusHalf), ConfigurationError);
}

TEST_CASE("Rebuilding an embedding gives the same basis", "[schmidt]")
{
    MeanField MF = HubbardChainMeanField(8, 2.0, 1.0, 6);
    Fragmenting Frag = HubbardChainFragments(8, PartitionStrategy::Autogen, 1);
    for (int x = 0; x < Frag.Frags.size(); x++)
    {
        EmbeddingBasis First = SchmidtDecomposition(Frag.Frags[x], MF.DensityMatrix);
        EmbeddingBasis Second = SchmidtDecomposition(Frag.Frags[x], MF.DensityMatrix);
        REQUIRE(First.NumBath == Second.NumBath);
        REQUIRE((First.TA - Second.TA).norm() == 0.0);
        // Sign convention: the largest component of every bath orbital is positive.
        for (int k = First.NumFragmentOrbitals; k < First.NumOrbitals(); k++)
        {
            int Largest;
            First.TA.col(k).cwiseAbs().maxCoeff(&Largest);
            REQUIRE(First.TA(Largest, k) > 0);
        }
    }
}
