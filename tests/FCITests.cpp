#include <catch2/catch.hpp>
#include <cmath>
#include <Eigen/Dense>
#include <unsupported/Eigen/CXX11/Tensor>
#include "FCI.h"
#include "Solver.h"
#include "Functions.h"
#include "BEErrors.h"
#include "TestSystems.h"

TEST_CASE("String space of three electrons in five orbitals", "[fci]")
{
    StringSpace Space;
    Space.Init(5, 3);
    REQUIRE(Space.Dim == 10);
    REQUIRE(Space.Strings[0] == 7ULL); // 00111
    for (int I = 1; I < Space.Dim; I++) REQUIRE(Space.Strings[I - 1] < Space.Strings[I]);

    // a+_p a_p is the occupation of p.
    for (int p = 0; p < 5; p++)
    {
        const std::vector< Excitation > &Number = Space.Excitations[p * 5 + p];
        for (int e = 0; e < Number.size(); e++)
        {
            REQUIRE(Number[e].I == Number[e].J);
            REQUIRE(Number[e].Sign == 1);
        }
        REQUIRE(Number.size() == 6);
    }

    REQUIRE_THROWS_AS(Space.Init(4, 5), ConfigurationError);
    REQUIRE_THROWS_AS(Space.Init(64, 2), ConfigurationError);
}

TEST_CASE("FCI of the Hubbard dimer", "[fci]")
{
    double U = 4.0;
    MeanField MF = HubbardChainMeanField(2, U);
    EmbeddedHamiltonian Ham = WholeSystemHamiltonian(MF);
    FCI Solver;
    SolverResult Result = Solver.Solve(Ham);
    double Exact = 0.5 * (U - std::sqrt(U * U + 16.0));
    REQUIRE(Result.Converged);
    REQUIRE(Result.Energy == Approx(Exact));
    REQUIRE(Result.CorrelationEnergy == Approx(Exact - MF.EHF));
    REQUIRE(Result.OneRDM(0, 0) == Approx(1.0));
    REQUIRE(Result.OneRDM.trace() == Approx(2.0));
}

TEST_CASE("FCI without repulsion is the mean field", "[fci]")
{
    MeanField MF = HubbardChainMeanField(4, 0.0);
    EmbeddedHamiltonian Ham = WholeSystemHamiltonian(MF);
    FCI Solver;
    SolverResult Result = Solver.Solve(Ham);
    REQUIRE(Result.Energy == Approx(-2.0 * std::sqrt(5.0)));
    REQUIRE(Result.CorrelationEnergy == Approx(0.0).margin(1E-8));
    REQUIRE((Result.OneRDM - MF.DensityMatrix).norm() < 1E-6);
}

TEST_CASE("Davidson and direct diagonalization agree", "[fci]")
{
    MeanField MF = HubbardChainMeanField(6, 4.0);
    EmbeddedHamiltonian Ham = WholeSystemHamiltonian(MF);

    FCI Iterative;
    Iterative.DenseDim = 0;
    SolverResult Davidson = Iterative.Solve(Ham);
    REQUIRE(Davidson.Converged);
    REQUIRE(Davidson.Iterations > 0);

    FCI Direct;
    Direct.DenseDim = 1000;
    SolverResult Dense = Direct.Solve(Ham);
    REQUIRE(Dense.Converged);

    REQUIRE(Davidson.Energy == Approx(Dense.Energy).margin(1E-8));
    REQUIRE((Davidson.OneRDM - Dense.OneRDM).norm() < 1E-5);
    REQUIRE(Davidson.Energy < MF.EHF);
}

TEST_CASE("FCI densities are consistent with the energy", "[fci]")
{
    MeanField MF = HubbardChainMeanField(6, 2.0);
    EmbeddedHamiltonian Ham = WholeSystemHamiltonian(MF);
    Ham.PotentialTerm(0, 0) = 0.3;
    Ham.PotentialTerm(5, 5) = -0.2;
    FCI Solver;
    SolverResult Result = Solver.Solve(Ham);
    REQUIRE(Result.Converged);

    REQUIRE(Result.OneRDM.trace() == Approx(6.0));
    REQUIRE((Result.OneRDM - Result.OneRDM.transpose()).norm() < 1E-10);
    REQUIRE(EmbeddedEnergy(Ham, Result.OneRDM, Result.TwoRDM) == Approx(Result.Energy));

    // sum_r G_pqrr = (N - 1) D_pq
    for (int p = 0; p < 6; p++)
    {
        for (int q = 0; q < 6; q++)
        {
            double Partial = 0;
            for (int r = 0; r < 6; r++) Partial += Result.TwoRDM(p, q, r, r);
            REQUIRE(Partial == Approx(5.0 * Result.OneRDM(p, q)).margin(1E-8));
        }
    }
}

TEST_CASE("FCI needs a closed shell", "[fci]")
{
    MeanField MF = HubbardChainMeanField(2, 1.0);
    EmbeddedHamiltonian Ham = WholeSystemHamiltonian(MF);
    Ham.NumElectrons = 3;
    FCI Solver;
    REQUIRE_THROWS_AS(Solver.Solve(Ham), ConfigurationError);
}

TEST_CASE("Embedded HF returns the reference", "[fci]")
{
    MeanField MF = HubbardChainMeanField(4, 4.0);
    EmbeddedHamiltonian Ham = WholeSystemHamiltonian(MF);
    EmbeddedHF Solver;
    SolverResult Result = Solver.Solve(Ham);
    REQUIRE(Result.Converged);
    REQUIRE(Result.Energy == Approx(MF.EHF));
    REQUIRE(Result.CorrelationEnergy == 0.0);
    REQUIRE(Solver.Name() == "HF");
}

TEST_CASE("Davidson reports a residual above tolerance as unconverged", "[fci]")
{
    // The dimer's symmetric CI space is exhausted after three vectors, so a tolerance below
    // roundoff can never be met.
    double U = 2.0;
    MeanField Dimer = HubbardChainMeanField(2, U);
    FCI Tight;
    Tight.DenseDim = 0;
    Tight.Tolerance = 1E-18;
    SolverResult Stuck = Tight.Solve(WholeSystemHamiltonian(Dimer));
    REQUIRE_FALSE(Stuck.Converged);
    REQUIRE(Stuck.Energy == Approx(0.5 * (U - std::sqrt(U * U + 16.0))));

    FCI Short;
    Short.DenseDim = 0;
    Short.MaxIteration = 1;
    SolverResult Early = Short.Solve(WholeSystemHamiltonian(HubbardChainMeanField(6, 4.0)));
    REQUIRE_FALSE(Early.Converged);
}
